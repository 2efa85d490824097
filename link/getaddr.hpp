#pragma once

#include "inc/common.hpp"
#include <string>

std::string ip2str(ip_t ip);

/**
 * @brief Parse a dotted-quad address.
 * @return 0 on success, -1 if str is not an IPv4 address.
 */
int str2ip(const char *str, ip_t &ip);
