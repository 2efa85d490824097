#include <arpa/inet.h>
#include <netinet/in.h>
#include <string>
#include "getaddr.hpp"

std::string ip2str(ip_t ip) {
    char ret[INET_ADDRSTRLEN];
    struct in_addr addr;
    addr.s_addr = ip;
    if(inet_ntop(AF_INET, &addr, ret, sizeof(ret)) == NULL) return "?";
    return ret;
}

int str2ip(const char *str, ip_t &ip) {
    struct in_addr addr;
    if(inet_aton(str, &addr) == 0) return -1;
    ip = addr.s_addr;
    return 0;
}
