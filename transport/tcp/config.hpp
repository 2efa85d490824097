#pragma once

#include <cstddef>
#include <string>
#include "inc/common.hpp"

// NOTIMPLEMENTED: retransmission, keepalive and time wait timers.
// a segment lost on the way stalls its connection until the peer retransmits.
// NOTIMPLEMENTED: expiry of idle connections. a stray segment for an unseen
// port pair leaves a LISTEN entry behind; only CLOSED entries are swept.

#define TCP_HEADER_LENGTH 20  // no options

// we never shrink the window, and never buffer more than one segment anyway.
#define TCP_WINDOW_SIZE 65535

#define TCP_DEFAULT_DEVICE "tun0"

/*
 * How connections are told apart.
 * CONN_KEY_PORTS ignores both addresses: one peer at a time per port pair.
 * CONN_KEY_FOUR_TUPLE also compares the peer and local IPv4 addresses.
 */
enum conn_key_mode {
    CONN_KEY_PORTS = 0,
    CONN_KEY_FOUR_TUPLE
};

struct StackConfig {
    std::string device = TCP_DEFAULT_DEVICE;
    std::size_t queue_capacity = QUEUE_CAPACITY;
    conn_key_mode key_mode = CONN_KEY_PORTS;
    bool validate_ip_checksum = true;
    std::string trace_file;   // empty: no packet trace
};
