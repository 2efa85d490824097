#pragma once

/**
 * @file tcp_header.hpp
 * @brief TCP header codec and checksum with the IPv4 pseudo-header.
 */

#include <string>
#include <vector>
#include "inc/common.hpp"
#include "ip/ip.hpp"
#include "config.hpp"

//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |          Source Port          |       Destination Port        |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                        Sequence Number                        |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                    Acknowledgment Number                      |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |  Data |       |C|E|U|A|P|R|S|F|                               |
// | Offset| Rsrvd |W|C|R|C|S|S|Y|I|            Window             |
// |       |       |R|E|G|K|H|T|N|N|                               |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |           Checksum            |         Urgent Pointer        |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+

struct TcpHeader {
    uint16_t src_port;
    uint16_t dst_port;
    uint32_t seq;
    uint32_t ack;
    uint8_t  data_offset;  // in 32-bit words
    uint8_t  reserved;     // low 4 bits of byte 12
    uint8_t  flags;
    uint16_t window_size;
    uint16_t checksum;
    uint16_t urgent_p;

    static TcpHeader make(uint16_t src_port, uint16_t dst_port,
                          uint32_t seq, uint32_t ack, uint8_t flags);

    /**
     * @return 0 on success, -1 if len is below 20.
     */
    static int fromBytes(const uint8_t *buf, std::size_t len, TcpHeader &ret);

    /**
     * @brief Serialize the 20-byte header. The checksum written at [16..18]
     * is computed over the pseudo-header of `iphdr`, the header and payload;
     * the `checksum` field itself is ignored.
     */
    std::vector<uint8_t> toBytes(const IpHeader &iphdr,
                                 const uint8_t *payload, std::size_t len) const;

    std::size_t headerLength() const { return 4u * data_offset; }
};

bool operator == (const TcpHeader &a, const TcpHeader &b);

/**
 * @brief Checksum of a TCP segment (header and payload, `seglen` bytes)
 * sent from src to dest. The bytes at the checksum field are summed as they
 * are: zero them to compute a checksum, leave them to verify one (0 = valid).
 */
uint16_t computeTCPChecksum(ip_t src, ip_t dest, const uint8_t *segment, std::size_t seglen);

/*
 * A TCP segment travelling between the TCP threads: both parsed headers and
 * the whole IP packet they came from or were serialized into.
 */
struct TcpSegment {
    IpHeader ip;
    TcpHeader tcp;
    Packet packet;

    std::size_t payloadOffset() const { return ip.headerLength() + tcp.headerLength(); }
    std::size_t payloadLength() const {
        return packet.data.size() > payloadOffset() ? packet.data.size() - payloadOffset() : 0;
    }
    const uint8_t *payload() const { return packet.data.data() + payloadOffset(); }
};

/**
 * @brief Build the complete IP packet for a segment.
 */
TcpSegment buildTCPSegment(ip_t src, ip_t dest, const TcpHeader &tcphdr,
                           const uint8_t *payload, std::size_t len);

std::string tcpFlagsString(uint8_t flags);

std::string debugSegmentSummary(const TcpSegment &seg);
