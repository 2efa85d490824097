#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

typedef uint32_t ip_t;     // network byte order, as stored on the wire

/*
 * One frame body as delivered by the TUN device (IP header first).
 * Moved, never copied, from one queue to the next.
 */
struct Packet {
    std::vector<uint8_t> data;
};

#define QUEUE_CAPACITY 10     // every stage queue. small on purpose: producers block.
#define TUN_BUFFER_SIZE 2048  // max bytes read from the device per frame
#define SNAPLEN 65535         // trace snapshot length

#define IP_PROTO_TCP 6

#ifndef TH_FIN
#define	TH_FIN	0x01
#define	TH_SYN	0x02
#define	TH_RST	0x04
#define	TH_PUSH	0x08
#define	TH_ACK	0x10
#define	TH_URG	0x20
#define	TH_ECE	0x40
#define	TH_CWR	0x80
#endif

// big-endian field access
inline uint16_t readBE16(const uint8_t *p) {
    return (uint16_t)(p[0] << 8 | p[1]);
}

inline uint32_t readBE32(const uint8_t *p) {
    return (uint32_t)p[0] << 24 | (uint32_t)p[1] << 16 | (uint32_t)p[2] << 8 | p[3];
}

inline void writeBE16(uint8_t *p, uint16_t v) {
    p[0] = v >> 8 & 0xFF;
    p[1] = v & 0xFF;
}

inline void writeBE32(uint8_t *p, uint32_t v) {
    p[0] = v >> 24 & 0xFF;
    p[1] = v >> 16 & 0xFF;
    p[2] = v >> 8 & 0xFF;
    p[3] = v & 0xFF;
}
