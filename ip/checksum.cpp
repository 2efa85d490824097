#include "checksum.hpp"

// as RFC 1071 states, the one's complement sum is independent of byte order
// as long as both sides agree; we sum big-endian words so the result can be
// written back with writeBE16.
uint32_t checksumAccumulate(uint32_t sum, const void *buf, std::size_t len) {
    const uint8_t *p = (const uint8_t *)buf;
    for(; len > 1; p += 2, len -= 2) {
        sum += (uint32_t)(p[0] << 8 | p[1]);
        // keep room in the accumulator for long buffers
        if(sum & 0x80000000u) sum = (sum & 0xFFFF) + (sum >> 16);
    }
    if(len == 1) sum += (uint32_t)p[0] << 8;
    return sum;
}

uint16_t checksumFinish(uint32_t sum) {
    while(sum > 0xFFFF) sum = (sum & 0xFFFF) + (sum >> 16);
    return (uint16_t)(0xFFFF - sum);
}

uint16_t internetChecksum(const void *buf, std::size_t len) {
    return checksumFinish(checksumAccumulate(0, buf, len));
}
