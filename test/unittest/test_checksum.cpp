// test/unittest/test_checksum.cpp
// Unit tests for the Internet checksum

#include <cstdlib>
#include <vector>
#include "ip/checksum.hpp"
#include "test_helpers.hpp"

void test_rfc1071_example() {
    TEST("RFC 1071 example words")
        uint8_t data[] = {0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7};
        // one's complement sum is 0xddf2
        ASSERT(internetChecksum(data, sizeof(data)) == 0x220d, "checksum should be ~0xddf2");
    END_TEST
}

void test_known_ip_header() {
    TEST("Known IPv4 header checksum")
        uint8_t header[20] = {
            0x45, 0x00, 0x00, 0x73, 0x00, 0x00, 0x40, 0x00,
            0x40, 0x11, 0x00, 0x00,
            0xc0, 0xa8, 0x00, 0x01,
            0xc0, 0xa8, 0x00, 0xc7
        };
        ASSERT(internetChecksum(header, sizeof(header)) == 0xb861, "checksum should be 0xb861");
    END_TEST
}

void test_self_verifying() {
    TEST("Checksum written back verifies to zero")
        srand(1);
        for (int round = 0; round < 200; ++round) {
            std::vector<uint8_t> buf(2 * (6 + rand() % 200));
            for (uint8_t &b: buf) b = rand() & 0xFF;
            buf[10] = buf[11] = 0;
            uint16_t sum = internetChecksum(buf.data(), buf.size());
            writeBE16(buf.data() + 10, sum);
            ASSERT(internetChecksum(buf.data(), buf.size()) == 0, "buffer with its checksum must sum to 0xFFFF");
            // the folded sum itself is all ones
            uint32_t folded = checksumAccumulate(0, buf.data(), buf.size());
            while (folded > 0xFFFF) folded = (folded & 0xFFFF) + (folded >> 16);
            ASSERT(folded == 0xFFFF, "folded sum should be 0xFFFF");
        }
    END_TEST
}

void test_odd_length() {
    TEST("Odd length is summed as if zero padded")
        uint8_t odd[] = {0x12, 0x34, 0x56};
        uint8_t padded[] = {0x12, 0x34, 0x56, 0x00};
        ASSERT(internetChecksum(odd, sizeof(odd)) == internetChecksum(padded, sizeof(padded)),
               "odd buffer must match padded buffer");
    END_TEST
}

void test_zero_and_long_buffers() {
    TEST("All-zero and long buffers")
        uint8_t zeros[20] = {0};
        ASSERT(internetChecksum(zeros, sizeof(zeros)) == 0xFFFF, "zeros checksum to 0xFFFF");

        // 35000 words of 0xFFFF overflow a naive 16-bit accumulator many times over
        std::vector<uint8_t> ones(70000, 0xFF);
        ASSERT(internetChecksum(ones.data(), ones.size()) == 0, "ones checksum to 0");
    END_TEST
}

void test_accumulate_split() {
    TEST("Accumulating in pieces matches one pass")
        uint8_t data[] = {0x45, 0x00, 0x00, 0x3c, 0x1c, 0x46, 0x40, 0x00, 0x40, 0x06, 0xb1};
        uint32_t sum = checksumAccumulate(0, data, 4);
        sum = checksumAccumulate(sum, data + 4, sizeof(data) - 4);
        ASSERT(checksumFinish(sum) == internetChecksum(data, sizeof(data)), "split sum differs");
    END_TEST
}

int main() {
    test_rfc1071_example();
    test_known_ip_header();
    test_self_verifying();
    test_odd_length();
    test_zero_and_long_buffers();
    test_accumulate_split();
    return summarize("Checksum");
}
