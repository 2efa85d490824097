#pragma once

/**
 * @file checksum.hpp
 * @brief The Internet checksum (RFC 1071), shared by the IP and TCP codecs.
 */

#include <cstddef>
#include <cstdint>

/**
 * @brief Add the big-endian 16-bit words of buf to a running sum.
 * An odd trailing byte is added as the high byte of a word, which is the
 * same as padding the buffer with one zero byte.
 * Only the last buffer of a sum may have odd length.
 */
uint32_t checksumAccumulate(uint32_t sum, const void *buf, std::size_t len);

/**
 * @brief Fold the carries of a running sum and take the one's complement.
 */
uint16_t checksumFinish(uint32_t sum);

/**
 * @brief Checksum of one buffer.
 * Writing the result into the buffer's checksum field and checksumming again
 * yields 0.
 */
uint16_t internetChecksum(const void *buf, std::size_t len);
