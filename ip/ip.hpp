#pragma once

/**
 * @file ip.hpp
 * @brief IPv4 header codec, and the stage moving IP packets between the
 * device and the transport layer.
 */

#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include "inc/common.hpp"
#include "inc/messagequeue.hpp"

class NetDevice;

#define IP_VERSION 4
#define IP_HEADER_LENGTH 20   // no options
#define IP_DEFAULT_TTL 64
#define IP_FLAG_DF 0x2        // in the 3-bit flags field

//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |Version|  IHL  |Type of Service|          Total Length         |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |         Identification        |Flags|      Fragment Offset    |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |  Time to Live |    Protocol   |         Header Checksum       |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                       Source Address                          |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                    Destination Address                        |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+

struct IpHeader {
    uint8_t  version;
    uint8_t  ihl;           // in 32-bit words
    uint8_t  tos;
    uint16_t total_length;
    uint16_t id;
    uint8_t  flags;         // 3 bits
    uint16_t fragment_offset;  // 13 bits
    uint8_t  ttl;
    uint8_t  protocol;
    uint16_t checksum;
    ip_t     src;
    ip_t     dest;

    /**
     * @brief Header for an outgoing TCP packet carrying `payload_len` bytes.
     */
    static IpHeader make(ip_t src, ip_t dest, uint16_t payload_len);

    /**
     * @brief Parse the leading 20 bytes of buf. Options, if any, are skipped
     * by callers through `ihl`; no field is validated here.
     * @return 0 on success, -1 if len is below 20.
     */
    static int fromBytes(const uint8_t *buf, std::size_t len, IpHeader &ret);

    /**
     * @brief Serialize to 20 bytes, recomputing the checksum.
     * The `checksum` field itself is ignored.
     */
    std::vector<uint8_t> toBytes() const;

    std::size_t headerLength() const { return 4u * ihl; }
};

bool operator == (const IpHeader &a, const IpHeader &b);

/**
 * @brief Checks the header checksum of the `ihl` words at buf.
 * buf must hold at least that many bytes.
 */
bool verifyIPHeaderChecksum(const uint8_t *buf, uint8_t ihl);

struct IpPacket {
    IpHeader header;
    Packet packet;   // the whole IP packet, header included
};

class IpPacketManager {
public:
    explicit IpPacketManager(std::size_t capacity = QUEUE_CAPACITY,
                             bool validate_checksum = true);
    ~IpPacketManager();

    IpPacketManager(const IpPacketManager &) = delete;
    IpPacketManager &operator = (const IpPacketManager &) = delete;

    /**
     * @brief Launch the reader (device -> IP) and writer (IP -> device) threads.
     * @return 0 on success, -1 if already started or shut down.
     */
    int manageQueue(std::shared_ptr<NetDevice> device);

    /**
     * @brief Take the next parsed inbound packet.
     * @return empty once the stage is shut down.
     */
    std::optional<IpPacket> read();

    /**
     * @brief Queue a packet for the device.
     * @return false if the stage is shut down.
     */
    bool write(IpPacket packet);

    void shutdown();

private:
    void readerWorker();
    void writerWorker();

    // 0 to deliver, -1 to drop, -2 for a frame that cannot be parsed at all.
    int parsePacket(Packet &packet, IpHeader &header);

    bool validate_checksum;
    std::shared_ptr<NetDevice> device;
    messagequeue<IpPacket> incoming, outgoing;
    std::thread thread_reader, thread_writer;
};
