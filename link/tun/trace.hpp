#pragma once

/**
 * @file trace.hpp
 * @brief Records the frames crossing a device into a pcap savefile.
 */

#include <memory>
#include <mutex>
#include <pcap.h>
#include "inc/common.hpp"

class PacketTrace {
public:
    /**
     * @brief Create (truncate) a savefile with link type DLT_RAW, since a TUN
     * device carries bare IP packets.
     * @return nullptr on error.
     */
    static std::unique_ptr<PacketTrace> open(const char *path);

    ~PacketTrace();

    PacketTrace(const PacketTrace &) = delete;
    PacketTrace &operator = (const PacketTrace &) = delete;

    // thread-safe: the device reader and writer share one trace.
    void record(const Packet &packet);

private:
    PacketTrace(pcap_t *fp, pcap_dumper_t *dumper);

    std::mutex mutex;
    pcap_t *fp;
    pcap_dumper_t *dumper;
};
