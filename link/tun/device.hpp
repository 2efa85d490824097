#pragma once

/**
 * @file device.hpp
 * @brief Bridges a TUN device to a pair of bounded packet queues.
 */

#include <memory>
#include <optional>
#include <thread>
#include "inc/common.hpp"
#include "inc/messagequeue.hpp"

class PacketTrace;

/**
 * @brief Open /dev/net/tun and attach it to the point-to-point interface `name`
 * (IFF_TUN, no packet information prefix).
 *
 * @param name Interface name, at most IFNAMSIZ - 1 bytes.
 * @return The device file descriptor on success, -1 on error.
 */
int openTunDevice(const char *name);

class NetDevice {
public:
    /**
     * @brief Adopt a file descriptor that reads and writes whole frames.
     * The descriptor is closed when the device is destroyed.
     */
    explicit NetDevice(int fd, std::size_t capacity = QUEUE_CAPACITY);
    ~NetDevice();

    NetDevice(const NetDevice &) = delete;
    NetDevice &operator = (const NetDevice &) = delete;

    /**
     * @brief Record every frame crossing the device. Call before bind().
     */
    void setTrace(std::shared_ptr<PacketTrace> trace);

    /**
     * @brief Launch the reader and writer threads.
     * @return 0 on success, -1 if already bound or shut down.
     */
    int bind();

    /**
     * @brief Take the next frame read from the device.
     * @return empty once the device is shut down or the reader failed.
     */
    std::optional<Packet> read();

    /**
     * @brief Queue a frame for the device, blocking while the queue is full.
     * @return false if the device is shut down.
     */
    bool write(Packet packet);

    /**
     * @brief Stop both threads and close both queues. Idempotent.
     */
    void shutdown();

private:
    void readerWorker();
    void writerWorker();

    int fd;
    int wake_fd;   // eventfd, signalled on shutdown to break poll()
    bool is_bound;
    std::shared_ptr<PacketTrace> trace;
    messagequeue<Packet> incoming, outgoing;
    std::thread thread_reader, thread_writer;
};
