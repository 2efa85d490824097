#pragma once

/**
 * @file tcp.hpp
 * @brief Passive-open TCP on top of IpPacketManager.
 */

#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include "config.hpp"
#include "tcp_internal.hpp"

class IpPacketManager;

class TcpPacketManager {
public:
    explicit TcpPacketManager(const StackConfig &config = StackConfig());
    ~TcpPacketManager();

    TcpPacketManager(const TcpPacketManager &) = delete;
    TcpPacketManager &operator = (const TcpPacketManager &) = delete;

    /**
     * @brief Launch the inbound (IP -> TCP parse) and outbound (TCP -> IP)
     * threads.
     * @return 0 on success, -1 if already started or shut down.
     */
    int manageQueue(std::shared_ptr<IpPacketManager> ip);

    /**
     * @brief Launch the thread running the state machine on inbound segments.
     * @return 0 on success, -1 if already listening or shut down.
     */
    int listen();

    /**
     * @brief Wait for a connection to deliver data.
     * Returns a snapshot every time a PSH segment arrives on an established
     * connection, with that segment's payload in `data`.
     * @return empty once the stack is shut down.
     */
    std::optional<Connection> accept();

    // like accept(), but gives up after timeout.
    std::optional<Connection> acceptFor(std::chrono::milliseconds timeout);

    /**
     * @brief Send one segment of application data.
     * @param flags usually TH_PUSH | TH_ACK.
     * @return 0 on success, -1 on error.
     */
    int write(Connection &conn, uint8_t flags, const void *buf, std::size_t len);

    /**
     * @brief Stop all three threads and close every queue. Idempotent.
     */
    void shutdown();

    ConnectionManager &connections() { return connection_manager; }

private:
    void inboundWorker();
    void outboundWorker();
    void listenWorker();

    // 0 to deliver, -1 to drop.
    int parseSegment(IpPacket &ip_packet, TcpSegment &seg);

    std::shared_ptr<IpPacketManager> ip;
    ConnectionManager connection_manager;
    messagequeue<TcpSegment> incoming, outgoing;
    std::thread thread_inbound, thread_outbound, thread_listen;
};
