#pragma once

/**
 * @file service.hpp
 * @brief The whole stack behind listen/accept/write: TUN device, IP and TCP
 * stages wired together.
 */

#include <memory>
#include <optional>
#include "config.hpp"
#include "tcp.hpp"

class NetDevice;
class IpPacketManager;

class TcpService {
public:
    explicit TcpService(const StackConfig &config = StackConfig());
    ~TcpService();

    TcpService(const TcpService &) = delete;
    TcpService &operator = (const TcpService &) = delete;

    /**
     * @brief Open the TUN device named in the config and start every stage.
     * @return 0 on success, -1 on error.
     */
    int listen();

    /**
     * @brief Start every stage on an already opened device.
     * @return 0 on success, -1 on error.
     */
    int start(std::shared_ptr<NetDevice> device);

    std::optional<Connection> accept();

    // send data with PSH/ACK.
    int write(Connection &conn, const void *buf, std::size_t len);

    /**
     * @brief Stop the stages from the device up. Idempotent.
     */
    void shutdown();

    TcpPacketManager &tcp() { return *tcp_manager; }

private:
    StackConfig config;
    bool is_started;
    std::shared_ptr<NetDevice> device;
    std::shared_ptr<IpPacketManager> ip_manager;
    std::shared_ptr<TcpPacketManager> tcp_manager;
};
