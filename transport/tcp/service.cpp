#include <cstdio>
#include "ip/ip.hpp"
#include "link/tun/device.hpp"
#include "link/tun/trace.hpp"
#include "service.hpp"

TcpService::TcpService(const StackConfig &config)
    : config(config), is_started(false),
      ip_manager(std::make_shared<IpPacketManager>(config.queue_capacity,
                                                   config.validate_ip_checksum)),
      tcp_manager(std::make_shared<TcpPacketManager>(config)) {}

TcpService::~TcpService() {
    shutdown();
}

int TcpService::listen() {
    int fd = openTunDevice(config.device.c_str());
    if(fd < 0) return -1;
    return start(std::make_shared<NetDevice>(fd, config.queue_capacity));
}

int TcpService::start(std::shared_ptr<NetDevice> new_device) {
    if(is_started) {
        fprintf(stderr, "[TCP Error] service already started.\n");
        return -1;
    }
    is_started = true;
    device = std::move(new_device);

    if(!config.trace_file.empty()) {
        std::shared_ptr<PacketTrace> trace = PacketTrace::open(config.trace_file.c_str());
        if(!trace) return -1;
        device->setTrace(trace);
    }
    if(device->bind() < 0) return -1;
    if(ip_manager->manageQueue(device) < 0) return -1;
    if(tcp_manager->manageQueue(ip_manager) < 0) return -1;
    if(tcp_manager->listen() < 0) return -1;
    fprintf(stderr, "TCP service started.\n");
    return 0;
}

std::optional<Connection> TcpService::accept() {
    return tcp_manager->accept();
}

int TcpService::write(Connection &conn, const void *buf, std::size_t len) {
    return tcp_manager->write(conn, TH_PUSH | TH_ACK, buf, len);
}

// each stage closes its own queues before joining, so threads blocked on
// the stage below are already released when the next one is joined.
void TcpService::shutdown() {
    if(device) device->shutdown();
    ip_manager->shutdown();
    tcp_manager->shutdown();
}
