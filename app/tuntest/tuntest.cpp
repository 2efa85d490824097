#include <cstdio>
#include <memory>
#include <string>
#include "link/getaddr.hpp"
#include "link/tun/device.hpp"
#include "ip/ip.hpp"
#include "transport/tcp/tcp.hpp"

// Dump what arrives at one layer of the stack.
//   nic: raw frames, ip: parsed IP headers, tcp: connections delivering data

static void dumpNic(std::shared_ptr<NetDevice> nic) {
    while(std::optional<Packet> packet = nic->read()) {
        printf("Frame: len = %d\n", (int)packet->data.size());
        for(uint8_t c: packet->data) printf("%02x ", c);
        putchar('\n');
    }
}

static void dumpIp(std::shared_ptr<IpPacketManager> ip) {
    while(std::optional<IpPacket> ip_packet = ip->read()) {
        const IpHeader &h = ip_packet->header;
        printf("IP: %s -> %s proto=%u ttl=%u id=%u total_length=%u\n",
               ip2str(h.src).c_str(), ip2str(h.dest).c_str(),
               (uint32_t)h.protocol, (uint32_t)h.ttl, (uint32_t)h.id,
               (uint32_t)h.total_length);
    }
}

static void dumpTcp(TcpPacketManager &tcp) {
    while(std::optional<Connection> conn = tcp.accept()) {
        printf("TCP connection: %s:%u -> %s:%u status=%s seq=%u ack=%u len=%d\n",
               ip2str(conn->src_ip).c_str(), (uint32_t)conn->src_port,
               ip2str(conn->dst_ip).c_str(), (uint32_t)conn->dst_port,
               tcpStatusString(conn->status), conn->next_seq_num, conn->next_ack_num,
               (int)conn->data.size());
    }
}

int main(int argc, char **argv) {
    if(argc < 2 || argc > 3 ||
       (argv[1] != std::string("nic") && argv[1] != std::string("ip") &&
        argv[1] != std::string("tcp"))) {
        fprintf(stderr, "Usage: %s [nic/ip/tcp] [device, default " TCP_DEFAULT_DEVICE "]\n", argv[0]);
        return -1;
    }
    const char *name = argc == 3 ? argv[2] : TCP_DEFAULT_DEVICE;
    int fd = openTunDevice(name);
    if(fd < 0) return -1;

    std::shared_ptr<NetDevice> nic = std::make_shared<NetDevice>(fd);
    if(nic->bind() < 0) return -1;
    if(argv[1] == std::string("nic")) {
        dumpNic(nic);
        return 0;
    }

    std::shared_ptr<IpPacketManager> ip = std::make_shared<IpPacketManager>();
    if(ip->manageQueue(nic) < 0) return -1;
    if(argv[1] == std::string("ip")) {
        dumpIp(ip);
        return 0;
    }

    TcpPacketManager tcp;
    if(tcp.manageQueue(ip) < 0 || tcp.listen() < 0) return -1;
    dumpTcp(tcp);
    return 0;
}
