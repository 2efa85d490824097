#include <cstdio>
#include "ip/ip.hpp"
#include "link/getaddr.hpp"
#include "tcp.hpp"

// responsible for connecting our tcp implementation to the network layer

TcpPacketManager::TcpPacketManager(const StackConfig &config)
    : connection_manager(config.key_mode, config.queue_capacity),
      incoming(config.queue_capacity), outgoing(config.queue_capacity) {}

TcpPacketManager::~TcpPacketManager() {
    shutdown();
}

int TcpPacketManager::manageQueue(std::shared_ptr<IpPacketManager> new_ip) {
    if(ip || incoming.closed()) {
        fprintf(stderr, "[TCP Error] manageQueue: already started or shut down.\n");
        return -1;
    }
    ip = std::move(new_ip);
    thread_inbound = std::thread(&TcpPacketManager::inboundWorker, this);
    thread_outbound = std::thread(&TcpPacketManager::outboundWorker, this);
    return 0;
}

int TcpPacketManager::parseSegment(IpPacket &ip_packet, TcpSegment &seg) {
    const IpHeader &iphdr = ip_packet.header;
    if(iphdr.protocol != IP_PROTO_TCP) {
        fprintf(stderr, "[TCP Error] Not TCP packet: IP proto %d\n", iphdr.protocol);
        return -1;
    }
    const std::vector<uint8_t> &data = ip_packet.packet.data;
    std::size_t offset = iphdr.headerLength();
    if(TcpHeader::fromBytes(data.data() + offset, data.size() - offset, seg.tcp) < 0) {
        fprintf(stderr, "[TCP Error] drop segment: too short (%zu bytes) from %s\n",
                data.size() - offset, ip2str(iphdr.src).c_str());
        return -1;
    }
    if(seg.tcp.data_offset < TCP_HEADER_LENGTH / 4 || offset + seg.tcp.headerLength() > data.size()) {
        fprintf(stderr, "[TCP Error] drop segment: bad data offset %u from %s\n",
                (uint32_t)seg.tcp.data_offset, ip2str(iphdr.src).c_str());
        return -1;
    }
    seg.ip = iphdr;
    seg.packet = std::move(ip_packet.packet);

    // summing the received checksum along with the segment gives 0 when intact.
    if(computeTCPChecksum(iphdr.src, iphdr.dest, seg.packet.data.data() + offset,
                          seg.packet.data.size() - offset) != 0) {
        fprintf(stderr, "[TCP Error] drop segment: bad tcp checksum. %s\n",
                debugSegmentSummary(seg).c_str());
        return -1;
    }
    return 0;
}

void TcpPacketManager::inboundWorker() {
    while(std::optional<IpPacket> ip_packet = ip->read()) {
        TcpSegment seg;
        if(parseSegment(*ip_packet, seg) < 0) continue;
        if(!incoming.push(std::move(seg))) break;
    }
    incoming.close();
    fprintf(stderr, "TCP inbound worker stopped.\n");
}

void TcpPacketManager::outboundWorker() {
    while(std::optional<TcpSegment> seg = outgoing.pop()) {
        if(!ip->write(IpPacket{seg->ip, std::move(seg->packet)})) break;
    }
    outgoing.close();
    fprintf(stderr, "TCP outbound worker stopped.\n");
}
