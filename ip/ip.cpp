#include <cstdio>
#include <cstring>
#include "link/getaddr.hpp"
#include "link/tun/device.hpp"
#include "checksum.hpp"
#include "ip.hpp"

IpHeader IpHeader::make(ip_t src, ip_t dest, uint16_t payload_len) {
    IpHeader h;
    h.version = IP_VERSION;
    h.ihl = IP_HEADER_LENGTH / 4;
    h.tos = 0;
    h.total_length = IP_HEADER_LENGTH + payload_len;
    h.id = 0;
    h.flags = IP_FLAG_DF;
    h.fragment_offset = 0;
    h.ttl = IP_DEFAULT_TTL;
    h.protocol = IP_PROTO_TCP;
    h.checksum = 0;
    h.src = src;
    h.dest = dest;
    return h;
}

int IpHeader::fromBytes(const uint8_t *buf, std::size_t len, IpHeader &ret) {
    if(len < IP_HEADER_LENGTH) return -1;
    ret.version = buf[0] >> 4;
    ret.ihl = buf[0] & 0xF;
    ret.tos = buf[1];
    ret.total_length = readBE16(buf + 2);
    ret.id = readBE16(buf + 4);
    ret.flags = buf[6] >> 5;
    ret.fragment_offset = readBE16(buf + 6) & 0x1FFF;
    ret.ttl = buf[8];
    ret.protocol = buf[9];
    ret.checksum = readBE16(buf + 10);
    memcpy(&ret.src, buf + 12, 4);
    memcpy(&ret.dest, buf + 16, 4);
    return 0;
}

std::vector<uint8_t> IpHeader::toBytes() const {
    std::vector<uint8_t> bytes(IP_HEADER_LENGTH);
    uint8_t *buf = bytes.data();
    buf[0] = (uint8_t)(version << 4 | (ihl & 0xF));
    buf[1] = tos;
    writeBE16(buf + 2, total_length);
    writeBE16(buf + 4, id);
    writeBE16(buf + 6, (uint16_t)((flags & 0x7) << 13 | (fragment_offset & 0x1FFF)));
    buf[8] = ttl;
    buf[9] = protocol;
    writeBE16(buf + 10, 0);
    memcpy(buf + 12, &src, 4);
    memcpy(buf + 16, &dest, 4);
    writeBE16(buf + 10, internetChecksum(buf, IP_HEADER_LENGTH));
    return bytes;
}

bool operator == (const IpHeader &a, const IpHeader &b) {
    return a.version == b.version && a.ihl == b.ihl && a.tos == b.tos
        && a.total_length == b.total_length && a.id == b.id
        && a.flags == b.flags && a.fragment_offset == b.fragment_offset
        && a.ttl == b.ttl && a.protocol == b.protocol && a.checksum == b.checksum
        && a.src == b.src && a.dest == b.dest;
}

bool verifyIPHeaderChecksum(const uint8_t *buf, uint8_t ihl) {
    return internetChecksum(buf, 4u * ihl) == 0;
}

IpPacketManager::IpPacketManager(std::size_t capacity, bool validate_checksum)
    : validate_checksum(validate_checksum), incoming(capacity), outgoing(capacity) {}

IpPacketManager::~IpPacketManager() {
    shutdown();
}

int IpPacketManager::manageQueue(std::shared_ptr<NetDevice> new_device) {
    if(device || incoming.closed()) {
        fprintf(stderr, "[IP Error] manageQueue: already started or shut down.\n");
        return -1;
    }
    device = std::move(new_device);
    thread_reader = std::thread(&IpPacketManager::readerWorker, this);
    thread_writer = std::thread(&IpPacketManager::writerWorker, this);
    return 0;
}

std::optional<IpPacket> IpPacketManager::read() {
    return incoming.pop();
}

bool IpPacketManager::write(IpPacket packet) {
    return outgoing.push(std::move(packet));
}

void IpPacketManager::shutdown() {
    incoming.close();
    outgoing.close();
    if(thread_reader.joinable()) thread_reader.join();
    if(thread_writer.joinable()) thread_writer.join();
}

int IpPacketManager::parsePacket(Packet &packet, IpHeader &header) {
    int len = (int)packet.data.size();
    if(IpHeader::fromBytes(packet.data.data(), len, header) < 0) {
        fprintf(stderr, "[IP Error] received IP packet with bad packet len=%d\n", len);
        return -2;
    }
    if(header.version != IP_VERSION) {
        fprintf(stderr, "[IP Error] cannot work with IPv%u\n", (uint32_t)header.version);
        return -1;
    }
    if(header.ihl < 5 || (int)header.headerLength() > len) {
        fprintf(stderr, "[IP Error] bad header length ihl=%u, len=%d\n",
                (uint32_t)header.ihl, len);
        return -1;
    }
    if(header.total_length < header.headerLength() || header.total_length > len) {
        fprintf(stderr, "[IP Error] bad total length %u, len=%d\n",
                (uint32_t)header.total_length, len);
        return -1;
    }
    if(validate_checksum && !verifyIPHeaderChecksum(packet.data.data(), header.ihl)) {
        fprintf(stderr, "[IP Error] received a IP packet with bad header checksum. %s -> %s\n",
                ip2str(header.src).c_str(), ip2str(header.dest).c_str());
        return -1;
    }
    packet.data.resize(header.total_length);
    return 0;
}

// a frame that cannot even hold an IP header means the device is not
// delivering whole frames; this thread gives up and closes its queue.
void IpPacketManager::readerWorker() {
    while(std::optional<Packet> packet = device->read()) {
        IpHeader header;
        int ret = parsePacket(*packet, header);
        if(ret == -2) {
            fprintf(stderr, "[IP Error] malformed frame, IP reader aborted.\n");
            break;
        }
        if(ret < 0) continue;
        if(!incoming.push(IpPacket{header, std::move(*packet)})) break;
    }
    incoming.close();
    fprintf(stderr, "IP reader stopped.\n");
}

void IpPacketManager::writerWorker() {
    while(std::optional<IpPacket> ip_packet = outgoing.pop()) {
        if(!device->write(std::move(ip_packet->packet))) break;
    }
    outgoing.close();
    fprintf(stderr, "IP writer stopped.\n");
}
