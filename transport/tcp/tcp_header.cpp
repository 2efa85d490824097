#include <cstring>
#include "ip/checksum.hpp"
#include "link/getaddr.hpp"
#include "tcp_header.hpp"

TcpHeader TcpHeader::make(uint16_t src_port, uint16_t dst_port,
                          uint32_t seq, uint32_t ack, uint8_t flags) {
    TcpHeader h;
    h.src_port = src_port;
    h.dst_port = dst_port;
    h.seq = seq;
    h.ack = ack;
    h.data_offset = TCP_HEADER_LENGTH / 4;
    h.reserved = 0;
    h.flags = flags;
    h.window_size = TCP_WINDOW_SIZE;
    h.checksum = 0;
    h.urgent_p = 0;
    return h;
}

int TcpHeader::fromBytes(const uint8_t *buf, std::size_t len, TcpHeader &ret) {
    if(len < TCP_HEADER_LENGTH) return -1;
    ret.src_port = readBE16(buf);
    ret.dst_port = readBE16(buf + 2);
    ret.seq = readBE32(buf + 4);
    ret.ack = readBE32(buf + 8);
    ret.data_offset = buf[12] >> 4;
    ret.reserved = buf[12] & 0xF;
    ret.flags = buf[13];
    ret.window_size = readBE16(buf + 14);
    ret.checksum = readBE16(buf + 16);
    ret.urgent_p = readBE16(buf + 18);
    return 0;
}

std::vector<uint8_t> TcpHeader::toBytes(const IpHeader &iphdr,
                                        const uint8_t *payload, std::size_t len) const {
    std::vector<uint8_t> bytes(TCP_HEADER_LENGTH + len);
    uint8_t *buf = bytes.data();
    writeBE16(buf, src_port);
    writeBE16(buf + 2, dst_port);
    writeBE32(buf + 4, seq);
    writeBE32(buf + 8, ack);
    buf[12] = (uint8_t)(data_offset << 4 | (reserved & 0xF));
    buf[13] = flags;
    writeBE16(buf + 14, window_size);
    writeBE16(buf + 16, 0);
    writeBE16(buf + 18, urgent_p);
    if(len) memcpy(buf + TCP_HEADER_LENGTH, payload, len);
    writeBE16(buf + 16, computeTCPChecksum(iphdr.src, iphdr.dest, buf, bytes.size()));
    bytes.resize(TCP_HEADER_LENGTH);
    return bytes;
}

bool operator == (const TcpHeader &a, const TcpHeader &b) {
    return a.src_port == b.src_port && a.dst_port == b.dst_port
        && a.seq == b.seq && a.ack == b.ack
        && a.data_offset == b.data_offset && a.reserved == b.reserved
        && a.flags == b.flags && a.window_size == b.window_size
        && a.checksum == b.checksum && a.urgent_p == b.urgent_p;
}

uint16_t computeTCPChecksum(ip_t src, ip_t dest, const uint8_t *segment, std::size_t seglen) {
    uint8_t pseudo[12];
    memcpy(pseudo, &src, 4);
    memcpy(pseudo + 4, &dest, 4);
    pseudo[8] = 0;
    pseudo[9] = IP_PROTO_TCP;
    writeBE16(pseudo + 10, (uint16_t)seglen);
    uint32_t sum = checksumAccumulate(0, pseudo, sizeof(pseudo));
    sum = checksumAccumulate(sum, segment, seglen);
    return checksumFinish(sum);
}

TcpSegment buildTCPSegment(ip_t src, ip_t dest, const TcpHeader &tcphdr,
                           const uint8_t *payload, std::size_t len) {
    TcpSegment seg;
    seg.ip = IpHeader::make(src, dest, (uint16_t)(TCP_HEADER_LENGTH + len));
    seg.tcp = tcphdr;
    std::vector<uint8_t> ipbytes = seg.ip.toBytes();
    std::vector<uint8_t> tcpbytes = tcphdr.toBytes(seg.ip, payload, len);
    seg.ip.checksum = readBE16(ipbytes.data() + 10);
    seg.tcp.checksum = readBE16(tcpbytes.data() + 16);

    std::vector<uint8_t> &data = seg.packet.data;
    data.reserve(ipbytes.size() + tcpbytes.size() + len);
    data.insert(data.end(), ipbytes.begin(), ipbytes.end());
    data.insert(data.end(), tcpbytes.begin(), tcpbytes.end());
    if(len) data.insert(data.end(), payload, payload + len);
    return seg;
}

std::string tcpFlagsString(uint8_t flags) {
    std::string ret;
#define TEST_FLAG(name) if(flags & TH_##name) ret += ret.empty() ? #name : " " #name
    TEST_FLAG(FIN);
    TEST_FLAG(SYN);
    TEST_FLAG(RST);
    TEST_FLAG(PUSH);
    TEST_FLAG(ACK);
    TEST_FLAG(URG);
    TEST_FLAG(ECE);
    TEST_FLAG(CWR);
#undef TEST_FLAG
    return ret;
}

std::string debugSegmentSummary(const TcpSegment &seg) {
    std::string src = ip2str(seg.ip.src) + ":" + std::to_string(seg.tcp.src_port);
    std::string dest = ip2str(seg.ip.dest) + ":" + std::to_string(seg.tcp.dst_port);
    std::string flags = tcpFlagsString(seg.tcp.flags);
    return "SEG: " + src + " -> " + dest + (flags.empty() ? "" : " " + flags)
        + " seq=" + std::to_string(seg.tcp.seq) + " ack=" + std::to_string(seg.tcp.ack)
        + " len=" + std::to_string(seg.payloadLength());
}
