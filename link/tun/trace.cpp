#include <cstdio>
#include <sys/time.h>
#include "trace.hpp"

std::unique_ptr<PacketTrace> PacketTrace::open(const char *path) {
    pcap_t *fp = pcap_open_dead(DLT_RAW, SNAPLEN);
    if(fp == NULL) {
        fprintf(stderr, "[Link Error] pcap_open_dead failed.\n");
        return nullptr;
    }
    pcap_dumper_t *dumper = pcap_dump_open(fp, path);
    if(dumper == NULL) {
        fprintf(stderr, "[Link Error] cannot open trace '%s': %s\n", path, pcap_geterr(fp));
        pcap_close(fp);
        return nullptr;
    }
    fprintf(stderr, "Tracing packets to '%s'.\n", path);
    return std::unique_ptr<PacketTrace>(new PacketTrace(fp, dumper));
}

PacketTrace::PacketTrace(pcap_t *fp, pcap_dumper_t *dumper) : fp(fp), dumper(dumper) {}

PacketTrace::~PacketTrace() {
    pcap_dump_close(dumper);
    pcap_close(fp);
}

void PacketTrace::record(const Packet &packet) {
    struct pcap_pkthdr header;
    gettimeofday(&header.ts, NULL);
    header.len = (bpf_u_int32)packet.data.size();
    header.caplen = header.len < SNAPLEN ? header.len : SNAPLEN;
    std::scoped_lock lock(mutex);
    pcap_dump((u_char *)dumper, &header, packet.data.data());
    if(pcap_dump_flush(dumper) != 0) {
        fprintf(stderr, "[Link Error] failed to flush packet trace.\n");
    }
}
