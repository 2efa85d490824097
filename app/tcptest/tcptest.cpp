#include <cstdio>
#include <cstring>
#include <string>
#include <unistd.h>
#include "link/getaddr.hpp"
#include "transport/tcp/service.hpp"

// Echo server: every payload received is sent back on the same connection.

int main(int argc, char **argv) {
    StackConfig config;
    int opt;
    while((opt = getopt(argc, argv, "d:t:4")) != -1) {
        switch(opt) {
        case 'd': config.device = optarg; break;
        case 't': config.trace_file = optarg; break;
        case '4': config.key_mode = CONN_KEY_FOUR_TUPLE; break;
        default:
            fprintf(stderr, "Usage: %s [-d device] [-t trace.pcap] [-4]\n"
                    "  -4  tell connections apart by addresses as well as ports\n",
                    argv[0]);
            return -1;
        }
    }

    TcpService service(config);
    if(service.listen() < 0) {
        fprintf(stderr, "[App Error] cannot start the stack on '%s'\n", config.device.c_str());
        return -1;
    }
    while(std::optional<Connection> conn = service.accept()) {
        printf("%s:%u sent %d bytes\n", ip2str(conn->src_ip).c_str(),
               (uint32_t)conn->src_port, (int)conn->data.size());
        if(service.write(*conn, conn->data.data(), conn->data.size()) < 0) {
            fprintf(stderr, "[App Error] echo to port %u failed\n", (uint32_t)conn->src_port);
        }
    }
    return 0;
}
