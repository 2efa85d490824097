#include <cstdio>
#include "ip/ip.hpp"
#include "tcp.hpp"

int TcpPacketManager::listen() {
    if(thread_listen.joinable() || incoming.closed()) {
        fprintf(stderr, "[TCP Error] listen: already listening or shut down.\n");
        return -1;
    }
    thread_listen = std::thread(&TcpPacketManager::listenWorker, this);
    return 0;
}

void TcpPacketManager::listenWorker() {
    /*
     * Main event loop. Every inbound segment of every connection goes through
     * here, one at a time, so a connection sees its segments in wire order.
     */
    while(std::optional<TcpSegment> seg = incoming.pop()) {
        connection_manager.onSegment(*seg, outgoing);
    }
    connection_manager.close();   // wake accept()
    fprintf(stderr, "TCP listen worker stopped.\n");
}

std::optional<Connection> TcpPacketManager::accept() {
    return connection_manager.accept();
}

std::optional<Connection> TcpPacketManager::acceptFor(std::chrono::milliseconds timeout) {
    return connection_manager.acceptFor(timeout);
}

int TcpPacketManager::write(Connection &conn, uint8_t flags, const void *buf, std::size_t len) {
    return connection_manager.write(conn, flags, (const uint8_t *)buf, len, outgoing);
}

void TcpPacketManager::shutdown() {
    incoming.close();
    outgoing.close();
    connection_manager.close();
    if(thread_inbound.joinable()) thread_inbound.join();
    if(thread_outbound.joinable()) thread_outbound.join();
    if(thread_listen.joinable()) thread_listen.join();
}
