// test/unittest/test_connection_manager.cpp
// Scripted peer exchanges against the connection table

#include <chrono>
#include <thread>
#include "transport/tcp/tcp_internal.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;

#define PEER "10.0.0.2"
#define LOCAL "10.0.0.1"
#define PEER_PORT 12345
#define LOCAL_PORT 80

static TcpSegment fromPeer(uint32_t seq, uint32_t ack, uint8_t flags,
                           const std::string &payload = "") {
    return makeSegment(PEER, PEER_PORT, LOCAL, LOCAL_PORT, seq, ack, flags, payload);
}

static TcpSegment nextReply(messagequeue<TcpSegment> &out) {
    std::optional<TcpSegment> seg = out.pop_for(100ms);
    if (!seg) throw std::runtime_error("expected a reply segment");
    return std::move(*seg);
}

static tcp_status statusOf(ConnectionManager &cm) {
    std::optional<Connection> conn = cm.find(ipOf(PEER), PEER_PORT, ipOf(LOCAL), LOCAL_PORT);
    if (!conn) throw std::runtime_error("connection missing");
    return conn->status;
}

// reply must travel from us back to the peer.
static void checkAddressing(const TcpSegment &reply) {
    ASSERT(reply.ip.src == ipOf(LOCAL) && reply.ip.dest == ipOf(PEER), "reply addresses");
    ASSERT(reply.tcp.src_port == LOCAL_PORT && reply.tcp.dst_port == PEER_PORT, "reply ports");
}

void test_full_exchange() {
    TEST("Handshake, data in both directions, passive close")
        ConnectionManager cm;
        messagequeue<TcpSegment> out(64);

        // SYN
        ASSERT(cm.onSegment(fromPeer(1000, 0, TH_SYN), out) == 0, "SYN handled");
        TcpSegment synack = nextReply(out);
        checkAddressing(synack);
        ASSERT(synack.tcp.flags == (TH_SYN | TH_ACK), "SYN/ACK flags");
        ASSERT(synack.tcp.seq == 0 && synack.tcp.ack == 1001, "SYN/ACK numbers");
        ASSERT(statusOf(cm) == STATUS_SYN_RCVD, "SYN_RCVD");

        // ACK completes the handshake, nothing sent, nothing accepted
        ASSERT(cm.onSegment(fromPeer(1001, 1, TH_ACK), out) == 0, "ACK handled");
        ASSERT(out.size() == 0, "no reply to ACK");
        ASSERT(statusOf(cm) == STATUS_ESTAB, "ESTAB");
        ASSERT(cm.pendingAccepts() == 0, "nothing accepted yet");

        // request
        std::string request = "GET / HTTP/1.1\r\n\r\n";
        ASSERT(request.size() == 18, "request size");
        ASSERT(cm.onSegment(fromPeer(1001, 1, TH_PUSH | TH_ACK, request), out) == 0, "PSH handled");
        TcpSegment ack = nextReply(out);
        checkAddressing(ack);
        ASSERT(ack.tcp.flags == TH_ACK, "ACK flags");
        ASSERT(ack.tcp.seq == 1 && ack.tcp.ack == 1019, "ACK numbers");
        ASSERT(ack.payloadLength() == 0, "bare ACK");

        std::optional<Connection> conn = cm.acceptFor(100ms);
        ASSERT(conn, "connection accepted");
        ASSERT(conn->src_port == PEER_PORT && conn->dst_port == LOCAL_PORT, "accepted ports");
        ASSERT(conn->status == STATUS_ESTAB, "accepted status");
        ASSERT(std::string(conn->data.begin(), conn->data.end()) == request, "accepted data");

        // response
        std::string response = "HTTP/1.1 200 OK\r\n\r\n";
        ASSERT(response.size() == 19, "response size");
        ASSERT(cm.write(*conn, TH_PUSH | TH_ACK, (const uint8_t *)response.data(),
                        response.size(), out) == 0, "write");
        TcpSegment data = nextReply(out);
        checkAddressing(data);
        ASSERT(data.tcp.flags == (TH_PUSH | TH_ACK), "data flags");
        ASSERT(data.tcp.seq == 1 && data.tcp.ack == 1019, "data numbers");
        ASSERT(payloadOf(data) == response, "data payload");
        ASSERT(conn->next_seq_num == 20, "caller snapshot advanced");

        ASSERT(cm.write(*conn, TH_PUSH | TH_ACK, (const uint8_t *)"x", 1, out) == 0, "second write");
        TcpSegment more = nextReply(out);
        ASSERT(more.tcp.seq == 20 && payloadOf(more) == "x", "second write numbers");
        ASSERT(conn->next_seq_num == 21, "snapshot advanced again");

        // peer closes
        ASSERT(cm.onSegment(fromPeer(1019, 21, TH_FIN | TH_ACK), out) == 0, "FIN handled");
        TcpSegment fin_ack = nextReply(out);
        ASSERT(fin_ack.tcp.flags == TH_ACK, "ACK first");
        ASSERT(fin_ack.tcp.seq == 21 && fin_ack.tcp.ack == 1019, "ACK of FIN numbers");
        TcpSegment our_fin = nextReply(out);
        ASSERT(our_fin.tcp.flags == (TH_FIN | TH_ACK), "then FIN/ACK");
        ASSERT(our_fin.tcp.seq == 21 && our_fin.tcp.ack == 1020, "FIN/ACK numbers");
        ASSERT(statusOf(cm) == STATUS_LAST_ACK, "LAST_ACK");

        ASSERT(cm.onSegment(fromPeer(1020, 22, TH_ACK), out) == 0, "last ACK handled");
        ASSERT(out.size() == 0, "no reply to last ACK");
        ASSERT(statusOf(cm) == STATUS_CLOSED, "CLOSED, still in the table");
        ASSERT(cm.size() == 1, "one entry");

        // next SYN on the same ports collects the closed entry and starts over
        ASSERT(cm.onSegment(fromPeer(5000, 0, TH_SYN), out) == 0, "new SYN handled");
        TcpSegment again = nextReply(out);
        ASSERT(again.tcp.seq == 0 && again.tcp.ack == 5001, "fresh connection numbers");
        ASSERT(cm.size() == 1, "closed entry swept");
        ASSERT(statusOf(cm) == STATUS_SYN_RCVD, "SYN_RCVD again");
    END_TEST
}

void test_unexpected_segment() {
    TEST("Segment with no matching rule is ignored")
        ConnectionManager cm;
        messagequeue<TcpSegment> out(64);
        // a bare ACK to a port nobody handshook with
        ASSERT(cm.onSegment(fromPeer(1, 1, TH_ACK), out) == -1, "ACK in LISTEN rejected");
        ASSERT(out.size() == 0, "nothing sent");
        ASSERT(statusOf(cm) == STATUS_LISTEN, "entry stays LISTEN");

        ASSERT(cm.onSegment(fromPeer(1000, 0, TH_SYN), out) == 0, "SYN");
        nextReply(out);
        ASSERT(cm.onSegment(fromPeer(1000, 0, TH_SYN), out) == -1, "duplicate SYN rejected");
        ASSERT(out.size() == 0, "no second SYN/ACK");
        ASSERT(statusOf(cm) == STATUS_SYN_RCVD, "state unchanged");
    END_TEST
}

void test_write_requires_established() {
    TEST("write() is refused unless the connection is established")
        ConnectionManager cm;
        messagequeue<TcpSegment> out(64);
        cm.onSegment(fromPeer(1000, 0, TH_SYN), out);
        nextReply(out);

        std::optional<Connection> conn = cm.find(ipOf(PEER), PEER_PORT, ipOf(LOCAL), LOCAL_PORT);
        ASSERT(conn, "entry exists");
        ASSERT(cm.write(*conn, TH_PUSH | TH_ACK, (const uint8_t *)"hi", 2, out) == -1,
               "write in SYN_RCVD");
        ASSERT(out.size() == 0, "nothing sent");

        Connection stranger = *conn;
        stranger.src_port = 999;
        ASSERT(cm.write(stranger, TH_PUSH | TH_ACK, (const uint8_t *)"hi", 2, out) == -1,
               "write to unknown connection");
    END_TEST
}

void test_key_modes() {
    TEST("Ports-only keying merges peers; four-tuple keying separates them")
        ConnectionManager ports(CONN_KEY_PORTS);
        ConnectionManager tuple(CONN_KEY_FOUR_TUPLE);
        messagequeue<TcpSegment> out(64);

        TcpSegment a = makeSegment("10.0.0.2", PEER_PORT, LOCAL, LOCAL_PORT, 100, 0, TH_SYN);
        TcpSegment b = makeSegment("10.0.0.3", PEER_PORT, LOCAL, LOCAL_PORT, 200, 0, TH_SYN);

        ASSERT(ports.onSegment(a, out) == 0, "ports: first SYN");
        ASSERT(ports.onSegment(b, out) == -1, "ports: second peer hits the same entry");
        ASSERT(ports.size() == 1, "ports: one entry");

        ASSERT(tuple.onSegment(a, out) == 0, "tuple: first SYN");
        ASSERT(tuple.onSegment(b, out) == 0, "tuple: second SYN");
        ASSERT(tuple.size() == 2, "tuple: two entries");
        ASSERT(tuple.find(ipOf("10.0.0.3"), PEER_PORT, ipOf(LOCAL), LOCAL_PORT), "tuple: b found");
    END_TEST
}

void test_close_wakes_accept() {
    TEST("close() ends accept()")
        ConnectionManager cm;
        cm.close();
        ASSERT(!cm.accept(), "accept returns empty");
    END_TEST
}

void test_wire_order_under_concurrent_write() {
    TEST("Data written while the peer closes stays in sequence order")
        ConnectionManager cm;
        messagequeue<TcpSegment> out(1024);
        cm.onSegment(fromPeer(1000, 0, TH_SYN), out);
        cm.onSegment(fromPeer(1001, 1, TH_ACK), out);
        cm.onSegment(fromPeer(1001, 1, TH_PUSH | TH_ACK, "hi"), out);
        std::optional<Connection> conn = cm.acceptFor(100ms);
        ASSERT(conn, "connection accepted");

        int written = 0;
        std::thread writer([&] {
            Connection c = *conn;
            for (int i = 0; i < 500; ++i) {
                if (cm.write(c, TH_PUSH | TH_ACK, (const uint8_t *)"x", 1, out) < 0) break;
                written++;
            }
        });
        std::this_thread::sleep_for(1ms);
        ASSERT(cm.onSegment(fromPeer(1003, 1, TH_FIN | TH_ACK), out) == 0, "FIN handled");
        writer.join();

        // SYN/ACK, then the ACK of "hi"
        ASSERT(nextReply(out).tcp.flags == (TH_SYN | TH_ACK), "SYN/ACK first");
        uint32_t expected = 1;
        int data_segments = 0;
        bool fin_seen = false;
        while (std::optional<TcpSegment> seg = out.pop_for(0ms)) {
            ASSERT(seg->tcp.seq == expected, "segment out of sequence order: "
                   + debugSegmentSummary(*seg));
            expected += sequenceAdvance(seg->tcp.flags, seg->payloadLength());
            if (seg->payloadLength()) data_segments++;
            if (seg->tcp.flags & TH_FIN) fin_seen = true;
        }
        ASSERT(fin_seen, "FIN/ACK sent");
        ASSERT(data_segments == written, "every accepted write queued once");
    END_TEST
}

int main() {
    test_full_exchange();
    test_unexpected_segment();
    test_write_requires_established();
    test_key_modes();
    test_close_wakes_accept();
    test_wire_order_under_concurrent_write();
    return summarize("Connection manager");
}
