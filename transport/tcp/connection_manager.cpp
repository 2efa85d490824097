#include <cstdio>
#include "tcp_internal.hpp"

// largest payload that still fits the 16-bit IP total length
#define TCP_MAX_PAYLOAD (65535 - IP_HEADER_LENGTH - TCP_HEADER_LENGTH)

ConnectionManager::ConnectionManager(conn_key_mode key_mode, std::size_t accept_capacity)
    : key_mode(key_mode), accepted(accept_capacity) {}

Connection *ConnectionManager::lookup(ip_t src_ip, uint16_t src_port,
                                      ip_t dst_ip, uint16_t dst_port) {
    for(Connection &conn: conns) {
        if(conn.src_port != src_port || conn.dst_port != dst_port) continue;
        if(key_mode == CONN_KEY_FOUR_TUPLE &&
           (conn.src_ip != src_ip || conn.dst_ip != dst_ip)) continue;
        return &conn;
    }
    return NULL;
}

void ConnectionManager::ensureConnectionExists(const TcpSegment &seg) {
    std::scoped_lock lock(conns_mutex);
    // closed connections are only collected here, on the next lookup.
    conns.remove_if([] (const Connection &conn) { return conn.status == STATUS_CLOSED; });

    if(lookup(seg.ip.src, seg.tcp.src_port, seg.ip.dest, seg.tcp.dst_port)) return;
    conns.push_back(Connection{seg.ip.src, seg.ip.dest,
                               seg.tcp.src_port, seg.tcp.dst_port,
                               STATUS_LISTEN, 0, 0, {}});
}

TcpSegment ConnectionManager::makeReply(Connection &conn, const TcpSegment &in, uint8_t flags,
                                        const uint8_t *buf, std::size_t len) {
    uint32_t ack = replyAckNumber(in, flags);
    TcpHeader tcphdr = TcpHeader::make(in.tcp.dst_port, in.tcp.src_port,
                                       conn.next_seq_num, ack, flags);
    TcpSegment reply = buildTCPSegment(in.ip.dest, in.ip.src, tcphdr, buf, len);
    conn.next_seq_num += sequenceAdvance(flags, len);
    conn.next_ack_num = ack;
    return reply;
}

int ConnectionManager::passiveHandler(const TcpSegment &seg, messagequeue<TcpSegment> &out) {
    std::string segsummary = debugSegmentSummary(seg);
    std::vector<TcpSegment> replies;
    std::optional<Connection> published;

    std::unique_lock<std::mutex> send_lock(send_mutex);
    {
        std::scoped_lock lock(conns_mutex);
        Connection *conn = lookup(seg.ip.src, seg.tcp.src_port, seg.ip.dest, seg.tcp.dst_port);
        if(conn == NULL) {
            fprintf(stderr, "[TCP Error] drop segment: no connection. %s\n", segsummary.c_str());
            return -1;
        }

        tcp_transition t = tcpTransition(conn->status, seg.tcp.flags);
        if(!t.expected) {
            fprintf(stderr, "[TCP Error] unexpected condition in %s. %s\n",
                    tcpStatusString(conn->status), segsummary.c_str());
            return -1;
        }

        for(uint8_t flags: t.replies) {
            replies.push_back(makeReply(*conn, seg, flags, NULL, 0));
        }
        fprintf(stderr, "%s -> %s, sent %d segment(s). %s\n",
                tcpStatusString(conn->status), tcpStatusString(t.next),
                (int)replies.size(), segsummary.c_str());
        conn->status = t.next;

        if(t.publish) {
            published = *conn;
            published->data.assign(seg.payload(), seg.payload() + seg.payloadLength());
        }
    }

    for(TcpSegment &reply: replies) {
        if(!out.push(std::move(reply))) {
            fprintf(stderr, "[TCP Error] outgoing queue closed, reply dropped.\n");
            return -1;
        }
    }
    // accept() callers may be the ones writing; never wait on them holding send_mutex.
    send_lock.unlock();
    if(published && !accepted.push(std::move(*published))) {
        fprintf(stderr, "[TCP Error] accept queue closed, connection not handed over.\n");
        return -1;
    }
    return 0;
}

int ConnectionManager::onSegment(const TcpSegment &seg, messagequeue<TcpSegment> &out) {
    ensureConnectionExists(seg);
    return passiveHandler(seg, out);
}

int ConnectionManager::write(Connection &conn, uint8_t flags, const uint8_t *buf, std::size_t len,
                             messagequeue<TcpSegment> &out) {
    if(len > TCP_MAX_PAYLOAD) {
        fprintf(stderr, "[TCP Error] write: len=%zu does not fit one segment.\n", len);
        return -1;
    }

    TcpSegment seg;
    std::scoped_lock send_lock(send_mutex);
    {
        std::scoped_lock lock(conns_mutex);
        Connection *c = lookup(conn.src_ip, conn.src_port, conn.dst_ip, conn.dst_port);
        if(c == NULL) {
            fprintf(stderr, "[TCP Error] write: no connection for port %u -> %u.\n",
                    (uint32_t)conn.dst_port, (uint32_t)conn.src_port);
            return -1;
        }
        if(c->status != STATUS_ESTAB) {
            fprintf(stderr, "[TCP Error] write: connection in %s, not ESTAB.\n",
                    tcpStatusString(c->status));
            conn.status = c->status;
            return -1;
        }
        TcpHeader tcphdr = TcpHeader::make(c->dst_port, c->src_port,
                                           c->next_seq_num, c->next_ack_num, flags);
        seg = buildTCPSegment(c->dst_ip, c->src_ip, tcphdr, buf, len);
        c->next_seq_num += sequenceAdvance(flags, len);

        conn.status = c->status;
        conn.next_seq_num = c->next_seq_num;
        conn.next_ack_num = c->next_ack_num;
    }

    fprintf(stderr, "sending data. %s\n", debugSegmentSummary(seg).c_str());
    if(!out.push(std::move(seg))) {
        fprintf(stderr, "[TCP Error] write: outgoing queue closed.\n");
        return -1;
    }
    return 0;
}

std::optional<Connection> ConnectionManager::accept() {
    return accepted.pop();
}

void ConnectionManager::close() {
    accepted.close();
}

std::optional<Connection> ConnectionManager::find(ip_t src_ip, uint16_t src_port,
                                                  ip_t dst_ip, uint16_t dst_port) {
    std::scoped_lock lock(conns_mutex);
    Connection *conn = lookup(src_ip, src_port, dst_ip, dst_port);
    if(conn == NULL) return std::nullopt;
    return *conn;
}

std::size_t ConnectionManager::size() {
    std::scoped_lock lock(conns_mutex);
    return conns.size();
}
