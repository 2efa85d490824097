#pragma once

#include <list>
#include <mutex>
#include <optional>
#include <vector>
#include "inc/common.hpp"
#include "inc/messagequeue.hpp"
#include "config.hpp"
#include "tcp_header.hpp"

/*
 * Passive side only: no SYN_SENT or FIN_WAIT_*.
 * LISTEN -> SYN_RCVD -> ESTAB -> CLOSE_WAIT -> LAST_ACK -> CLOSED
 */
enum tcp_status {
    STATUS_LISTEN = 0,
    STATUS_SYN_RCVD,
    STATUS_ESTAB,
    STATUS_CLOSE_WAIT,
    STATUS_LAST_ACK,
    STATUS_CLOSED
};

const char *tcpStatusString(tcp_status status);

struct Connection {
    // as seen on inbound segments: src is the peer, dst is us.
    ip_t src_ip, dst_ip;
    uint16_t src_port, dst_port;
    tcp_status status;
    uint32_t next_seq_num;   // next sequence number we send
    uint32_t next_ack_num;   // ack number carried by the last segment we sent

    // payload of the PSH segment that handed this snapshot to accept().
    // always empty inside the connection table.
    std::vector<uint8_t> data;
};

/*
 * Outcome of one inbound segment, decided only from the current status and the
 * segment's flags. `replies` are sent in order, each built from the inbound
 * segment.
 */
struct tcp_transition {
    tcp_status next;
    std::vector<uint8_t> replies;
    bool publish;    // hand a snapshot to accept()
    bool expected;   // false: no rule matched, nothing changes
};

// below in recv_segment.cpp

tcp_transition tcpTransition(tcp_status status, uint8_t flags);

/*
 * Acknowledgment number for a reply with `out_flags` to `in`:
 * SYN and FIN consume one sequence number, anything else acknowledges the
 * inbound payload.
 */
uint32_t replyAckNumber(const TcpSegment &in, uint8_t out_flags);

// how far a segment advances the sender's sequence number.
uint32_t sequenceAdvance(uint8_t flags, std::size_t payload_len);

// below in connection_manager.cpp

class ConnectionManager {
public:
    explicit ConnectionManager(conn_key_mode key_mode = CONN_KEY_PORTS,
                               std::size_t accept_capacity = QUEUE_CAPACITY);

    /**
     * @brief Drop closed connections, then create a LISTEN entry for the
     * segment's key if none exists.
     */
    void ensureConnectionExists(const TcpSegment &seg);

    /**
     * @brief Drive the state machine with one inbound segment.
     * Replies are pushed to `out` after the table lock is released.
     * @return 0 if a rule matched, -1 otherwise (segment ignored).
     */
    int passiveHandler(const TcpSegment &seg, messagequeue<TcpSegment> &out);

    // ensureConnectionExists() followed by passiveHandler().
    int onSegment(const TcpSegment &seg, messagequeue<TcpSegment> &out);

    /**
     * @brief Send application data over an established connection.
     * Sequence and acknowledgment numbers come from the table; `conn` is
     * updated to match. Segments reach `out` in the order their sequence
     * numbers were assigned, also when racing with replies to inbound
     * segments.
     * @return 0 on success, -1 if the connection is unknown, not established,
     * or the outgoing queue is closed.
     */
    int write(Connection &conn, uint8_t flags, const uint8_t *buf, std::size_t len,
              messagequeue<TcpSegment> &out);

    std::optional<Connection> accept();

    template<typename Rep, typename Period>
    std::optional<Connection> acceptFor(const std::chrono::duration<Rep, Period> &timeout) {
        return accepted.pop_for(timeout);
    }

    std::size_t pendingAccepts() const { return accepted.size(); }

    // unblock accept() callers; the table stays readable.
    void close();

    // snapshot of the entry that a segment with these fields would reach.
    std::optional<Connection> find(ip_t src_ip, uint16_t src_port,
                                   ip_t dst_ip, uint16_t dst_port);

    std::size_t size();

private:
    // mutex held by caller
    Connection *lookup(ip_t src_ip, uint16_t src_port, ip_t dst_ip, uint16_t dst_port);

    // build one reply to `in` and advance conn.next_seq_num. mutex held by caller.
    TcpSegment makeReply(Connection &conn, const TcpSegment &in, uint8_t flags,
                         const uint8_t *buf, std::size_t len);

    const conn_key_mode key_mode;
    // held from sequence number assignment until the segment is queued, so
    // the wire order matches. taken before conns_mutex, never inside it.
    std::mutex send_mutex;
    std::mutex conns_mutex;
    std::list<Connection> conns;
    messagequeue<Connection> accepted;
};
