#include "tcp_internal.hpp"

const char *tcpStatusString(tcp_status status) {
    switch(status) {
    case STATUS_LISTEN: return "LISTEN";
    case STATUS_SYN_RCVD: return "SYN_RCVD";
    case STATUS_ESTAB: return "ESTAB";
    case STATUS_CLOSE_WAIT: return "CLOSE_WAIT";
    case STATUS_LAST_ACK: return "LAST_ACK";
    case STATUS_CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

tcp_transition tcpTransition(tcp_status status, uint8_t flags) {
    tcp_transition ret{status, {}, false, true};

    switch(status) {
    case STATUS_LISTEN:
        /*
         * For LISTEN, we are expecting a SYN.
         * The SYN/ACK carries our initial sequence number and acks the peer's SYN.
         */
        if(flags & TH_SYN) {
            ret.replies = {TH_SYN | TH_ACK};
            ret.next = STATUS_SYN_RCVD;
            return ret;
        }
        break;

    case STATUS_SYN_RCVD:
        /*
         * For SYN_RCVD, we expect the ACK of our SYN/ACK.
         * Nothing is sent back.
         */
        if(flags & TH_ACK) {
            ret.next = STATUS_ESTAB;
            return ret;
        }
        break;

    case STATUS_ESTAB:
        /*
         * Data is acknowledged and handed to the application.
         * PSH is looked at before FIN, so a PSH/FIN segment is treated as data.
         */
        if(flags & TH_PUSH) {
            ret.replies = {TH_ACK};
            ret.publish = true;
            return ret;
        }
        /*
         * The peer closes. We ACK its FIN (CLOSE_WAIT) and close our half at
         * once with FIN/ACK rather than a bare FIN, which saves a segment.
         */
        if(flags & TH_FIN) {
            ret.replies = {TH_ACK, TH_FIN | TH_ACK};
            ret.next = STATUS_LAST_ACK;
            return ret;
        }
        break;

    case STATUS_LAST_ACK:
        /*
         * For LAST_ACK, we are expecting the ACK of our FIN.
         */
        if(flags & TH_ACK) {
            ret.next = STATUS_CLOSED;
            return ret;
        }
        break;

    case STATUS_CLOSE_WAIT:
    case STATUS_CLOSED:
        break;
    }

    ret.expected = false;
    return ret;
}

uint32_t replyAckNumber(const TcpSegment &in, uint8_t out_flags) {
    uint32_t increment = (out_flags & (TH_SYN | TH_FIN)) ? 1 : (uint32_t)in.payloadLength();
    return in.tcp.seq + increment;
}

uint32_t sequenceAdvance(uint8_t flags, std::size_t payload_len) {
    return (flags & (TH_SYN | TH_FIN)) ? 1 : (uint32_t)payload_len;
}
