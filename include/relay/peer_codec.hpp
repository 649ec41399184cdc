#pragma once
#include "relay/commands.hpp"
#include "ws/protocol.hpp"

#include <memory>
#include <numeric>
#include <vector>

/*
 * FrameBuffer
 *
 * Fragments of the message currently arriving from one peer. Contents can
 * only be read through take(), which also empties the buffer.
 */
class FrameBuffer {
public:
    struct Taken {
        ByteVec content;
        std::vector<size_t> fragment_lengths;
    };

    void append(ByteVec chunk) {
        chunks_.push_back(std::move(chunk));
    }

    bool empty() const { return chunks_.empty(); }
    size_t fragments() const { return chunks_.size(); }

    Taken take() {
        Taken t;
        size_t total = std::accumulate(chunks_.begin(), chunks_.end(), size_t(0),
                                       [](size_t n, const ByteVec& c) { return n + c.size(); });
        t.content.reserve(total);
        t.fragment_lengths.reserve(chunks_.size());
        for (const auto& c : chunks_) {
            t.content.insert(t.content.end(), c.begin(), c.end());
            t.fragment_lengths.push_back(c.size());
        }
        chunks_.clear();
        return t;
    }

private:
    std::vector<ByteVec> chunks_;
};

/*
 * PeerCodec
 *
 * One transport connection bound to the protocol state machine that speaks
 * to it, plus the in-flight message buffer for that direction.
 */
class PeerCodec {
public:
    PeerCodec(ConnId conn, std::unique_ptr<WsProtocol> proto)
        : conn_(conn), proto_(std::move(proto)) {}

    ConnId conn() const { return conn_; }
    ConnectionState state() const { return proto_->state(); }

    std::vector<WsEvent> feed(const ByteVec& data) {
        proto_->receive_data(data.data(), data.size());
        return proto_->events();
    }

    std::vector<WsEvent> feed_eof() {
        proto_->receive_eof();
        return proto_->events();
    }

    ByteVec encode(const WsEvent& event) {
        return proto_->send(event);
    }

    // encode() wrapped as a send command for this connection
    SendData send(const WsEvent& event) {
        return SendData{conn_, encode(event)};
    }

    FrameBuffer& frame_buffer() { return frame_buf_; }

private:
    ConnId conn_;
    std::unique_ptr<WsProtocol> proto_;
    FrameBuffer frame_buf_;
};
