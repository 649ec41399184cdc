#pragma once
#include "net/stream_buffer.hpp"
#include "ws/frame.hpp"

/*
 * FrameDecoder
 *
 * Splits an arbitrarily chunked byte stream into complete RFC 6455 frames.
 * Only the wire layout is checked here (minimal length encoding); opcode,
 * masking and fragmentation rules are the connection's business.
 */
class FrameDecoder {
public:
    void push(const byte* p, size_t n) {
        sb_.append(p, n);
    }

    // Throws ParseFailed on a malformed length field.
    bool has_frame();

    RawFrame pop();

    size_t buffered() const { return sb_.size(); }

private:
    bool parse_header(FrameHeader& out) const;

    StreamBuffer sb_;
    FrameHeader current_;
    bool header_ready_ = false;
};
