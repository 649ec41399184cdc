#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>

/*
 * StreamBuffer
 *
 * Purpose:
 *  - Accumulate arbitrary TCP stream bytes
 *  - Support peeking / consuming without corruption
 *  - Used between recv() and the HTTP head scanner, and inside FrameDecoder
 *
 * Invariants:
 *  - Bytes in [head_, buf_.size()) are unread, in arrival order
 *  - No framing logic here (that belongs in FrameDecoder)
 */

class StreamBuffer {
public:
    StreamBuffer() = default;

    void append(const byte* data, size_t len) {
        compact();
        buf_.insert(buf_.end(), data, data + len);
    }

    // Unread byte count
    size_t size() const {
        return buf_.size() - head_;
    }

    bool empty() const {
        return size() == 0;
    }

    bool can_read(size_t n) const {
        return size() >= n;
    }

    // Pointer to the first unread byte (valid until the next append)
    const byte* data() const {
        return buf_.data() + head_;
    }

    // Peek the byte at offset i (caller must ensure i < size())
    byte peek(size_t i) const {
        return buf_[head_ + i];
    }

    // Offset just past the first "\r\n\r\n", or 0 if none is buffered yet
    size_t find_head_end() const {
        static const byte crlf2[4] = {'\r', '\n', '\r', '\n'};
        size_t n = size();
        for (size_t i = 0; i + 4 <= n; ++i) {
            if (std::memcmp(data() + i, crlf2, 4) == 0)
                return i + 4;
        }
        return 0;
    }

    // Consume N bytes (caller must ensure availability)
    void consume(size_t n) {
        head_ += n;
        if (head_ == buf_.size()) {
            buf_.clear();
            head_ = 0;
        }
    }

    // Take N bytes and consume them
    ByteVec take(size_t n) {
        ByteVec out(data(), data() + n);
        consume(n);
        return out;
    }

    ByteVec take_all() {
        return take(size());
    }

    void clear() {
        buf_.clear();
        head_ = 0;
    }

private:
    // Drop consumed prefix once it dominates the buffer
    void compact() {
        if (head_ > 0 && head_ >= buf_.size() / 2) {
            buf_.erase(buf_.begin(), buf_.begin() + head_);
            head_ = 0;
        }
    }

    ByteVec buf_;
    size_t head_ = 0;
};
