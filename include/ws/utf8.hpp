#pragma once
#include "core/types.hpp"

/*
 * Utf8Validator
 *
 * Incremental UTF-8 validation across fragment boundaries. feed() moves the
 * longest complete prefix into `out` and keeps an incomplete trailing
 * sequence (at most 3 bytes) for the next call.
 */
class Utf8Validator {
public:
    // false on an invalid sequence; `out` is left untouched in that case
    bool feed(const ByteVec& in, ByteVec& out);

    // true if no partial sequence is pending
    bool complete() const { return pending_.empty(); }

    void reset() { pending_.clear(); }

private:
    ByteVec pending_;
};

// Decode with replacement: every maximal invalid subpart becomes U+FFFD.
ByteVec sanitize_utf8(const byte* p, size_t n);
