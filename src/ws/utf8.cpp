#include "ws/utf8.hpp"

namespace {

// Sequence length for a lead byte, 0 if it can never start a sequence.
size_t sequence_length(byte lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

// Allowed range of the first continuation byte (overlongs and surrogates
// are excluded here, later continuation bytes are always 80..BF).
bool first_continuation_ok(byte lead, byte c) {
    switch (lead) {
        case 0xE0: return c >= 0xA0 && c <= 0xBF;
        case 0xED: return c >= 0x80 && c <= 0x9F;
        case 0xF0: return c >= 0x90 && c <= 0xBF;
        case 0xF4: return c >= 0x80 && c <= 0x8F;
        default:   return c >= 0x80 && c <= 0xBF;
    }
}

enum class Scan { Valid, Truncated, Invalid };

// Check the sequence starting at p[0]; `used` receives the number of bytes
// that belong to it (the full length, or the maximal invalid subpart).
Scan scan_sequence(const byte* p, size_t avail, size_t& used) {
    size_t need = sequence_length(p[0]);
    if (need == 0) {
        used = 1;
        return Scan::Invalid;
    }
    for (size_t k = 1; k < need; ++k) {
        if (k >= avail) {
            used = k;
            return Scan::Truncated;
        }
        bool ok = (k == 1) ? first_continuation_ok(p[0], p[k])
                           : (p[k] >= 0x80 && p[k] <= 0xBF);
        if (!ok) {
            used = k;
            return Scan::Invalid;
        }
    }
    used = need;
    return Scan::Valid;
}

} // namespace

bool Utf8Validator::feed(const ByteVec& in, ByteVec& out) {
    ByteVec buf;
    buf.reserve(pending_.size() + in.size());
    buf.insert(buf.end(), pending_.begin(), pending_.end());
    buf.insert(buf.end(), in.begin(), in.end());

    size_t i = 0;
    while (i < buf.size()) {
        size_t used = 0;
        Scan s = scan_sequence(buf.data() + i, buf.size() - i, used);
        if (s == Scan::Invalid) return false;
        if (s == Scan::Truncated) break;
        i += used;
    }

    out.insert(out.end(), buf.begin(), buf.begin() + i);
    pending_.assign(buf.begin() + i, buf.end());
    return true;
}

ByteVec sanitize_utf8(const byte* p, size_t n) {
    static const byte replacement[3] = {0xEF, 0xBF, 0xBD};

    ByteVec out;
    out.reserve(n);
    size_t i = 0;
    while (i < n) {
        size_t used = 0;
        Scan s = scan_sequence(p + i, n - i, used);
        if (s == Scan::Valid) {
            out.insert(out.end(), p + i, p + i + used);
        } else {
            out.insert(out.end(), replacement, replacement + 3);
        }
        i += used;
    }
    return out;
}
