#pragma once
#include "ws/frame.hpp"

// Serialize one frame. mask == nullptr leaves the payload unmasked.
inline ByteVec encode_frame(Opcode op, bool fin, bool rsv1, const ByteVec& payload,
                            const byte* mask) {
    ByteVec out;
    out.reserve(14 + payload.size());

    byte b0 = static_cast<byte>(op);
    if (fin) b0 |= 0x80;
    if (rsv1) b0 |= 0x40;
    out.push_back(b0);

    byte mask_bit = mask ? 0x80 : 0x00;
    uint64_t n = payload.size();
    if (n < 126) {
        out.push_back(mask_bit | static_cast<byte>(n));
    } else if (n <= 0xFFFF) {
        out.push_back(mask_bit | 126);
        out.push_back(static_cast<byte>(n >> 8));
        out.push_back(static_cast<byte>(n));
    } else {
        out.push_back(mask_bit | 127);
        for (int shift = 56; shift >= 0; shift -= 8)
            out.push_back(static_cast<byte>(n >> shift));
    }

    if (mask) {
        out.insert(out.end(), mask, mask + 4);
        size_t base = out.size();
        out.insert(out.end(), payload.begin(), payload.end());
        for (size_t i = 0; i < payload.size(); ++i)
            out[base + i] ^= mask[i % 4];
    } else {
        out.insert(out.end(), payload.begin(), payload.end());
    }
    return out;
}
