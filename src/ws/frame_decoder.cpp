#include "ws/frame_decoder.hpp"
#include "ws/protocol.hpp"

#include <string>

bool FrameDecoder::parse_header(FrameHeader& h) const {
    if (!sb_.can_read(2)) return false;

    byte b0 = sb_.peek(0);
    byte b1 = sb_.peek(1);

    size_t len = 2;
    uint8_t len_field = b1 & 0x7F;
    if (len_field == 126) len += 2;
    else if (len_field == 127) len += 8;
    if (b1 & 0x80) len += 4;

    if (!sb_.can_read(len)) return false;

    h.fin = (b0 & 0x80) != 0;
    h.rsv1 = (b0 & 0x40) != 0;
    h.rsv2 = (b0 & 0x20) != 0;
    h.rsv3 = (b0 & 0x10) != 0;
    h.opcode = b0 & 0x0F;
    h.masked = (b1 & 0x80) != 0;
    h.header_len = len;

    size_t offset = 2;
    if (len_field < 126) {
        h.payload_len = len_field;
    } else if (len_field == 126) {
        h.payload_len = (uint64_t(sb_.peek(2)) << 8) | uint64_t(sb_.peek(3));
        offset = 4;
        if (h.payload_len < 126)
            throw ParseFailed("Payload length used 2 bytes when 0 would have sufficed");
    } else {
        uint64_t v = 0;
        for (size_t i = 0; i < 8; ++i)
            v = (v << 8) | uint64_t(sb_.peek(2 + i));
        offset = 10;
        if (v >> 63)
            throw ParseFailed("8-byte payload length with non-zero MSB");
        if (v <= 0xFFFF)
            throw ParseFailed("Payload length used 8 bytes when 2 would have sufficed");
        h.payload_len = v;
    }

    if (h.masked) {
        for (size_t i = 0; i < 4; ++i)
            h.mask[i] = sb_.peek(offset + i);
    }
    return true;
}

bool FrameDecoder::has_frame() {
    if (!header_ready_) {
        if (!parse_header(current_)) return false;
        header_ready_ = true;
    }
    return sb_.can_read(current_.header_len + current_.payload_len);
}

RawFrame FrameDecoder::pop() {
    RawFrame f;
    f.header = current_;
    sb_.consume(current_.header_len);
    f.payload = sb_.take(static_cast<size_t>(current_.payload_len));

    if (f.header.masked) {
        for (size_t i = 0; i < f.payload.size(); ++i)
            f.payload[i] ^= f.header.mask[i % 4];
    }

    header_ready_ = false;
    return f;
}
