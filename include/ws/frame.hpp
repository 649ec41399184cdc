#pragma once
#include "core/types.hpp"
#include <cstdint>

// RFC 6455 opcodes
enum class Opcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
};

inline bool is_known_opcode(uint8_t op) {
    return op <= 0x2 || (op >= 0x8 && op <= 0xA);
}

inline bool is_control(Opcode op) {
    return (static_cast<uint8_t>(op) & 0x8) != 0;
}

constexpr size_t kMaxControlPayload = 125;

struct FrameHeader {
    bool fin = false;
    bool rsv1 = false;
    bool rsv2 = false;
    bool rsv3 = false;
    uint8_t opcode = 0;      // raw, may be unknown
    bool masked = false;
    uint8_t mask[4] = {0, 0, 0, 0};
    uint64_t payload_len = 0;
    size_t header_len = 0;
};

struct RawFrame {
    FrameHeader header;
    ByteVec payload;         // already unmasked

    Opcode opcode() const { return static_cast<Opcode>(header.opcode); }
};
