#pragma once
#include "core/types.hpp"
#include <string>
#include <variant>

// One data frame's worth of a (possibly fragmented) message.
struct WsMessage {
    bool text = false;
    ByteVec data;
    bool message_finished = true;
};

struct WsPing {
    ByteVec payload;
};

struct WsPong {
    ByteVec payload;
};

struct WsClose {
    int code = 1005;
    std::string reason;
};

using WsEvent = std::variant<WsMessage, WsPing, WsPong, WsClose>;

const char* event_name(const WsEvent& ev);
