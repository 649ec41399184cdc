#pragma once
#include "core/types.hpp"
#include <string>
#include <variant>

// ---------- inbound events ----------

struct Start {};

struct DataReceived {
    ConnId conn;
    ByteVec data;
};

struct ConnectionClosed {
    ConnId conn;
};

using Event = std::variant<Start, DataReceived, ConnectionClosed>;

// ---------- outbound commands ----------

struct SendData {
    ConnId conn;
    ByteVec data;
};

struct CloseConnection {
    ConnId conn;
};

struct Log {
    std::string message;
};

using Command = std::variant<SendData, CloseConnection, Log>;

// The two transport legs a layer relays between.
struct Context {
    ConnId client;
    ConnId server;
};
