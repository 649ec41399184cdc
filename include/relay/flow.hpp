#pragma once
#include "core/types.hpp"
#include "net/http_head.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class MessageKind {
    Text,
    Binary
};

enum class Origin {
    Client,
    Server
};

struct Message {
    MessageKind kind = MessageKind::Binary;
    Origin origin = Origin::Client;
    ByteVec content;
    bool killed = false;
    uint64_t timestamp_ns = 0;

    bool is_text() const { return kind == MessageKind::Text; }
    bool from_client() const { return origin == Origin::Client; }

    std::string text() const { return std::string(content.begin(), content.end()); }
    void set_text(const std::string& s) { content.assign(s.begin(), s.end()); }

    void kill() { killed = true; }
};

struct WebSocketData {
    std::vector<Message> messages;
    bool closed_by_client = false;
    int close_code = 0;
    std::string close_reason;
    uint64_t timestamp_end = 0;
};

/*
 * Flow
 *
 * The proxy's record of one intercepted session. Owned by the proxy; the
 * relay layer is its only writer while the session is live.
 */
struct Flow {
    uint32_t id = 0;
    HttpHead request;
    HttpHead response;
    WebSocketData websocket;
    std::optional<std::string> error;
};
