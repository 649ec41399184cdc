#pragma once
#include "core/types.hpp"
#include "ws/events.hpp"
#include <stdexcept>
#include <string>
#include <vector>

enum class Role {
    Client,
    Server
};

enum class ConnectionState {
    Connecting,
    Open,
    RemoteClosing,
    LocalClosing,
    Closed,
    Rejecting
};

const char* to_string(ConnectionState s);

// Misuse of a protocol connection: bytes after close, events that cannot
// be sent in the current state.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed bytes from the peer. code is the close code to report.
class ParseFailed : public std::runtime_error {
public:
    explicit ParseFailed(const std::string& what, int code = 1002)
        : std::runtime_error(what), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

/*
 * WsProtocol
 *
 * Sans-IO WebSocket connection: feed bytes or end-of-stream, drain events;
 * encode an event into wire bytes. The relay only talks to this interface.
 */
class WsProtocol {
public:
    virtual ~WsProtocol() = default;

    virtual ConnectionState state() const = 0;

    virtual void receive_data(const byte* data, size_t len) = 0;
    virtual void receive_eof() = 0;

    // Events produced since the last call, in wire order.
    virtual std::vector<WsEvent> events() = 0;

    virtual ByteVec send(const WsEvent& event) = 0;
};
