#include "relay/websocket_layer.hpp"
#include "relay/fragmentizer.hpp"
#include "relay/negotiate.hpp"

#include "core/escape.hpp"
#include "core/time.hpp"
#include "ws/close_reason.hpp"
#include "ws/connection.hpp"

#include <stdexcept>
#include <string>

ProtocolFactory default_protocol_factory() {
    return [](Role role, ExtensionList extensions) {
        return std::unique_ptr<WsProtocol>(new WsConnection(role, std::move(extensions)));
    };
}

WebSocketLayer::WebSocketLayer(Context ctx, Flow& flow, Addon& hooks, ProtocolFactory factory)
    : ctx_(ctx), flow_(flow), hooks_(hooks), factory_(std::move(factory)) {}

std::vector<Command> WebSocketLayer::handle_event(const Event& event) {
    std::vector<Command> out;

    switch (state_) {
        case LayerState::Start:
            if (!std::holds_alternative<Start>(event))
                throw std::logic_error("WebSocketLayer: first event must be Start");
            start(out);
            break;

        case LayerState::Relaying:
            if (auto* d = std::get_if<DataReceived>(&event)) {
                relay(d->conn, &d->data, out);
            } else if (auto* c = std::get_if<ConnectionClosed>(&event)) {
                relay(c->conn, nullptr, out);
            } else {
                throw std::logic_error("WebSocketLayer: Start received twice");
            }
            break;

        case LayerState::Done:
            // both legs close asynchronously; late events are expected
            break;
    }
    return out;
}

void WebSocketLayer::start(std::vector<Command>& out) {
    NegotiatedExtensions ext =
        negotiate_extensions(flow_.response.headers.get("Sec-WebSocket-Extensions"));
    for (auto& line : ext.log)
        out.push_back(Log{std::move(line)});

    // the proxy plays the server towards the client and vice versa
    client_ws_.reset(new PeerCodec(ctx_.client, factory_(Role::Server, std::move(ext.client))));
    server_ws_.reset(new PeerCodec(ctx_.server, factory_(Role::Client, std::move(ext.server))));

    hooks_.websocket_start(flow_);
    state_ = LayerState::Relaying;
}

void WebSocketLayer::relay(ConnId conn, const ByteVec* data, std::vector<Command>& out) {
    bool from_client = conn == ctx_.client;
    const char* from_str = from_client ? "client" : "server";
    PeerCodec& src = from_client ? *client_ws_ : *server_ws_;
    PeerCodec& dst = from_client ? *server_ws_ : *client_ws_;

    try {
        std::vector<WsEvent> events = data ? src.feed(*data) : src.feed_eof();

        for (auto& ev : events) {
            if (auto* msg = std::get_if<WsMessage>(&ev)) {
                on_message(src, dst, from_client, *msg, out);
            } else if (auto* ping = std::get_if<WsPing>(&ev)) {
                out.push_back(Log{std::string("Received WebSocket ping from ") + from_str +
                                  " (payload: " + escape_bytes(ping->payload) + ")"});
                out.push_back(dst.send(ev));
            } else if (auto* pong = std::get_if<WsPong>(&ev)) {
                out.push_back(Log{std::string("Received WebSocket pong from ") + from_str +
                                  " (payload: " + escape_bytes(pong->payload) + ")"});
                out.push_back(dst.send(ev));
            } else if (auto* close = std::get_if<WsClose>(&ev)) {
                on_close(src, dst, from_client, *close, out);
                break;
            } else {
                throw ProtocolError(std::string("Unexpected WebSocket event: ") + event_name(ev));
            }
        }
    } catch (const ProtocolError& e) {
        fail(e.what(), out);
    }
}

void WebSocketLayer::on_message(PeerCodec& src, PeerCodec& dst, bool from_client,
                                WsMessage& msg, std::vector<Command>& out) {
    src.frame_buffer().append(std::move(msg.data));
    if (!msg.message_finished)
        return;

    FrameBuffer::Taken taken = src.frame_buffer().take();
    Fragmentizer fragmentizer(std::move(taken.fragment_lengths), msg.text);

    Message message;
    message.kind = msg.text ? MessageKind::Text : MessageKind::Binary;
    message.origin = from_client ? Origin::Client : Origin::Server;
    message.content = std::move(taken.content);
    message.timestamp_ns = now_ns();
    flow_.websocket.messages.push_back(std::move(message));

    hooks_.websocket_message(flow_);

    const Message& m = flow_.websocket.messages.back();
    if (m.killed)
        return;
    for (const auto& part : fragmentizer(m.content))
        out.push_back(dst.send(part));
}

void WebSocketLayer::on_close(PeerCodec& src, PeerCodec& dst, bool from_client,
                              const WsClose& close, std::vector<Command>& out) {
    flow_.websocket.closed_by_client = from_client;
    flow_.websocket.close_code = close.code;
    flow_.websocket.close_reason = close.reason;

    PeerCodec* legs[2] = {&dst, &src};
    for (PeerCodec* ws : legs) {
        ConnectionState s = ws->state();
        if (s == ConnectionState::Open || s == ConnectionState::RemoteClosing) {
            // a close reply carries the same code and reason as the close
            out.push_back(ws->send(close));
        }
        out.push_back(CloseConnection{ws->conn()});
    }

    finish();
    if (close.code == 1000 || close.code == 1001 || close.code == 1005) {
        hooks_.websocket_end(flow_);
    } else {
        flow_.error = "WebSocket Error: " + format_close(close.code, close.reason);
        hooks_.websocket_error(flow_);
    }
}

void WebSocketLayer::fail(const std::string& what, std::vector<Command>& out) {
    if (state_ == LayerState::Done)
        return;

    out.push_back(CloseConnection{ctx_.server});
    out.push_back(CloseConnection{ctx_.client});

    finish();
    flow_.error = "WebSocket Error: " + what;
    hooks_.websocket_error(flow_);
}

void WebSocketLayer::finish() {
    state_ = LayerState::Done;
    flow_.websocket.timestamp_end = now_ns();
}
