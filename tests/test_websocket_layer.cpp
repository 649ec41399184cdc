// tests/test_websocket_layer.cpp
// The relay layer between a real client endpoint and a real server endpoint

#include "relay/negotiate.hpp"
#include "relay/websocket_layer.hpp"
#include "ws/connection.hpp"
#include "ws/frame_encoder.hpp"
#include <cassert>
#include <cstdio>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

static const ConnId kClient = 3;
static const ConnId kServer = 4;

static ByteVec bytes(const std::string& s) {
    return ByteVec(s.begin(), s.end());
}

struct Recorder : Addon {
    std::vector<std::string> calls;
    std::function<void(Flow&)> on_message;

    void websocket_start(Flow&) override { calls.push_back("start"); }
    void websocket_message(Flow& f) override {
        calls.push_back("message");
        if (on_message) on_message(f);
    }
    void websocket_end(Flow&) override { calls.push_back("end"); }
    void websocket_error(Flow&) override { calls.push_back("error"); }
};

/*
 * browser <-> [kClient | layer | kServer] <-> upstream
 *
 * browser and upstream are ordinary endpoints; commands the layer emits
 * are delivered to them by deliver().
 */
struct Harness {
    Flow flow;
    Recorder hooks;
    std::unique_ptr<WebSocketLayer> layer;
    std::unique_ptr<WsConnection> browser;
    std::unique_ptr<WsConnection> upstream;
    std::vector<Command> start_cmds;

    explicit Harness(const std::string& extensions = "") {
        flow.id = 1;
        if (!extensions.empty())
            flow.response.headers.add("Sec-WebSocket-Extensions", extensions);

        NegotiatedExtensions peers = negotiate_extensions(extensions);
        browser.reset(new WsConnection(Role::Client, std::move(peers.client)));
        upstream.reset(new WsConnection(Role::Server, std::move(peers.server)));

        layer.reset(new WebSocketLayer(Context{kClient, kServer}, flow, hooks));
        start_cmds = layer->handle_event(Start{});
    }

    std::vector<Command> from_client(const ByteVec& wire) {
        return layer->handle_event(DataReceived{kClient, wire});
    }

    std::vector<Command> from_server(const ByteVec& wire) {
        return layer->handle_event(DataReceived{kServer, wire});
    }

    void deliver(const std::vector<Command>& cmds) {
        for (const auto& c : cmds) {
            if (auto* s = std::get_if<SendData>(&c)) {
                WsConnection& to = s->conn == kClient ? *browser : *upstream;
                to.receive_data(s->data.data(), s->data.size());
            }
        }
    }
};

static size_t count_sends(const std::vector<Command>& cmds, ConnId conn) {
    size_t n = 0;
    for (const auto& c : cmds) {
        if (auto* s = std::get_if<SendData>(&c))
            n += s->conn == conn;
    }
    return n;
}

static ByteVec concat(std::initializer_list<ByteVec> parts) {
    ByteVec out;
    for (const auto& p : parts)
        out.insert(out.end(), p.begin(), p.end());
    return out;
}

void test_start() {
    printf("Testing Start...\n");

    Harness h;
    assert(h.layer->state() == LayerState::Relaying);
    assert(h.start_cmds.empty());
    assert(h.hooks.calls == std::vector<std::string>({"start"}));

    Harness unknown("x-foo, permessage-deflate");
    assert(unknown.start_cmds.size() == 1);
    assert(std::get<Log>(unknown.start_cmds[0]).message ==
           "Ignoring unknown WebSocket extension 'x-foo'.");

    printf("  PASS start\n");
}

void test_first_event_must_be_start() {
    printf("Testing a non-Start first event...\n");

    Flow flow;
    Recorder hooks;
    WebSocketLayer layer(Context{kClient, kServer}, flow, hooks);
    bool threw = false;
    try {
        layer.handle_event(DataReceived{kClient, bytes("x")});
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(hooks.calls.empty());

    printf("  PASS first event\n");
}

void test_fragments_replayed() {
    printf("Testing an unmodified message keeps its fragments...\n");

    Harness h;
    ByteVec wire = concat({h.browser->send(WsMessage{true, bytes("he"), false}),
                           h.browser->send(WsMessage{true, bytes("ll"), false}),
                           h.browser->send(WsMessage{true, bytes("o"), true})});

    auto cmds = h.from_client(wire);
    assert(count_sends(cmds, kServer) == 3);
    assert(count_sends(cmds, kClient) == 0);

    h.deliver(cmds);
    auto evs = h.upstream->events();
    assert(evs.size() == 3);
    assert(std::get<WsMessage>(evs[0]).data == bytes("he"));
    assert(std::get<WsMessage>(evs[1]).data == bytes("ll"));
    assert(std::get<WsMessage>(evs[2]).data == bytes("o"));
    assert(std::get<WsMessage>(evs[2]).message_finished);

    assert(h.flow.websocket.messages.size() == 1);
    const Message& m = h.flow.websocket.messages[0];
    assert(m.text() == "hello");
    assert(m.is_text());
    assert(m.from_client());
    assert(m.timestamp_ns != 0);
    assert(h.hooks.calls == std::vector<std::string>({"start", "message"}));

    printf("  PASS fragments replayed\n");
}

void test_fragments_split_by_chunks() {
    printf("Testing a message split across DataReceived events...\n");

    Harness h;
    ByteVec first = h.upstream->send(WsMessage{false, ByteVec(10, 1), false});
    ByteVec second = h.upstream->send(WsMessage{false, ByteVec(5, 2), true});

    auto cmds = h.from_server(ByteVec(first.begin(), first.begin() + 3));
    assert(cmds.empty());
    cmds = h.from_server(ByteVec(first.begin() + 3, first.end()));
    assert(cmds.empty());
    assert(h.flow.websocket.messages.empty());

    cmds = h.from_server(second);
    assert(count_sends(cmds, kClient) == 2);
    assert(h.flow.websocket.messages.size() == 1);
    assert(!h.flow.websocket.messages[0].from_client());
    assert(h.flow.websocket.messages[0].content.size() == 15);

    printf("  PASS split across events\n");
}

void test_large_single_frame() {
    printf("Testing a large single frame rewritten at the same length stays whole...\n");

    Harness h;
    h.hooks.on_message = [](Flow& f) {
        f.websocket.messages.back().content.assign(9000, 'r');
    };

    auto cmds = h.from_server(h.upstream->send(WsMessage{false, ByteVec(9000, 'q'), true}));
    assert(count_sends(cmds, kClient) == 1);

    h.deliver(cmds);
    auto evs = h.browser->events();
    assert(evs.size() == 1);
    assert(std::get<WsMessage>(evs[0]).data == ByteVec(9000, 'r'));
    assert(std::get<WsMessage>(evs[0]).message_finished);

    printf("  PASS large single frame\n");
}

void test_modified_message_rechunked() {
    printf("Testing a modified message is re-chunked...\n");

    Harness h;
    h.hooks.on_message = [](Flow& f) {
        f.websocket.messages.back().content.assign(8500, 'y');
    };

    auto cmds = h.from_server(h.upstream->send(WsMessage{false, ByteVec(1000, 'q'), true}));
    assert(count_sends(cmds, kClient) == 3);

    h.deliver(cmds);
    auto evs = h.browser->events();
    assert(evs.size() == 3);
    assert(std::get<WsMessage>(evs[0]).data.size() == 4000);
    assert(std::get<WsMessage>(evs[1]).data.size() == 4000);
    assert(std::get<WsMessage>(evs[2]).data.size() == 500);
    assert(std::get<WsMessage>(evs[2]).message_finished);
    assert(h.flow.websocket.messages[0].content.size() == 8500);

    printf("  PASS modified message\n");
}

void test_killed_message() {
    printf("Testing a killed message is not forwarded...\n");

    Harness h;
    h.hooks.on_message = [](Flow& f) { f.websocket.messages.back().kill(); };

    auto cmds = h.from_client(h.browser->send(WsMessage{true, bytes("drop me"), true}));
    assert(cmds.empty());
    assert(h.flow.websocket.messages.size() == 1);
    assert(h.flow.websocket.messages[0].killed);

    // emptied content vanishes the same way
    h.hooks.on_message = [](Flow& f) { f.websocket.messages.back().content.clear(); };
    cmds = h.from_client(h.browser->send(WsMessage{true, bytes("empty me"), true}));
    assert(cmds.empty());
    assert(h.flow.websocket.messages.size() == 2);

    printf("  PASS killed message\n");
}

void test_ping_pong() {
    printf("Testing ping/pong passthrough...\n");

    Harness h;
    auto cmds = h.from_client(h.browser->send(WsPing{bytes("p")}));
    assert(cmds.size() == 2);
    assert(std::get<Log>(cmds[0]).message == "Received WebSocket ping from client (payload: b'p')");
    assert(std::get<SendData>(cmds[1]).conn == kServer);

    h.deliver(cmds);
    auto evs = h.upstream->events();
    assert(std::get<WsPing>(evs[0]).payload == bytes("p"));

    cmds = h.from_server(h.upstream->send(WsPong{bytes("p")}));
    assert(std::get<Log>(cmds[0]).message == "Received WebSocket pong from server (payload: b'p')");
    assert(std::get<SendData>(cmds[1]).conn == kClient);

    assert(h.flow.websocket.messages.empty());
    assert(h.hooks.calls == std::vector<std::string>({"start"}));

    printf("  PASS ping/pong\n");
}

void test_ping_inside_fragmented_message() {
    printf("Testing a ping between fragments...\n");

    Harness h;
    ByteVec wire = concat({h.browser->send(WsMessage{true, bytes("a"), false}),
                           h.browser->send(WsPing{bytes("x")}),
                           h.browser->send(WsMessage{true, bytes("b"), true})});

    auto cmds = h.from_client(wire);
    h.deliver(cmds);
    auto evs = h.upstream->events();
    assert(evs.size() == 3);
    assert(std::holds_alternative<WsPing>(evs[0]));
    assert(std::get<WsMessage>(evs[1]).data == bytes("a"));
    assert(std::get<WsMessage>(evs[2]).data == bytes("b"));
    assert(h.flow.websocket.messages[0].text() == "ab");

    printf("  PASS ping between fragments\n");
}

static void check_normal_close(int code) {
    Harness h;
    std::string reason = code == 1005 ? "" : "bye";
    auto cmds = h.from_client(h.browser->send(WsClose{code, reason}));

    // destination leg first, then the source's close reply
    assert(cmds.size() == 4);
    assert(std::get<SendData>(cmds[0]).conn == kServer);
    assert(std::get<CloseConnection>(cmds[1]).conn == kServer);
    assert(std::get<SendData>(cmds[2]).conn == kClient);
    assert(std::get<CloseConnection>(cmds[3]).conn == kClient);

    assert(h.layer->state() == LayerState::Done);
    assert(h.flow.websocket.closed_by_client);
    assert(h.flow.websocket.close_code == code);
    assert(h.flow.websocket.close_reason == reason);
    assert(h.flow.websocket.timestamp_end != 0);
    assert(!h.flow.error);
    assert(h.hooks.calls == std::vector<std::string>({"start", "end"}));

    h.deliver(cmds);
    auto up = h.upstream->events();
    assert(std::get<WsClose>(up[0]).code == code);
    assert(std::get<WsClose>(up[0]).reason == reason);
    auto down = h.browser->events();
    assert(std::get<WsClose>(down[0]).code == code);
    assert(h.browser->state() == ConnectionState::Closed);

    // late traffic is drained
    assert(h.from_server(bytes("garbage")).empty());
    assert(h.layer->handle_event(ConnectionClosed{kServer}).empty());
}

void test_normal_close() {
    printf("Testing normal close codes...\n");

    check_normal_close(1000);
    check_normal_close(1001);
    check_normal_close(1005);

    printf("  PASS normal close\n");
}

void test_close_by_server_with_error_code() {
    printf("Testing a close with an unregistered code...\n");

    Harness h;
    auto cmds = h.from_server(h.upstream->send(WsClose{4000, "x"}));
    assert(count_sends(cmds, kClient) == 1);
    assert(count_sends(cmds, kServer) == 1);

    assert(!h.flow.websocket.closed_by_client);
    assert(h.flow.error);
    assert(*h.flow.error == "WebSocket Error: UNKNOWN_ERROR=4000 (reason: x)");
    assert(h.hooks.calls == std::vector<std::string>({"start", "error"}));

    printf("  PASS error code\n");
}

void test_abnormal_close() {
    printf("Testing a connection dropped without close...\n");

    Harness h;
    auto cmds = h.layer->handle_event(ConnectionClosed{kServer});

    // the dead leg gets no close frame
    assert(cmds.size() == 3);
    assert(std::get<SendData>(cmds[0]).conn == kClient);
    assert(std::get<CloseConnection>(cmds[1]).conn == kClient);
    assert(std::get<CloseConnection>(cmds[2]).conn == kServer);

    assert(h.flow.websocket.close_code == 1006);
    assert(*h.flow.error == "WebSocket Error: ABNORMAL_CLOSURE");
    assert(h.hooks.calls == std::vector<std::string>({"start", "error"}));
    assert(h.layer->state() == LayerState::Done);

    printf("  PASS abnormal close\n");
}

void test_malformed_frame() {
    printf("Testing a malformed frame from the client...\n");

    Harness h;
    auto cmds = h.from_client(encode_frame(Opcode::Text, true, false, bytes("x"), nullptr));

    assert(count_sends(cmds, kServer) == 1);
    assert(count_sends(cmds, kClient) == 1);
    assert(h.flow.websocket.closed_by_client);
    assert(h.flow.websocket.close_code == 1002);
    assert(*h.flow.error == "WebSocket Error: PROTOCOL_ERROR (reason: Client sent unmasked frame)");

    h.deliver(cmds);
    auto up = h.upstream->events();
    assert(std::get<WsClose>(up[0]).code == 1002);

    printf("  PASS malformed frame\n");
}

// Rejects any input as a protocol violation.
class BrokenProtocol : public WsProtocol {
public:
    ConnectionState state() const override { return ConnectionState::Open; }
    void receive_data(const byte*, size_t) override { throw ProtocolError("boom"); }
    void receive_eof() override {}
    std::vector<WsEvent> events() override { return {}; }
    ByteVec send(const WsEvent&) override { return ByteVec(); }
};

void test_protocol_error() {
    printf("Testing a protocol error from the codec...\n");

    Flow flow;
    Recorder hooks;
    WebSocketLayer layer(Context{kClient, kServer}, flow, hooks,
                         [](Role, ExtensionList) {
                             return std::unique_ptr<WsProtocol>(new BrokenProtocol());
                         });
    layer.handle_event(Start{});

    auto cmds = layer.handle_event(DataReceived{kClient, bytes("x")});
    assert(cmds.size() == 2);
    assert(std::get<CloseConnection>(cmds[0]).conn == kServer);
    assert(std::get<CloseConnection>(cmds[1]).conn == kClient);
    assert(*flow.error == "WebSocket Error: boom");
    assert(hooks.calls == std::vector<std::string>({"start", "error"}));
    assert(layer.state() == LayerState::Done);

    printf("  PASS protocol error\n");
}

void test_deflate_end_to_end() {
    printf("Testing permessage-deflate through the relay...\n");

    Harness h("permessage-deflate");
    assert(h.start_cmds.empty());

    for (int i = 0; i < 3; ++i) {
        std::string text = "compressible compressible compressible " + std::to_string(i);
        auto cmds = h.from_client(h.browser->send(WsMessage{true, bytes(text), true}));
        assert(count_sends(cmds, kServer) == 1);
        assert(std::get<SendData>(cmds[0]).data[0] & 0x40);

        h.deliver(cmds);
        auto evs = h.upstream->events();
        assert(std::get<WsMessage>(evs[0]).data == bytes(text));
        assert(h.flow.websocket.messages.back().text() == text);

        cmds = h.from_server(h.upstream->send(WsMessage{true, bytes(text + " back"), true}));
        h.deliver(cmds);
        evs = h.browser->events();
        assert(std::get<WsMessage>(evs[0]).data == bytes(text + " back"));
    }

    printf("  PASS deflate end to end\n");
}

int main() {
    printf("\n=== WebSocketLayer Tests ===\n\n");

    test_start();
    test_first_event_must_be_start();
    test_fragments_replayed();
    test_fragments_split_by_chunks();
    test_large_single_frame();
    test_modified_message_rechunked();
    test_killed_message();
    test_ping_pong();
    test_ping_inside_fragmented_message();
    test_normal_close();
    test_close_by_server_with_error_code();
    test_abnormal_close();
    test_malformed_frame();
    test_protocol_error();
    test_deflate_end_to_end();

    printf("\nAll WebSocketLayer tests passed!\n");
    return 0;
}
