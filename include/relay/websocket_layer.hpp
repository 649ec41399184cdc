#pragma once
#include "hook/addon.hpp"
#include "relay/commands.hpp"
#include "relay/flow.hpp"
#include "relay/peer_codec.hpp"
#include "ws/extension.hpp"

#include <functional>
#include <memory>
#include <vector>

enum class LayerState {
    Start,
    Relaying,
    Done
};

using ProtocolFactory = std::function<std::unique_ptr<WsProtocol>(Role, ExtensionList)>;

// Builds WsConnection instances.
ProtocolFactory default_protocol_factory();

/*
 * WebSocketLayer
 *
 * Relays one upgraded flow between its client and server connection.
 * Each inbound event is handled to completion and answered with the
 * commands the proxy must execute, in order.
 *
 *  START     --Start-->       RELAYING   (extensions negotiated, start hook)
 *  RELAYING  --close frame--> DONE       (both legs closed, end or error hook)
 *  DONE      drains everything
 */
class WebSocketLayer {
public:
    WebSocketLayer(Context ctx, Flow& flow, Addon& hooks,
                   ProtocolFactory factory = default_protocol_factory());

    // Throws std::logic_error if the first event is not Start.
    std::vector<Command> handle_event(const Event& event);

    LayerState state() const { return state_; }

private:
    void start(std::vector<Command>& out);
    void relay(ConnId conn, const ByteVec* data, std::vector<Command>& out);

    void on_message(PeerCodec& src, PeerCodec& dst, bool from_client,
                    WsMessage& msg, std::vector<Command>& out);
    void on_close(PeerCodec& src, PeerCodec& dst, bool from_client,
                  const WsClose& close, std::vector<Command>& out);
    void fail(const std::string& what, std::vector<Command>& out);
    void finish();

    Context ctx_;
    Flow& flow_;
    Addon& hooks_;
    ProtocolFactory factory_;

    LayerState state_ = LayerState::Start;
    std::unique_ptr<PeerCodec> client_ws_;
    std::unique_ptr<PeerCodec> server_ws_;
};
