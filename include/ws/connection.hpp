#pragma once
#include "ws/extension.hpp"
#include "ws/frame_decoder.hpp"
#include "ws/protocol.hpp"
#include "ws/utf8.hpp"

#include <deque>
#include <random>

/*
 * WsConnection
 *
 * RFC 6455 connection state machine for one endpoint of an already
 * upgraded connection. Starts OPEN. No I/O: bytes in, events out; events
 * in, bytes out.
 */
class WsConnection : public WsProtocol {
public:
    WsConnection(Role role, ExtensionList extensions = ExtensionList());

    Role role() const { return role_; }
    ConnectionState state() const override { return state_; }
    const ExtensionList& extensions() const { return extensions_; }

    void receive_data(const byte* data, size_t len) override;
    void receive_eof() override;
    std::vector<WsEvent> events() override;
    ByteVec send(const WsEvent& event) override;

private:
    WsEvent process_frame(RawFrame frame);
    WsClose parse_close(const ByteVec& payload) const;

    ByteVec send_message(const WsMessage& msg);
    ByteVec send_close(const WsClose& close);
    ByteVec serialize(Opcode op, ByteVec payload, bool fin);

    Role role_;
    ConnectionState state_ = ConnectionState::Open;
    ExtensionList extensions_;

    FrameDecoder decoder_;
    std::deque<WsEvent> pending_;
    bool input_done_ = false;    // close frame seen or parse failure

    // inbound message in progress
    bool in_message_ = false;
    bool message_text_ = false;
    Utf8Validator utf8_;

    // outbound message in progress
    bool out_in_message_ = false;
    bool out_text_ = false;

    std::mt19937 rng_;
};
