#include "ws/connection.hpp"
#include "ws/close_reason.hpp"
#include "ws/frame_encoder.hpp"

#include <iterator>
#include <string>

const char* to_string(ConnectionState s) {
    switch (s) {
        case ConnectionState::Connecting:    return "CONNECTING";
        case ConnectionState::Open:          return "OPEN";
        case ConnectionState::RemoteClosing: return "REMOTE_CLOSING";
        case ConnectionState::LocalClosing:  return "LOCAL_CLOSING";
        case ConnectionState::Closed:        return "CLOSED";
        case ConnectionState::Rejecting:     return "REJECTING";
    }
    return "UNKNOWN";
}

const char* event_name(const WsEvent& ev) {
    if (std::holds_alternative<WsMessage>(ev))
        return std::get<WsMessage>(ev).text ? "TextMessage" : "BytesMessage";
    if (std::holds_alternative<WsPing>(ev)) return "Ping";
    if (std::holds_alternative<WsPong>(ev)) return "Pong";
    return "CloseConnection";
}

WsConnection::WsConnection(Role role, ExtensionList extensions)
    : role_(role), extensions_(std::move(extensions)), rng_(std::random_device{}()) {
    for (auto& ext : extensions_)
        ext->attach(role_);
}

// ---------- inbound ----------

void WsConnection::receive_data(const byte* data, size_t len) {
    if (state_ == ConnectionState::Closed)
        throw ProtocolError("Connection already closed.");

    // after the peer's close only our own close reply is expected
    if (state_ != ConnectionState::Open && state_ != ConnectionState::LocalClosing)
        return;
    if (!input_done_)
        decoder_.push(data, len);
}

void WsConnection::receive_eof() {
    // RFC 6455 7.1.5: no close frame received means 1006
    pending_.push_back(WsClose{1006, ""});
    state_ = ConnectionState::Closed;
    input_done_ = true;
}

std::vector<WsEvent> WsConnection::events() {
    std::vector<WsEvent> out(std::make_move_iterator(pending_.begin()),
                             std::make_move_iterator(pending_.end()));
    pending_.clear();

    try {
        while (!input_done_ && decoder_.has_frame())
            out.push_back(process_frame(decoder_.pop()));
    } catch (const ParseFailed& e) {
        input_done_ = true;
        out.push_back(WsClose{e.code(), e.what()});
    }
    return out;
}

WsEvent WsConnection::process_frame(RawFrame f) {
    const FrameHeader& h = f.header;

    if (!is_known_opcode(h.opcode))
        throw ParseFailed("Invalid opcode " + std::to_string(h.opcode));
    Opcode op = f.opcode();

    if (role_ == Role::Server && !h.masked)
        throw ParseFailed("Client sent unmasked frame");
    if (role_ == Role::Client && h.masked)
        throw ParseFailed("Server sent masked frame");

    bool rsv1_claimed = false;
    for (auto& ext : extensions_)
        rsv1_claimed = ext->frame_inbound_header(op, h.rsv1) || rsv1_claimed;
    if ((h.rsv1 && !rsv1_claimed) || h.rsv2 || h.rsv3)
        throw ParseFailed("Reserved bit set unexpectedly");

    if (is_control(op)) {
        if (!h.fin)
            throw ParseFailed("Invalid attempt to fragment control frame");
        if (f.payload.size() > kMaxControlPayload)
            throw ParseFailed("Control frame with payload len > 125");

        if (op == Opcode::Ping) return WsPing{std::move(f.payload)};
        if (op == Opcode::Pong) return WsPong{std::move(f.payload)};

        WsClose close = parse_close(f.payload);
        state_ = state_ == ConnectionState::LocalClosing ? ConnectionState::Closed
                                                         : ConnectionState::RemoteClosing;
        input_done_ = true;
        return close;
    }

    if (op == Opcode::Continuation && !in_message_)
        throw ParseFailed("Unexpected CONTINUATION");
    if (op != Opcode::Continuation && in_message_)
        throw ParseFailed("Expected CONTINUATION, got opcode " + std::to_string(h.opcode));

    if (op != Opcode::Continuation) {
        in_message_ = true;
        message_text_ = op == Opcode::Text;
        utf8_.reset();
    }

    ByteVec data = std::move(f.payload);
    for (auto& ext : extensions_)
        data = ext->frame_inbound_payload_data(data);
    for (auto& ext : extensions_) {
        ByteVec tail = ext->frame_inbound_complete(h.fin);
        data.insert(data.end(), tail.begin(), tail.end());
    }

    if (message_text_) {
        ByteVec valid;
        if (!utf8_.feed(data, valid) || (h.fin && !utf8_.complete()))
            throw ParseFailed("Invalid UTF-8 in text message", 1007);
        data.swap(valid);
    }

    if (h.fin)
        in_message_ = false;

    WsMessage msg;
    msg.text = message_text_;
    msg.data = std::move(data);
    msg.message_finished = h.fin;
    return msg;
}

WsClose WsConnection::parse_close(const ByteVec& payload) const {
    WsClose close;
    if (payload.empty()) {
        close.code = 1005;
        return close;
    }
    if (payload.size() == 1)
        throw ParseFailed("CLOSE with 1 byte payload");

    close.code = (int(payload[0]) << 8) | int(payload[1]);
    if (close.code < 1000)
        throw ParseFailed("CLOSE with invalid code");
    if (!is_valid_remote_close_code(close.code))
        throw ParseFailed("CLOSE with unknown reserved code " + std::to_string(close.code));

    ByteVec reason(payload.begin() + 2, payload.end());
    ByteVec valid;
    Utf8Validator v;
    if (!v.feed(reason, valid) || !v.complete())
        throw ParseFailed("Error decoding CLOSE reason", 1007);
    close.reason.assign(valid.begin(), valid.end());
    return close;
}

// ---------- outbound ----------

ByteVec WsConnection::send(const WsEvent& event) {
    bool allowed = false;
    if (std::holds_alternative<WsClose>(event)) {
        allowed = state_ == ConnectionState::Open || state_ == ConnectionState::RemoteClosing;
    } else {
        allowed = state_ == ConnectionState::Open;
    }
    if (!allowed) {
        throw ProtocolError(std::string("Event ") + event_name(event) +
                            " cannot be sent in state " + to_string(state_) + ".");
    }

    if (auto* m = std::get_if<WsMessage>(&event))
        return send_message(*m);
    if (auto* c = std::get_if<WsClose>(&event))
        return send_close(*c);

    const ByteVec& payload = std::holds_alternative<WsPing>(event)
                                 ? std::get<WsPing>(event).payload
                                 : std::get<WsPong>(event).payload;
    if (payload.size() > kMaxControlPayload)
        throw ProtocolError("Control frame payload exceeds 125 bytes");
    Opcode op = std::holds_alternative<WsPing>(event) ? Opcode::Ping : Opcode::Pong;
    return serialize(op, payload, true);
}

ByteVec WsConnection::send_message(const WsMessage& msg) {
    Opcode op;
    if (!out_in_message_) {
        op = msg.text ? Opcode::Text : Opcode::Binary;
        out_text_ = msg.text;
    } else {
        if (msg.text != out_text_)
            throw ProtocolError("Data type mismatch inside message");
        op = Opcode::Continuation;
    }
    out_in_message_ = !msg.message_finished;
    return serialize(op, msg.data, msg.message_finished);
}

ByteVec WsConnection::send_close(const WsClose& close) {
    ByteVec payload;
    if (close.code != 1005) {
        payload.push_back(static_cast<byte>(close.code >> 8));
        payload.push_back(static_cast<byte>(close.code));

        // reason must fit the control frame; cut on a UTF-8 boundary
        size_t n = close.reason.size();
        const size_t room = kMaxControlPayload - 2;
        if (n > room) {
            n = room;
            while (n > 0 && (static_cast<byte>(close.reason[n]) & 0xC0) == 0x80)
                --n;
        }
        payload.insert(payload.end(), close.reason.begin(), close.reason.begin() + n);
    }

    state_ = state_ == ConnectionState::RemoteClosing ? ConnectionState::Closed
                                                      : ConnectionState::LocalClosing;
    return serialize(Opcode::Close, std::move(payload), true);
}

ByteVec WsConnection::serialize(Opcode op, ByteVec payload, bool fin) {
    bool rsv1 = false;
    for (auto& ext : extensions_)
        rsv1 = ext->frame_outbound(op, payload, fin) || rsv1;

    if (role_ == Role::Client) {
        uint32_t r = rng_();
        byte mask[4] = {byte(r >> 24), byte(r >> 16), byte(r >> 8), byte(r)};
        return encode_frame(op, fin, rsv1, payload, mask);
    }
    return encode_frame(op, fin, rsv1, payload, nullptr);
}
