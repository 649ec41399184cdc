#pragma once
#include "ws/extension.hpp"
#include <memory>

struct z_stream_s;

/*
 * PerMessageDeflate (RFC 7692)
 *
 * Raw deflate per message, with optional context takeover and window size
 * limits for either side.
 */
class PerMessageDeflate : public Extension {
public:
    static constexpr const char* kName = "permessage-deflate";
    static constexpr int kDefaultWindowBits = 15;

    PerMessageDeflate();
    ~PerMessageDeflate() override;

    PerMessageDeflate(const PerMessageDeflate&) = delete;
    PerMessageDeflate& operator=(const PerMessageDeflate&) = delete;

    const char* name() const override { return kName; }

    void finalize(const std::string& params) override;
    void attach(Role role) override { role_ = role; }

    bool frame_inbound_header(Opcode op, bool rsv1) override;
    ByteVec frame_inbound_payload_data(const ByteVec& data) override;
    ByteVec frame_inbound_complete(bool fin) override;
    bool frame_outbound(Opcode op, ByteVec& data, bool fin) override;

    int client_max_window_bits() const { return client_max_window_bits_; }
    int server_max_window_bits() const { return server_max_window_bits_; }
    bool client_no_context_takeover() const { return client_no_context_takeover_; }
    bool server_no_context_takeover() const { return server_no_context_takeover_; }

private:
    using ZStream = std::unique_ptr<z_stream_s, void (*)(z_stream_s*)>;

    int inbound_window_bits() const;
    int outbound_window_bits() const;
    bool inbound_no_context_takeover() const;
    bool outbound_no_context_takeover() const;

    ByteVec inflate_bytes(const byte* data, size_t len);

    Role role_ = Role::Client;

    int client_max_window_bits_ = kDefaultWindowBits;
    int server_max_window_bits_ = kDefaultWindowBits;
    bool client_no_context_takeover_ = false;
    bool server_no_context_takeover_ = false;

    bool inbound_compressed_ = false;

    ZStream inflater_;
    ZStream deflater_;
};
