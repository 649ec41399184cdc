#include "ws/deflate.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstdlib>
#include <string>

namespace {

const byte kTail[4] = {0x00, 0x00, 0xff, 0xff};
const size_t kChunk = 16 * 1024;

void end_inflate(z_stream_s* z) {
    if (z) {
        inflateEnd(z);
        delete z;
    }
}

void end_deflate(z_stream_s* z) {
    if (z) {
        deflateEnd(z);
        delete z;
    }
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// Window bits parameter value, or `fallback` if missing or out of range.
int parse_window_bits(const std::string& value, int fallback) {
    std::string v = trim(value);
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"')
        v = v.substr(1, v.size() - 2);
    if (v.empty()) return fallback;

    char* end = nullptr;
    long n = std::strtol(v.c_str(), &end, 10);
    if (*end != '\0' || n < 8 || n > 15) return fallback;
    return static_cast<int>(n);
}

// zlib refuses 8 for raw deflate streams
int zlib_window_bits(int bits) {
    return bits < 9 ? 9 : bits;
}

} // namespace

PerMessageDeflate::PerMessageDeflate()
    : inflater_(nullptr, end_inflate), deflater_(nullptr, end_deflate) {}

PerMessageDeflate::~PerMessageDeflate() = default;

void PerMessageDeflate::finalize(const std::string& params) {
    size_t pos = params.find(';');
    while (pos != std::string::npos) {
        size_t next = params.find(';', pos + 1);
        std::string bit = trim(params.substr(pos + 1, next == std::string::npos
                                                           ? std::string::npos
                                                           : next - pos - 1));
        pos = next;

        std::string key = bit;
        std::string value;
        size_t eq = bit.find('=');
        if (eq != std::string::npos) {
            key = trim(bit.substr(0, eq));
            value = bit.substr(eq + 1);
        }

        if (key == "client_no_context_takeover") {
            client_no_context_takeover_ = true;
        } else if (key == "server_no_context_takeover") {
            server_no_context_takeover_ = true;
        } else if (key == "client_max_window_bits") {
            client_max_window_bits_ = parse_window_bits(value, client_max_window_bits_);
        } else if (key == "server_max_window_bits") {
            server_max_window_bits_ = parse_window_bits(value, server_max_window_bits_);
        }
    }
}

// Inbound data was produced by the peer, so the peer's side parameters apply.
int PerMessageDeflate::inbound_window_bits() const {
    return role_ == Role::Client ? server_max_window_bits_ : client_max_window_bits_;
}

int PerMessageDeflate::outbound_window_bits() const {
    return role_ == Role::Client ? client_max_window_bits_ : server_max_window_bits_;
}

bool PerMessageDeflate::inbound_no_context_takeover() const {
    return role_ == Role::Client ? server_no_context_takeover_ : client_no_context_takeover_;
}

bool PerMessageDeflate::outbound_no_context_takeover() const {
    return role_ == Role::Client ? client_no_context_takeover_ : server_no_context_takeover_;
}

bool PerMessageDeflate::frame_inbound_header(Opcode op, bool rsv1) {
    if (rsv1 && is_control(op))
        throw ParseFailed("RSV1 set on a control frame");
    if (rsv1 && op == Opcode::Continuation)
        throw ParseFailed("RSV1 set on a continuation frame");

    if (op == Opcode::Text || op == Opcode::Binary)
        inbound_compressed_ = rsv1;
    return rsv1;
}

ByteVec PerMessageDeflate::inflate_bytes(const byte* data, size_t len) {
    if (!inflater_) {
        ZStream z(new z_stream_s(), end_inflate);
        if (inflateInit2(z.get(), -zlib_window_bits(inbound_window_bits())) != Z_OK) {
            throw ProtocolError("inflateInit2 failed");
        }
        inflater_ = std::move(z);
    }

    z_stream_s* z = inflater_.get();
    z->next_in = const_cast<Bytef*>(data);
    z->avail_in = static_cast<uInt>(len);

    ByteVec out;
    byte buf[kChunk];
    do {
        z->next_out = buf;
        z->avail_out = kChunk;
        int ret = inflate(z, Z_SYNC_FLUSH);
        if (ret != Z_OK && ret != Z_BUF_ERROR && ret != Z_STREAM_END)
            throw ParseFailed("Decompression failed", 1007);
        out.insert(out.end(), buf, buf + (kChunk - z->avail_out));
        if (ret == Z_BUF_ERROR || ret == Z_STREAM_END) break;
    } while (z->avail_in > 0 || z->avail_out == 0);

    return out;
}

ByteVec PerMessageDeflate::frame_inbound_payload_data(const ByteVec& data) {
    if (!inbound_compressed_) return data;
    return inflate_bytes(data.data(), data.size());
}

ByteVec PerMessageDeflate::frame_inbound_complete(bool fin) {
    if (!fin || !inbound_compressed_) return ByteVec();

    ByteVec out = inflate_bytes(kTail, sizeof(kTail));
    if (inbound_no_context_takeover())
        inflater_.reset();
    return out;
}

bool PerMessageDeflate::frame_outbound(Opcode op, ByteVec& data, bool fin) {
    if (op != Opcode::Text && op != Opcode::Binary && op != Opcode::Continuation)
        return false;

    if (!deflater_) {
        ZStream z(new z_stream_s(), end_deflate);
        if (deflateInit2(z.get(), Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                         -zlib_window_bits(outbound_window_bits()), 8,
                         Z_DEFAULT_STRATEGY) != Z_OK) {
            throw ProtocolError("deflateInit2 failed");
        }
        deflater_ = std::move(z);
    }

    z_stream_s* z = deflater_.get();
    z->next_in = data.data();
    z->avail_in = static_cast<uInt>(data.size());

    ByteVec out;
    byte buf[kChunk];
    do {
        z->next_out = buf;
        z->avail_out = kChunk;
        if (deflate(z, Z_SYNC_FLUSH) == Z_STREAM_ERROR)
            throw ProtocolError("deflate failed");
        out.insert(out.end(), buf, buf + (kChunk - z->avail_out));
    } while (z->avail_out == 0);

    if (fin) {
        if (out.size() >= 4 && std::equal(out.end() - 4, out.end(), kTail))
            out.resize(out.size() - 4);
        if (outbound_no_context_takeover())
            deflater_.reset();
    }

    data.swap(out);
    return op != Opcode::Continuation;
}
