#include "net/handshake.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <stdexcept>

namespace {

const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string base64(const unsigned char* data, size_t len) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    if (!b64 || !mem) {
        BIO_free(b64);
        BIO_free(mem);
        throw std::runtime_error("BIO_new failed");
    }
    BIO* bio = BIO_push(b64, mem);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data, static_cast<int>(len));
    (void)BIO_flush(bio);

    BUF_MEM* buf = nullptr;
    BIO_get_mem_ptr(bio, &buf);
    std::string out(buf->data, buf->length);

    BIO_free_all(bio);
    return out;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

} // namespace

std::string compute_websocket_accept(const std::string& key) {
    std::string combined = key + kWebSocketGuid;

    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(combined.data()), combined.size(), hash);
    return base64(hash, sizeof(hash));
}

bool offers_extension(const std::string& header, const std::string& extension) {
    for (const auto& item : split_comma_header(header)) {
        if (iequals(trim(item.substr(0, item.find(';'))), extension))
            return true;
    }
    return false;
}

std::string build_upgrade_response(const HttpHead& request, const std::string& extensions) {
    std::string out = "HTTP/1.1 101 Switching Protocols\r\n"
                      "Upgrade: websocket\r\n"
                      "Connection: Upgrade\r\n"
                      "Sec-WebSocket-Accept: " +
                      compute_websocket_accept(trim(request.headers.get("Sec-WebSocket-Key"))) +
                      "\r\n";
    if (!extensions.empty())
        out += "Sec-WebSocket-Extensions: " + extensions + "\r\n";
    out += "\r\n";
    return out;
}

std::string build_error_response(int status, const std::string& reason) {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason +
           "\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
}
