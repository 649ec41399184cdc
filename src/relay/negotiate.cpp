#include "relay/negotiate.hpp"
#include "net/http_head.hpp"
#include "ws/deflate.hpp"

#include <memory>

namespace {

std::string extension_name(const std::string& token) {
    std::string name = token.substr(0, token.find(';'));
    size_t b = name.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = name.find_last_not_of(" \t");
    return name.substr(b, e - b + 1);
}

} // namespace

NegotiatedExtensions negotiate_extensions(const std::string& header) {
    NegotiatedExtensions out;
    if (header.empty()) return out;

    for (const auto& token : split_comma_header(header)) {
        std::string name = extension_name(token);
        if (name == PerMessageDeflate::kName) {
            // same parameters, separate compression contexts per direction
            std::unique_ptr<Extension> client_deflate(new PerMessageDeflate());
            client_deflate->finalize(token);
            out.client.push_back(std::move(client_deflate));

            std::unique_ptr<Extension> server_deflate(new PerMessageDeflate());
            server_deflate->finalize(token);
            out.server.push_back(std::move(server_deflate));
        } else {
            out.log.push_back("Ignoring unknown WebSocket extension '" + name + "'.");
        }
    }
    return out;
}
