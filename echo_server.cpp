// WebSocket echo server, the usual upstream for the proxy.
// One client at a time: upgrade, then echo every message fragment back,
// answer pings, and reply to close.

#include "net/handshake.hpp"
#include "net/http_head.hpp"
#include "net/stream_buffer.hpp"
#include "relay/negotiate.hpp"
#include "ws/connection.hpp"

#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unistd.h>
#include <arpa/inet.h>
#include <sys/socket.h>

#define DEFAULT_PORT 8888
#define BUFFER_SIZE 16384
#define MAX_HEAD 65536

static bool write_all(int fd, const byte* data, size_t len) {
    while (len > 0) {
        ssize_t n = send(fd, data, len, MSG_NOSIGNAL);
        if (n <= 0) return false;
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

static bool write_all(int fd, const std::string& s) {
    return write_all(fd, (const byte*)s.data(), s.size());
}

static bool write_all(int fd, const ByteVec& v) {
    return write_all(fd, v.data(), v.size());
}

// Reads the request head; leftover bytes stay in `in`.
static bool read_head(int fd, StreamBuffer& in, std::string& head) {
    byte buffer[BUFFER_SIZE];
    while (true) {
        size_t end = in.find_head_end();
        if (end != 0) {
            ByteVec raw = in.take(end);
            head.assign(raw.begin(), raw.end());
            return true;
        }
        if (in.size() > MAX_HEAD) return false;

        ssize_t n = read(fd, buffer, BUFFER_SIZE);
        if (n <= 0) return false;
        in.append(buffer, static_cast<size_t>(n));
    }
}

// Returns false once the connection should be closed.
static bool echo_events(int fd, WsConnection& ws) {
    for (auto& ev : ws.events()) {
        if (std::holds_alternative<WsMessage>(ev)) {
            if (!write_all(fd, ws.send(ev))) return false;
        } else if (auto* ping = std::get_if<WsPing>(&ev)) {
            if (!write_all(fd, ws.send(WsPong{ping->payload}))) return false;
        } else if (auto* close = std::get_if<WsClose>(&ev)) {
            std::cout << "Close " << close->code << " " << close->reason << std::endl;
            if (ws.state() == ConnectionState::RemoteClosing && !write_all(fd, ws.send(*close)))
                std::cerr << "close reply not delivered" << std::endl;
            return false;
        }
    }
    return true;
}

static void serve_client(int client_fd) {
    StreamBuffer in;
    std::string text;
    HttpHead request;

    if (!read_head(client_fd, in, text) || !parse_request_head(text, request)) {
        if (!write_all(client_fd, build_error_response(400, "Bad Request")))
            std::cerr << "400 not delivered" << std::endl;
        return;
    }

    std::string key = request.headers.get("Sec-WebSocket-Key");
    if (!iequals(request.headers.get("Upgrade"), "websocket") || key.empty()) {
        if (!write_all(client_fd, build_error_response(426, "Upgrade Required")))
            std::cerr << "426 not delivered" << std::endl;
        return;
    }

    std::string accepted;
    if (offers_extension(request.headers.get("Sec-WebSocket-Extensions"), "permessage-deflate"))
        accepted = "permessage-deflate";

    if (!write_all(client_fd, build_upgrade_response(request, accepted))) return;
    std::cout << "Upgraded " << request.target
              << (accepted.empty() ? "" : " (permessage-deflate)") << std::endl;

    NegotiatedExtensions ext = negotiate_extensions(accepted);
    WsConnection ws(Role::Server, std::move(ext.client));

    try {
        if (!in.empty()) {
            ByteVec early = in.take_all();
            ws.receive_data(early.data(), early.size());
            if (!echo_events(client_fd, ws)) return;
        }

        byte buffer[BUFFER_SIZE];
        while (true) {
            ssize_t n = read(client_fd, buffer, BUFFER_SIZE);
            if (n <= 0) {
                ws.receive_eof();
                (void)echo_events(client_fd, ws);   // only the 1006 close remains
                return;
            }
            ws.receive_data(buffer, static_cast<size_t>(n));
            if (!echo_events(client_fd, ws)) return;
        }
    } catch (const ProtocolError& e) {
        std::cerr << "WebSocket error: " << e.what() << std::endl;
    }
}

int main(int argc, char** argv) {
    int port = DEFAULT_PORT;
    if (argc >= 2) {
        port = std::atoi(argv[1]);
        if (port < 1 || port > 65535) {
            std::cerr << "Usage: " << argv[0] << " [port]" << std::endl;
            return 2;
        }
    }

    int server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        perror("socket");
        return 1;
    }

    int opt = 1;
    setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(server_fd, (sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        perror("bind");
        close(server_fd);
        return 1;
    }

    if (listen(server_fd, 5) < 0) {
        perror("listen");
        close(server_fd);
        return 1;
    }

    std::cout << "WebSocket echo server listening on port " << port << std::endl;

    while (true) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept(server_fd, (sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            perror("accept");
            continue;
        }

        std::cout << "Client connected" << std::endl;
        serve_client(client_fd);
        std::cout << "Client disconnected" << std::endl;
        close(client_fd);
    }

    close(server_fd);
    return 0;
}
