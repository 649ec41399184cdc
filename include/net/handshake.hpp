#pragma once
#include "net/http_head.hpp"
#include <string>

// RFC 6455 4.2.2: base64(SHA-1(key + GUID))
std::string compute_websocket_accept(const std::string& key);

// Does a Sec-WebSocket-Extensions offer name `extension`? Parameters are ignored.
bool offers_extension(const std::string& header, const std::string& extension);

// "101 Switching Protocols" head for a valid upgrade request, ready to send.
// `extensions` is echoed as Sec-WebSocket-Extensions when not empty.
std::string build_upgrade_response(const HttpHead& request, const std::string& extensions);

// Plain error response that closes the connection.
std::string build_error_response(int status, const std::string& reason);
