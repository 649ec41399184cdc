#pragma once
#include "ws/extension.hpp"
#include <string>
#include <vector>

struct NegotiatedExtensions {
    ExtensionList client;              // for the client-facing connection
    ExtensionList server;              // for the server-facing connection
    std::vector<std::string> log;      // one line per ignored extension
};

// Build per-direction extension instances from the Sec-WebSocket-Extensions
// response header. Only permessage-deflate is supported; anything else is
// logged and skipped.
NegotiatedExtensions negotiate_extensions(const std::string& header);
