#include "ws/close_reason.hpp"

namespace {

struct CloseName {
    int code;
    const char* name;
};

const CloseName kCloseNames[] = {
    {1000, "NORMAL_CLOSURE"},
    {1001, "GOING_AWAY"},
    {1002, "PROTOCOL_ERROR"},
    {1003, "UNSUPPORTED_DATA"},
    {1005, "NO_STATUS_RCVD"},
    {1006, "ABNORMAL_CLOSURE"},
    {1007, "INVALID_FRAME_PAYLOAD_DATA"},
    {1008, "POLICY_VIOLATION"},
    {1009, "MESSAGE_TOO_BIG"},
    {1010, "MANDATORY_EXT"},
    {1011, "INTERNAL_ERROR"},
    {1012, "SERVICE_RESTART"},
    {1013, "TRY_AGAIN_LATER"},
    {1015, "TLS_HANDSHAKE_FAILED"},
};

} // namespace

const char* close_reason_name(int code) {
    for (const auto& c : kCloseNames) {
        if (c.code == code) return c.name;
    }
    return nullptr;
}

bool is_valid_remote_close_code(int code) {
    if (code < 1000) return false;
    // reserved for local use, never on the wire
    if (code == 1005 || code == 1006 || code == 1015) return false;
    if (close_reason_name(code)) return true;
    return code >= 3000 && code <= 4999;
}

std::string format_close(int code, const std::string& reason) {
    std::string ret;
    if (const char* name = close_reason_name(code)) {
        ret = name;
    } else {
        ret = "UNKNOWN_ERROR=" + std::to_string(code);
    }
    if (!reason.empty()) {
        ret += " (reason: " + reason + ")";
    }
    return ret;
}
