#pragma once
#include "core/types.hpp"
#include <cstdio>
#include <string>

// Render bytes as b'...' with non-printable bytes hex escaped.
inline std::string escape_bytes(const byte* p, size_t n) {
    std::string out = "b'";
    for (size_t i = 0; i < n; ++i) {
        byte c = p[i];
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c >= 0x20 && c < 0x7f) {
                    out += static_cast<char>(c);
                } else {
                    char hex[5];
                    std::snprintf(hex, sizeof(hex), "\\x%02x", c);
                    out += hex;
                }
        }
    }
    out += "'";
    return out;
}

inline std::string escape_bytes(const ByteVec& v) {
    return escape_bytes(v.data(), v.size());
}
