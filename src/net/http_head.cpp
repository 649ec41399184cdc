#include "net/http_head.hpp"

#include <cctype>
#include <cstdlib>

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// Splits the head into lines and parses every header line after the first.
bool parse_lines(const std::string& text, std::string& start_line, Headers& headers) {
    size_t pos = text.find("\r\n");
    if (pos == std::string::npos) return false;
    start_line = text.substr(0, pos);
    pos += 2;

    while (pos < text.size()) {
        size_t eol = text.find("\r\n", pos);
        if (eol == std::string::npos) eol = text.size();
        if (eol == pos) break;   // blank line ends the head

        std::string line = text.substr(pos, eol - pos);
        pos = eol + 2;

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return false;
        headers.add(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }
    return !start_line.empty();
}

} // namespace

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::string Headers::get(const std::string& name, const std::string& def) const {
    std::string out;
    bool found = false;
    for (const auto& f : fields_) {
        if (!iequals(f.first, name)) continue;
        if (found) out += ", ";
        out += f.second;
        found = true;
    }
    return found ? out : def;
}

bool Headers::contains(const std::string& name) const {
    for (const auto& f : fields_) {
        if (iequals(f.first, name)) return true;
    }
    return false;
}

bool parse_request_head(const std::string& text, HttpHead& out) {
    if (!parse_lines(text, out.start_line, out.headers)) return false;

    size_t sp1 = out.start_line.find(' ');
    size_t sp2 = out.start_line.rfind(' ');
    if (sp1 == std::string::npos || sp2 == sp1) return false;
    out.method = out.start_line.substr(0, sp1);
    out.target = out.start_line.substr(sp1 + 1, sp2 - sp1 - 1);
    return out.start_line.compare(sp2 + 1, 5, "HTTP/") == 0;
}

bool parse_response_head(const std::string& text, HttpHead& out) {
    if (!parse_lines(text, out.start_line, out.headers)) return false;

    // HTTP/1.1 101 Switching Protocols
    if (out.start_line.compare(0, 5, "HTTP/") != 0) return false;
    size_t sp = out.start_line.find(' ');
    if (sp == std::string::npos || sp + 4 > out.start_line.size()) return false;

    std::string code = out.start_line.substr(sp + 1, 3);
    for (char c : code) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    out.status_code = std::atoi(code.c_str());
    return true;
}

std::vector<std::string> split_comma_header(const std::string& value) {
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (quoted && c == '\\' && i + 1 < value.size()) {
            cur += c;
            cur += value[++i];
            continue;
        }
        if (c == '"') quoted = !quoted;
        if (c == ',' && !quoted) {
            std::string t = trim(cur);
            if (!t.empty()) out.push_back(t);
            cur.clear();
            continue;
        }
        cur += c;
    }
    std::string t = trim(cur);
    if (!t.empty()) out.push_back(t);
    return out;
}

bool header_has_token(const std::string& value, const std::string& token) {
    for (const auto& part : split_comma_header(value)) {
        if (iequals(part, token)) return true;
    }
    return false;
}
