#pragma once
#include <string>
#include <utility>
#include <vector>

/*
 * Minimal HTTP/1.1 head model, enough to pass an Upgrade handshake through
 * and read the negotiated WebSocket headers back.
 */
class Headers {
public:
    void add(std::string name, std::string value) {
        fields_.emplace_back(std::move(name), std::move(value));
    }

    // All values for `name` (case-insensitive) joined with ", ".
    std::string get(const std::string& name, const std::string& def = "") const;

    bool contains(const std::string& name) const;

    const std::vector<std::pair<std::string, std::string>>& fields() const { return fields_; }

private:
    std::vector<std::pair<std::string, std::string>> fields_;
};

struct HttpHead {
    std::string start_line;
    std::string method;        // requests only
    std::string target;        // requests only
    int status_code = 0;       // responses only
    Headers headers;
};

// Both return false if the start line or a header line is malformed.
bool parse_request_head(const std::string& text, HttpHead& out);
bool parse_response_head(const std::string& text, HttpHead& out);

// Split a comma separated header value; commas inside quoted strings are kept.
std::vector<std::string> split_comma_header(const std::string& value);

// Does a comma separated header value contain `token` (case-insensitive)?
bool header_has_token(const std::string& value, const std::string& token);

bool iequals(const std::string& a, const std::string& b);
