#pragma once
#include "hook/addon.hpp"
#include <algorithm>
#include <string>

// Replaces every occurrence of `from` with `to` in message content.
class ReplaceAddon : public Addon {
public:
    ReplaceAddon(std::string from, std::string to, bool text_only = false)
        : from_(std::move(from)), to_(std::move(to)), text_only_(text_only) {}

    void websocket_message(Flow& flow) override {
        Message& m = flow.websocket.messages.back();
        if (from_.empty() || (text_only_ && !m.is_text()))
            return;

        ByteVec out;
        out.reserve(m.content.size());
        auto it = m.content.begin();
        while (true) {
            auto hit = std::search(it, m.content.end(), from_.begin(), from_.end());
            out.insert(out.end(), it, hit);
            if (hit == m.content.end()) break;
            out.insert(out.end(), to_.begin(), to_.end());
            it = hit + from_.size();
        }
        m.content.swap(out);
    }

private:
    std::string from_;
    std::string to_;
    bool text_only_;
};
