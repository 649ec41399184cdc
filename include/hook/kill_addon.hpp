#pragma once
#include "hook/addon.hpp"
#include <algorithm>
#include <string>

// Drops messages whose content contains `pattern`.
class KillAddon : public Addon {
public:
    explicit KillAddon(std::string pattern) : pattern_(std::move(pattern)) {}

    void websocket_message(Flow& flow) override {
        Message& m = flow.websocket.messages.back();
        if (pattern_.empty()) return;
        if (std::search(m.content.begin(), m.content.end(), pattern_.begin(), pattern_.end()) !=
            m.content.end()) {
            m.kill();
        }
    }

private:
    std::string pattern_;
};
