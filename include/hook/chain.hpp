#pragma once

#include "hook/addon.hpp"
#include <memory>
#include <vector>

// Runs addons in registration order.
class AddonChain : public Addon {
public:
    void add(std::unique_ptr<Addon> a) {
        chain_.push_back(std::move(a));
    }

    size_t size() const { return chain_.size(); }

    void websocket_start(Flow& flow) override {
        for (auto& a : chain_)
            a->websocket_start(flow);
    }

    void websocket_message(Flow& flow) override {
        for (auto& a : chain_)
            a->websocket_message(flow);
    }

    void websocket_end(Flow& flow) override {
        for (auto& a : chain_)
            a->websocket_end(flow);
    }

    void websocket_error(Flow& flow) override {
        for (auto& a : chain_)
            a->websocket_error(flow);
    }

private:
    std::vector<std::unique_ptr<Addon>> chain_;
};
