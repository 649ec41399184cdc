#pragma once
#include "hook/addon.hpp"
#include <iostream>

// One line per message and per session transition.
class DumpAddon : public Addon {
public:
    explicit DumpAddon(std::ostream& os = std::cout, size_t preview = 80)
        : os_(os), preview_(preview) {}

    void websocket_start(Flow& flow) override;
    void websocket_message(Flow& flow) override;
    void websocket_end(Flow& flow) override;
    void websocket_error(Flow& flow) override;

private:
    std::ostream& os_;
    size_t preview_;
};
