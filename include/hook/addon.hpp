#pragma once
#include "relay/flow.hpp"

/*
 * Addon
 *
 * Interception point. All hooks run synchronously inside the relay; the
 * message hook sees the newest message as flow.websocket.messages.back()
 * and may edit its content or kill it.
 */
class Addon {
public:
    virtual ~Addon() = default;

    virtual void websocket_start(Flow&) {}
    virtual void websocket_message(Flow&) {}
    virtual void websocket_end(Flow&) {}
    virtual void websocket_error(Flow&) {}
};
