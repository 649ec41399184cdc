#include "hook/dump_addon.hpp"
#include "core/escape.hpp"

void DumpAddon::websocket_start(Flow& flow) {
    os_ << "[flow " << flow.id << "] websocket open " << flow.request.target << "\n";
}

void DumpAddon::websocket_message(Flow& flow) {
    const Message& m = flow.websocket.messages.back();
    size_t n = m.content.size() < preview_ ? m.content.size() : preview_;

    os_ << "[flow " << flow.id << "] "
        << (m.from_client() ? "client -> server " : "server -> client ")
        << (m.is_text() ? "text " : "binary ")
        << m.content.size() << "B "
        << escape_bytes(m.content.data(), n)
        << (n < m.content.size() ? "..." : "")
        << (m.killed ? " [killed]" : "")
        << "\n";
}

void DumpAddon::websocket_end(Flow& flow) {
    os_ << "[flow " << flow.id << "] websocket closed by "
        << (flow.websocket.closed_by_client ? "client" : "server")
        << " (code " << flow.websocket.close_code << ")\n";
}

void DumpAddon::websocket_error(Flow& flow) {
    os_ << "[flow " << flow.id << "] " << flow.error.value_or("WebSocket Error") << "\n";
}
