#pragma once
#include "ws/frame.hpp"
#include "ws/protocol.hpp"
#include <memory>
#include <string>
#include <vector>

/*
 * Extension
 *
 * Per-connection frame transform negotiated during the handshake. One
 * instance belongs to exactly one connection; compression state is never
 * shared between directions.
 */
class Extension {
public:
    virtual ~Extension() = default;

    virtual const char* name() const = 0;

    // Apply the negotiated parameter string (the full header token).
    virtual void finalize(const std::string& params) = 0;

    // Called once by the owning connection.
    virtual void attach(Role role) = 0;

    // Returns true if the extension claims RSV1 on this frame.
    // Throws ParseFailed if the bit combination is invalid for it.
    virtual bool frame_inbound_header(Opcode op, bool rsv1) = 0;

    virtual ByteVec frame_inbound_payload_data(const ByteVec& data) = 0;

    // Trailing bytes to append once a data frame has been fully read.
    virtual ByteVec frame_inbound_complete(bool fin) = 0;

    // Transforms `data` in place; returns the RSV1 bit to send.
    virtual bool frame_outbound(Opcode op, ByteVec& data, bool fin) = 0;
};

using ExtensionList = std::vector<std::unique_ptr<Extension>>;
