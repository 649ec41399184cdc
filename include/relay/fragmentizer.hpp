#pragma once
#include "ws/events.hpp"
#include <vector>

/*
 * Fragmentizer
 *
 * RFC 6455 lets intermediaries re-split frames, but some servers reject
 * payload sizes they did not expect. Unmodified content is therefore sent
 * with the original fragment lengths; modified content is cut into
 * kFragmentSize parts.
 */
class Fragmentizer {
public:
    // A bit less than 4 KiB to leave room for frame headers.
    static constexpr size_t kFragmentSize = 4000;

    // Throws std::invalid_argument on an empty profile.
    Fragmentizer(std::vector<size_t> fragment_lengths, bool is_text);

    std::vector<WsMessage> operator()(const ByteVec& content) const;

private:
    WsMessage part(const ByteVec& content, size_t offset, size_t len, bool finished) const;

    std::vector<size_t> fragment_lengths_;
    size_t total_ = 0;
    bool is_text_;
};
