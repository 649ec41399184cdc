#include "relay/fragmentizer.hpp"
#include "ws/utf8.hpp"

#include <numeric>
#include <stdexcept>

Fragmentizer::Fragmentizer(std::vector<size_t> fragment_lengths, bool is_text)
    : fragment_lengths_(std::move(fragment_lengths)), is_text_(is_text) {
    if (fragment_lengths_.empty())
        throw std::invalid_argument("Fragmentizer needs at least one fragment length");
    total_ = std::accumulate(fragment_lengths_.begin(), fragment_lengths_.end(), size_t(0));
}

WsMessage Fragmentizer::part(const ByteVec& content, size_t offset, size_t len,
                             bool finished) const {
    WsMessage m;
    m.text = is_text_;
    m.message_finished = finished;
    if (is_text_) {
        m.data = sanitize_utf8(content.data() + offset, len);
    } else {
        m.data.assign(content.begin() + offset, content.begin() + offset + len);
    }
    return m;
}

std::vector<WsMessage> Fragmentizer::operator()(const ByteVec& content) const {
    std::vector<WsMessage> out;
    if (content.empty()) return out;

    size_t offset = 0;
    if (content.size() == total_) {
        // same length: replay the original boundaries
        for (size_t i = 0; i + 1 < fragment_lengths_.size(); ++i) {
            out.push_back(part(content, offset, fragment_lengths_[i], false));
            offset += fragment_lengths_[i];
        }
    } else {
        while (content.size() - offset > kFragmentSize) {
            out.push_back(part(content, offset, kFragmentSize, false));
            offset += kFragmentSize;
        }
    }
    out.push_back(part(content, offset, content.size() - offset, true));
    return out;
}
