#include <mcpbridge/frame_buffer.hpp>

#include <algorithm>

namespace mcpbridge {

void OutgoingFrames::push(std::string frame) {
    frames_.push_back(std::move(frame));
}

const char* OutgoingFrames::pending_data() const {
    if (frames_.empty()) {
        return nullptr;
    }
    return frames_.front().data() + offset_;
}

std::size_t OutgoingFrames::pending_size() const {
    if (frames_.empty()) {
        return 0;
    }
    return frames_.front().size() - offset_;
}

void OutgoingFrames::consume(std::size_t count) {
    if (frames_.empty()) {
        return;
    }
    offset_ += std::min(count, pending_size());
    if (offset_ == frames_.front().size()) {
        frames_.pop_front();
        offset_ = 0;
    }
}

void OutgoingFrames::clear() {
    frames_.clear();
    offset_ = 0;
}

bool MessageAssembler::append(const char* data, std::size_t size, bool final) {
    buffer_.append(data, size);
    return final;
}

std::string MessageAssembler::take() {
    std::string message;
    message.swap(buffer_);
    return message;
}

} // namespace mcpbridge
