#pragma once

#include <cstddef>
#include <deque>
#include <string>

namespace mcpbridge {

/**
 * Text frames waiting to be handed to the socket.
 *
 * A non-blocking send may accept only part of a frame; the rest stays at the
 * front of the queue and is written before anything queued after it.
 */
class OutgoingFrames {
public:
    void push(std::string frame);

    bool empty() const { return frames_.empty(); }
    std::size_t size() const { return frames_.size(); }

    // Unwritten bytes of the front frame
    const char* pending_data() const;
    std::size_t pending_size() const;

    // True once part of the front frame has been written
    bool front_started() const { return offset_ > 0; }

    // Marks count more bytes of the front frame as written
    void consume(std::size_t count);

    void clear();

private:
    std::deque<std::string> frames_;
    std::size_t offset_ = 0;
};

// Joins fragments of an incoming message until its last fragment arrives
class MessageAssembler {
public:
    // Returns true when data completes the current message
    bool append(const char* data, std::size_t size, bool final);

    std::string take();

    bool in_progress() const { return !buffer_.empty(); }
    void reset() { buffer_.clear(); }

private:
    std::string buffer_;
};

} // namespace mcpbridge
