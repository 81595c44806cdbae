#pragma once

#include <chrono>

namespace mcpbridge {

// Delay for reconnect attempt n: min(base * 2^n, max)
std::chrono::milliseconds backoff_delay(unsigned attempt,
                                        std::chrono::milliseconds base,
                                        std::chrono::milliseconds max);

// Reconnect attempt counter with exponential backoff
class ReconnectBackoff {
public:
    ReconnectBackoff(std::chrono::milliseconds base_delay = std::chrono::milliseconds(1000),
                     std::chrono::milliseconds max_delay = std::chrono::milliseconds(30000));

    std::chrono::milliseconds next_delay() const;
    unsigned attempt() const { return attempt_; }

    void increment() { ++attempt_; }
    void reset() { attempt_ = 0; }

    std::chrono::milliseconds base_delay() const { return base_delay_; }
    std::chrono::milliseconds max_delay() const { return max_delay_; }

private:
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    unsigned attempt_;
};

} // namespace mcpbridge
