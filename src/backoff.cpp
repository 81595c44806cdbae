#include <mcpbridge/backoff.hpp>

namespace mcpbridge {

std::chrono::milliseconds backoff_delay(unsigned attempt,
                                        std::chrono::milliseconds base,
                                        std::chrono::milliseconds max) {
    if (base >= max) {
        return max;
    }

    // Doubling stops once max is reached, so large attempts cannot overflow
    std::chrono::milliseconds delay = base;
    for (unsigned i = 0; i < attempt; ++i) {
        delay *= 2;
        if (delay >= max) {
            return max;
        }
    }
    return delay;
}

ReconnectBackoff::ReconnectBackoff(std::chrono::milliseconds base_delay,
                                   std::chrono::milliseconds max_delay)
    : base_delay_(base_delay), max_delay_(max_delay), attempt_(0) {
}

std::chrono::milliseconds ReconnectBackoff::next_delay() const {
    return backoff_delay(attempt_, base_delay_, max_delay_);
}

} // namespace mcpbridge
