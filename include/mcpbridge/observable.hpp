#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace mcpbridge {

using SubscriptionId = std::size_t;

/**
 * Value holder with a subscriber list.
 *
 * subscribe() calls the new subscriber once with the current value, and
 * every subscriber again on each set() that changes the value. Not
 * thread-safe: used from the event loop only.
 */
template <typename T>
class Observable {
public:
    using Callback = std::function<void(const T&)>;

    explicit Observable(T initial = T())
        : value_(std::move(initial)), next_id_(1) {
    }

    const T& get() const { return value_; }

    // Returns false when the value did not change and nobody was notified
    bool set(T value) {
        if (value == value_) {
            return false;
        }
        value_ = std::move(value);

        // Copy so subscribers may (un)subscribe from inside the callback
        auto subscribers = subscribers_;
        for (const auto& entry : subscribers) {
            entry.second(value_);
        }
        return true;
    }

    SubscriptionId subscribe(Callback callback) {
        SubscriptionId id = next_id_++;
        subscribers_.emplace_back(id, callback);
        callback(value_);
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
            if (it->first == id) {
                subscribers_.erase(it);
                return true;
            }
        }
        return false;
    }

    std::size_t subscriber_count() const { return subscribers_.size(); }

private:
    T value_;
    SubscriptionId next_id_;
    std::vector<std::pair<SubscriptionId, Callback>> subscribers_;
};

} // namespace mcpbridge
