#include "FailureChannel.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

FailureChannel::SubscriptionId FailureChannel::subscribe(Handler handler) {
    if (!handler) {
        throw std::invalid_argument("Failure handler cannot be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

bool FailureChannel::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.erase(id) > 0;
}

void FailureChannel::publish(const CachingFailure& failure) const {
    // Copy out so handlers may (un)subscribe without deadlocking
    std::vector<Handler> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(handlers_.size());
        for (const auto& [id, handler] : handlers_) {
            snapshot.push_back(handler);
        }
    }
    for (const auto& handler : snapshot) {
        handler(failure);
    }
}

std::size_t FailureChannel::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}
