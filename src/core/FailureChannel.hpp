#ifndef FAILURECHANNEL_HPP
#define FAILURECHANNEL_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

#include "../models/CachingFailure.hpp"

// Subscribable channel for absorbed failures. publish() invokes every handler
// synchronously on the calling thread.
class FailureChannel {
public:
    using Handler = std::function<void(const CachingFailure&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(Handler handler);
    bool unsubscribe(SubscriptionId id);
    void publish(const CachingFailure& failure) const;
    std::size_t subscriberCount() const;

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_ = 1;
};

#endif // FAILURECHANNEL_HPP
