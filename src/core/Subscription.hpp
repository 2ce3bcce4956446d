#pragma once

/**
 * Subscription.hpp
 *
 * Handle returned by Signal::connect and EventBus::subscribe.
 */

#include <atomic>
#include <memory>

namespace courier::core {

/**
 * Cancelling the handle stops delivery at once, even for an emit already in
 * progress on another thread; the publisher drops the entry on disconnect.
 */
class Subscription {
public:
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    std::atomic<bool> m_active{true};
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

} // namespace courier::core
