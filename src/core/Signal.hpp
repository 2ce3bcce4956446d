#pragma once

/**
 * Signal.hpp
 *
 * Typed, thread-safe observer list. Carries queue snapshots and per-transfer
 * progress, and backs every EventBus topic.
 */

#include "Logger.hpp"
#include "Subscription.hpp"

#include <algorithm>
#include <functional>
#include <mutex>
#include <vector>

namespace courier::core {

template<typename... Args>
class Signal {
public:
    using Callback = std::function<void(const Args&...)>;

    Signal() = default;
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /**
     * Register a callback
     * @return Subscription handle for disconnecting
     */
    SubscriptionPtr connect(Callback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto subscription = std::make_shared<Subscription>();
        m_entries.push_back({std::move(callback), subscription});
        return subscription;
    }

    void disconnect(const SubscriptionPtr& subscription) {
        if (!subscription) return;

        subscription->cancel();

        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.erase(
            std::remove_if(m_entries.begin(), m_entries.end(),
                [&subscription](const Entry& entry) {
                    return entry.subscription == subscription;
                }),
            m_entries.end()
        );
    }

    /**
     * Deliver to every active subscriber. Callbacks run outside the lock
     * and may connect/disconnect re-entrantly.
     */
    void emit(const Args&... args) const {
        std::vector<Entry> entries;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            entries = m_entries;
        }

        for (const auto& entry : entries) {
            if (!entry.subscription->isActive()) {
                continue;
            }
            try {
                entry.callback(args...);
            } catch (const std::exception& e) {
                COURIER_LOG_ERROR("Subscriber callback threw: {}", e.what());
            }
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_entries) {
            entry.subscription->cancel();
        }
        m_entries.clear();
    }

private:
    struct Entry {
        Callback callback;
        SubscriptionPtr subscription;
    };

    mutable std::mutex m_mutex;
    std::vector<Entry> m_entries;
};

} // namespace courier::core
