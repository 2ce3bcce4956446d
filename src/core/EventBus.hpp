#pragma once

/**
 * EventBus.hpp
 *
 * Topic-based publish/subscribe with JSON payloads. The Application
 * republishes transfer activity here for presentation layers; each topic is
 * a Signal<json>.
 */

#include "Signal.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace courier::core {

using json = nlohmann::json;

namespace events {
constexpr const char* AppInitialized = "app.initialized";
constexpr const char* AppShutdown = "app.shutdown";
constexpr const char* TransfersState = "transfers.state";
constexpr const char* TransferCompleted = "transfers.completed";
constexpr const char* TransferFailed = "transfers.failed";
} // namespace events

class EventBus {
public:
    using Callback = Signal<json>::Callback;

    // Process-wide bus used when no bus is injected
    static EventBus& instance() {
        static EventBus bus;
        return bus;
    }

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionPtr subscribe(const std::string& topic, Callback callback) {
        return topicSignal(topic).connect(std::move(callback));
    }

    void unsubscribe(const SubscriptionPtr& subscription) {
        if (!subscription) return;

        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [topic, signal] : m_topics) {
            signal->disconnect(subscription);
        }
    }

    /**
     * Deliver payload to the topic's subscribers on the calling thread.
     * Topics nobody subscribed to are dropped.
     */
    void emit(const std::string& topic, const json& payload = json::object()) {
        Signal<json>* signal = nullptr;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_topics.find(topic);
            if (it == m_topics.end()) {
                COURIER_LOG_TRACE("No subscribers for {}", topic);
                return;
            }
            signal = it->second.get();
        }
        signal->emit(payload);
    }

private:
    Signal<json>& topicSignal(const std::string& topic) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& signal = m_topics[topic];
        if (!signal) {
            signal = std::make_unique<Signal<json>>();
        }
        return *signal;
    }

    // Topics are never erased, so Signal pointers stay valid outside the lock
    std::mutex m_mutex;
    std::map<std::string, std::unique_ptr<Signal<json>>> m_topics;
};

} // namespace courier::core
