/**
 * CancellationToken.cpp
 */

#include "CancellationToken.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace courier::core::transfer {

bool CancellationToken::cancel(const std::optional<std::string>& reason) {
    std::map<CallbackId, Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled.load(std::memory_order_relaxed)) {
            return false;
        }
        m_reason = reason;
        m_cancelled.store(true, std::memory_order_release);
        callbacks.swap(m_callbacks);
    }
    m_condition.notify_all();

    for (auto& [id, callback] : callbacks) {
        try {
            callback();
        } catch (const std::exception& e) {
            COURIER_LOG_ERROR("Cancellation callback {} threw: {}", id, e.what());
        }
    }
    return true;
}

std::optional<std::string> CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reason;
}

CancellationToken::CallbackId CancellationToken::onCancel(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_cancelled.load(std::memory_order_relaxed)) {
            CallbackId id = m_nextCallbackId++;
            m_callbacks.emplace(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

bool CancellationToken::removeCallback(CallbackId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_callbacks.erase(id) > 0;
}

void CancellationToken::throwIfCancelled() const {
    if (isCancelled()) {
        throw CancellationException(reason());
    }
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_condition.wait_for(lock, timeout, [this] {
        return m_cancelled.load(std::memory_order_acquire);
    });
}

std::shared_ptr<CancellationToken> CancellationToken::createLinked() {
    auto linked = std::make_shared<CancellationToken>();
    std::weak_ptr<CancellationToken> weak = linked;

    onCancel([this, weak] {
        if (auto child = weak.lock()) {
            child->cancel(reason());
        }
    });
    return linked;
}

// -- CancellationTokenSource --

std::shared_ptr<CancellationToken> CancellationTokenSource::createToken() {
    auto token = std::make_shared<CancellationToken>();
    bool cancelled = false;
    std::optional<std::string> reason;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tokens.erase(
            std::remove_if(m_tokens.begin(), m_tokens.end(),
                [](const std::weak_ptr<CancellationToken>& t) { return t.expired(); }),
            m_tokens.end()
        );
        m_tokens.push_back(token);
        cancelled = m_cancelled;
        reason = m_reason;
    }

    if (cancelled) {
        token->cancel(reason);
    }
    return token;
}

void CancellationTokenSource::cancelAll(const std::optional<std::string>& reason) {
    std::vector<std::shared_ptr<CancellationToken>> tokens;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled) return;
        m_cancelled = true;
        m_reason = reason;
        for (auto& weak : m_tokens) {
            if (auto token = weak.lock()) {
                tokens.push_back(std::move(token));
            }
        }
    }

    for (auto& token : tokens) {
        token->cancel(reason);
    }
}

bool CancellationTokenSource::isCancelled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

size_t CancellationTokenSource::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_tokens.begin(), m_tokens.end(),
        [](const std::weak_ptr<CancellationToken>& t) { return !t.expired(); }));
}

} // namespace courier::core::transfer
