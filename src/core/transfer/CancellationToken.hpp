#pragma once

/**
 * CancellationToken.hpp
 *
 * Cooperative cancellation signal shared between the scheduler and executors.
 *
 * Executors MUST poll isCancelled() (or throwIfCancelled()) at their natural
 * suspension points, e.g. between I/O chunks, and finish their progress
 * sequence with a cancelled status. Setting the flag never interrupts a
 * running executor; one that never polls keeps its concurrency slot until it
 * returns on its own.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace courier::core::transfer {

/**
 * Thrown by CancellationToken::throwIfCancelled()
 */
class CancellationException : public std::runtime_error {
public:
    explicit CancellationException(const std::optional<std::string>& reason)
        : std::runtime_error(reason ? "Operation cancelled: " + *reason
                                    : "Operation was cancelled")
        , m_reason(reason) {}

    const std::optional<std::string>& reason() const { return m_reason; }

private:
    std::optional<std::string> m_reason;
};

/**
 * CancellationToken - one-way latch with an optional reason
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;
    using CallbackId = uint64_t;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * Request cancellation. Only the first call has an effect.
     * @param reason Optional human-readable reason
     * @return true if this call flipped the latch
     */
    bool cancel(const std::optional<std::string>& reason = std::nullopt);

    bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

    std::optional<std::string> reason() const;

    /**
     * Register a callback run once on cancellation. Runs immediately (on the
     * calling thread) if the token is already cancelled.
     * @return Id for removeCallback(); 0 when the callback already ran
     */
    CallbackId onCancel(Callback callback);

    /**
     * Unregister a callback
     * @return true if it was still registered
     */
    bool removeCallback(CallbackId id);

    void throwIfCancelled() const;

    /**
     * Block until cancelled or the timeout elapses
     * @return true if cancelled
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

    /**
     * Create a child token that is cancelled together with this one.
     * Cancelling the child does not affect the parent.
     */
    std::shared_ptr<CancellationToken> createLinked();

private:
    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
    std::optional<std::string> m_reason;
    std::map<CallbackId, Callback> m_callbacks;
    CallbackId m_nextCallbackId{1};
};

/**
 * CancellationTokenSource - creates and cancels a group of tokens
 */
class CancellationTokenSource {
public:
    CancellationTokenSource() = default;
    CancellationTokenSource(const CancellationTokenSource&) = delete;
    CancellationTokenSource& operator=(const CancellationTokenSource&) = delete;

    /**
     * Create a token managed by this source; already cancelled if the
     * source was cancelled before.
     */
    std::shared_ptr<CancellationToken> createToken();

    void cancelAll(const std::optional<std::string>& reason = std::nullopt);

    bool isCancelled() const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::vector<std::weak_ptr<CancellationToken>> m_tokens;
    bool m_cancelled{false};
    std::optional<std::string> m_reason;
};

} // namespace courier::core::transfer
