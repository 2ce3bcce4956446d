#pragma once

/**
 * PauseLatch.hpp
 *
 * Per-transfer pause request, handed to the executor next to its
 * CancellationToken. The scheduler closes the latch on pauseTransfer() and
 * opens it on resumeTransfer(); executors check it between units of work and
 * block in waitWhilePaused() while it is closed.
 */

#include "CancellationToken.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace courier::core::transfer {

class PauseLatch {
public:
    PauseLatch() = default;
    PauseLatch(const PauseLatch&) = delete;
    PauseLatch& operator=(const PauseLatch&) = delete;

    /**
     * @return true if this call changed the state
     */
    bool pause();
    bool resume();

    bool isPaused() const { return m_paused.load(std::memory_order_acquire); }

    /**
     * Block while paused. The token is re-checked every pollInterval so a
     * cancellation ends the wait.
     * @return true once resumed (or never paused); false if cancelled
     */
    bool waitWhilePaused(const CancellationToken& token,
                         std::chrono::milliseconds pollInterval = std::chrono::milliseconds(20)) const;

private:
    std::atomic<bool> m_paused{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
};

} // namespace courier::core::transfer
