/**
 * PauseLatch.cpp
 */

#include "PauseLatch.hpp"

namespace courier::core::transfer {

bool PauseLatch::pause() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_paused.exchange(true, std::memory_order_acq_rel);
}

bool PauseLatch::resume() {
    bool changed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        changed = m_paused.exchange(false, std::memory_order_acq_rel);
    }
    m_condition.notify_all();
    return changed;
}

bool PauseLatch::waitWhilePaused(const CancellationToken& token,
                                 std::chrono::milliseconds pollInterval) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_paused.load(std::memory_order_acquire)) {
        if (token.isCancelled()) {
            return false;
        }
        m_condition.wait_for(lock, pollInterval);
    }
    return !token.isCancelled();
}

} // namespace courier::core::transfer
