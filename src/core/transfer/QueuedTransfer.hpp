#pragma once

/**
 * QueuedTransfer.hpp
 *
 * One admitted job of a TransferQueueManager. Callers hold it through a
 * shared pointer and may read it from any thread; only the owning manager
 * mutates it.
 */

#include "CancellationToken.hpp"
#include "PauseLatch.hpp"
#include "TransferProgress.hpp"
#include "TransferQueueState.hpp"
#include "TransferTypes.hpp"
#include "../Logger.hpp"
#include "../Signal.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace courier::core::transfer {

template<typename T>
class TransferQueueManager;

/**
 * Legal moves of the transfer state machine
 */
inline bool canTransition(QueuedTransferStatus from, QueuedTransferStatus to) {
    using S = QueuedTransferStatus;
    switch (from) {
        case S::Queued:
            return to == S::Running || to == S::Cancelled;
        case S::Running:
            return to == S::Paused || to == S::Completed ||
                   to == S::Failed || to == S::Cancelled;
        case S::Paused:
            return to == S::Running || to == S::Completed ||
                   to == S::Failed || to == S::Cancelled;
        case S::Failed:
            return to == S::Queued || to == S::Cancelled;
        case S::Completed:
        case S::Cancelled:
            return false;
    }
    return false;
}

template<typename T>
class QueuedTransfer {
public:
    using Metadata = std::map<std::string, std::string>;
    using ProgressCallback = std::function<void(const TransferProgress&)>;

    QueuedTransfer(std::string id, T task, TransferPriority priority,
                   int maxRetries, Metadata metadata = {})
        : m_id(std::move(id))
        , m_task(std::move(task))
        , m_metadata(std::move(metadata))
        , m_maxRetries(maxRetries)
        , m_createdAt(std::chrono::system_clock::now())
        , m_token(std::make_shared<CancellationToken>())
        , m_priority(priority) {
        rearmCompletion();
    }

    QueuedTransfer(const QueuedTransfer&) = delete;
    QueuedTransfer& operator=(const QueuedTransfer&) = delete;

    const std::string& id() const { return m_id; }
    const T& task() const { return m_task; }
    const Metadata& metadata() const { return m_metadata; }
    int maxRetries() const { return m_maxRetries; }
    std::chrono::system_clock::time_point createdAt() const { return m_createdAt; }

    /**
     * Token handed to the executor; cancel() on the manager flips it
     */
    const CancellationToken& cancellationToken() const { return *m_token; }

    /**
     * Closed while the transfer is paused through the manager
     */
    const PauseLatch& pauseLatch() const { return m_pauseLatch; }

    TransferPriority priority() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_priority;
    }

    QueuedTransferStatus status() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_status;
    }

    TransferProgress progress() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_progress;
    }

    int retryCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_retryCount;
    }

    /**
     * Index among pending transfers while Queued, -1 otherwise
     */
    int queuePosition() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queuePosition;
    }

    std::optional<std::string> errorMessage() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_progress.errorMessage;
    }

    bool isQueued() const { return status() == QueuedTransferStatus::Queued; }
    bool isRunning() const { return status() == QueuedTransferStatus::Running; }

    /**
     * Completed, failed or cancelled, regardless of remaining retries
     */
    bool isFinished() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return isFinishedLocked();
    }

    /**
     * No further transitions can happen: completed, cancelled, or failed
     * with retries exhausted
     */
    bool isTerminal() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return isTerminalLocked();
    }

    /**
     * Subscribe to every progress update reported for this transfer
     */
    SubscriptionPtr onProgress(ProgressCallback callback) {
        return m_progressSignal.connect(std::move(callback));
    }

    void removeProgressListener(const SubscriptionPtr& subscription) {
        m_progressSignal.disconnect(subscription);
    }

    /**
     * Completion handle. Resolves with the final progress when the transfer
     * completes, is cancelled, or fails without being re-queued automatically.
     * A manual retry re-arms the handle; futures obtained earlier keep the
     * outcome they resolved with.
     */
    std::shared_future<TransferProgress> completion() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_completion;
    }

    TransferInfo info() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        TransferInfo info;
        info.id = m_id;
        info.priority = m_priority;
        info.status = m_status;
        info.progress = m_progress;
        info.retryCount = m_retryCount;
        info.queuePosition = m_queuePosition;
        info.createdAt = m_createdAt;
        return info;
    }

private:
    friend class TransferQueueManager<T>;

    bool isFinishedLocked() const {
        return m_status == QueuedTransferStatus::Completed ||
               m_status == QueuedTransferStatus::Failed ||
               m_status == QueuedTransferStatus::Cancelled;
    }

    bool isTerminalLocked() const {
        return m_status == QueuedTransferStatus::Completed ||
               m_status == QueuedTransferStatus::Cancelled ||
               (m_status == QueuedTransferStatus::Failed && m_retryCount >= m_maxRetries);
    }

    /**
     * @throws TransferStateError on an illegal move
     */
    void transitionTo(QueuedTransferStatus next) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!canTransition(m_status, next)) {
            COURIER_LOG_ERROR("Illegal transition for transfer {}: {} -> {}",
                              m_id, toString(m_status), toString(next));
            throw TransferStateError(
                "Illegal transition for transfer '" + m_id + "': " +
                toString(m_status) + " -> " + toString(next));
        }
        if (next == QueuedTransferStatus::Queued && m_retryCount >= m_maxRetries) {
            COURIER_LOG_ERROR("Transfer {} re-queued after exhausting its retries", m_id);
            throw TransferStateError(
                "Transfer '" + m_id + "' has exhausted its " +
                std::to_string(m_maxRetries) + " retries");
        }
        m_status = next;
        if (next != QueuedTransferStatus::Queued) {
            m_queuePosition = -1;
        }
    }

    void setProgress(const TransferProgress& progress) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_progress = progress;
    }

    void setPriority(TransferPriority priority) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_priority = priority;
    }

    void setQueuePosition(int position) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queuePosition = position;
    }

    void incrementRetryCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_retryCount;
    }

    /**
     * Replace the completion promise if the current one already resolved
     */
    void rearmCompletion() {
        if (m_promise && !m_resolved) return;
        m_promise = std::make_shared<std::promise<TransferProgress>>();
        m_completion = m_promise->get_future().share();
        m_resolved = false;
    }

    /**
     * Claim the promise for resolution; the caller fulfils it once the
     * manager lock is released. Returns nullptr if already resolved.
     */
    std::shared_ptr<std::promise<TransferProgress>> takePromiseForResolution() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_resolved) return nullptr;
        m_resolved = true;
        return m_promise;
    }

    void rearm() {
        std::lock_guard<std::mutex> lock(m_mutex);
        rearmCompletion();
    }

    void publishProgress(const TransferProgress& progress) {
        m_progressSignal.emit(progress);
    }

    CancellationToken& token() { return *m_token; }
    PauseLatch& latch() { return m_pauseLatch; }

private:
    const std::string m_id;
    const T m_task;
    const Metadata m_metadata;
    const int m_maxRetries;
    const std::chrono::system_clock::time_point m_createdAt;
    const std::shared_ptr<CancellationToken> m_token;

    mutable std::mutex m_mutex;
    TransferPriority m_priority;
    QueuedTransferStatus m_status{QueuedTransferStatus::Queued};
    TransferProgress m_progress;
    int m_retryCount{0};
    int m_queuePosition{-1};

    std::shared_ptr<std::promise<TransferProgress>> m_promise;
    std::shared_future<TransferProgress> m_completion;
    bool m_resolved{false};

    Signal<TransferProgress> m_progressSignal;
    PauseLatch m_pauseLatch;

    // Scheduler bookkeeping, guarded by the manager's lock
    int64_t m_sequence{0};
    uint64_t m_attempt{0};
    bool m_cancelRequested{false};
    bool m_removeRequested{false};
};

} // namespace courier::core::transfer
