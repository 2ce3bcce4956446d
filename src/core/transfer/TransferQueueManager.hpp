#pragma once

/**
 * TransferQueueManager.hpp
 *
 * Concurrency-limited priority scheduler for transfer jobs.
 *
 * Every public mutator and every executor report is serialized on one mutex;
 * the scheduling pass runs synchronously after each state-affecting event.
 * Observer callbacks, completion handles and cancellation signals are
 * delivered after the lock is released, so callbacks may call back into the
 * manager.
 */

#include "QueuedTransfer.hpp"
#include "TransferQueueOptions.hpp"
#include "TransferQueueState.hpp"
#include "../Logger.hpp"
#include "../Signal.hpp"
#include "../ThreadPool.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace courier::core::transfer {

/**
 * TransferQueueManager - schedules QueuedTransfers through an executor
 *
 * Executor contract: the executor is called on a worker thread with the task,
 * the transfer's cancellation token, its pause latch and an emitter. It reports
 * progress through the emitter and must report exactly one terminal status
 * (completed, failed or cancelled) before returning. Returning without one is
 * treated as a failure; an escaping exception is turned into a failure carrying
 * its message. The executor must poll the token between units of work and
 * should wait on the latch while it is closed; the manager never interrupts it.
 */
template<typename T>
class TransferQueueManager {
public:
    using Transfer = QueuedTransfer<T>;
    using TransferPtr = std::shared_ptr<Transfer>;
    using Metadata = typename Transfer::Metadata;
    using ProgressEmitter = std::function<void(const TransferProgress&)>;
    using Executor = std::function<void(const T& task,
                                        const CancellationToken& token,
                                        const PauseLatch& pause,
                                        const ProgressEmitter& emit)>;
    using StateCallback = std::function<void(const TransferQueueState&)>;

    /**
     * Constructor
     * @param executor Performs the actual transfer
     * @param options Scheduler tunables
     * @throws std::invalid_argument on invalid options or empty executor
     */
    explicit TransferQueueManager(Executor executor,
                                  TransferQueueOptions options = TransferQueueOptions{})
        : m_executor(std::move(executor))
        , m_options(options)
        , m_maxConcurrent(options.maxConcurrent)
        , m_paused(!options.autoStart) {
        m_options.validate();
        if (!m_executor) {
            throw std::invalid_argument("TransferQueueManager requires an executor");
        }
        m_pool = std::make_unique<ThreadPool>(m_maxConcurrent);
    }

    /**
     * Destructor - cancels outstanding work and waits for executors
     */
    ~TransferQueueManager() {
        dispose();
    }

    TransferQueueManager(const TransferQueueManager&) = delete;
    TransferQueueManager& operator=(const TransferQueueManager&) = delete;

    /**
     * Add a transfer
     * @param task Opaque payload handed to the executor
     * @param id Stable identity; a UUID is generated when absent
     * @param priority Scheduling tier
     * @param metadata Caller-defined annotations
     * @return The new transfer, or the existing one if a non-terminal
     *         transfer with the same id is already known
     * @throws TransferStateError after dispose()
     */
    TransferPtr add(T task,
                    std::optional<std::string> id = std::nullopt,
                    TransferPriority priority = TransferPriority::Normal,
                    Metadata metadata = {}) {
        return tryAdd(std::move(task), std::move(id), priority, std::move(metadata)).first;
    }

    /**
     * Same as add(), also reporting whether a new transfer was created
     */
    std::pair<TransferPtr, bool> tryAdd(T task,
                                        std::optional<std::string> id = std::nullopt,
                                        TransferPriority priority = TransferPriority::Normal,
                                        Metadata metadata = {}) {
        Effects effects;
        std::pair<TransferPtr, bool> result;
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (m_disposed) {
                COURIER_LOG_ERROR("Rejected transfer added after dispose()");
                throw TransferStateError("TransferQueueManager has been disposed");
            }

            std::string transferId = id ? *id : utils::StringUtils::generateUUID();

            auto it = m_transfers.find(transferId);
            if (it != m_transfers.end()) {
                if (!it->second->isTerminal()) {
                    COURIER_LOG_DEBUG("Transfer {} already tracked, returning existing entry", transferId);
                    return {it->second, false};
                }
                forgetLocked(transferId);
            }

            auto transfer = std::make_shared<Transfer>(
                transferId, std::move(task), priority, m_options.maxRetries, std::move(metadata));
            transfer->m_sequence = m_nextSequence++;

            m_transfers.emplace(transferId, transfer);
            insertPendingLocked(transfer);
            COURIER_LOG_DEBUG("Queued transfer {} ({})", transferId, toString(priority));

            scheduleLocked();
            effects.state = buildStateLocked();
            result = {transfer, true};
        }
        flush(effects);
        return result;
    }

    /**
     * Add several transfers with generated ids
     */
    std::vector<TransferPtr> addAll(std::vector<T> tasks,
                                    TransferPriority priority = TransferPriority::Normal) {
        std::vector<TransferPtr> transfers;
        transfers.reserve(tasks.size());
        for (auto& task : tasks) {
            transfers.push_back(add(std::move(task), std::nullopt, priority));
        }
        return transfers;
    }

    /**
     * Cancel a transfer.
     * Queued: leaves the pending set immediately. Running: the token is
     * signalled and the transfer becomes cancelled once its executor reports
     * so. Failed with retries left: becomes cancelled.
     * @return false if the id is unknown or already terminal
     */
    bool cancel(const std::string& id) {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto transfer = findLocked(id);
            if (!transfer || transfer->isTerminal()) {
                return false;
            }
            cancelLocked(transfer, effects);
            effects.state = buildStateLocked();
        }
        flush(effects);
        return true;
    }

    /**
     * Cancel every non-terminal transfer
     */
    void cancelAll() {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            cancelAllLocked(effects);
            effects.state = buildStateLocked();
        }
        flush(effects);
    }

    /**
     * Re-queue a failed transfer at the back of its priority tier
     * @return false unless the transfer is failed with retries left
     */
    bool retry(const std::string& id) {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_disposed) return false;

            auto transfer = findLocked(id);
            if (!transfer || transfer->status() != QueuedTransferStatus::Failed ||
                transfer->retryCount() >= m_options.maxRetries) {
                return false;
            }

            transfer->rearm();
            requeueLocked(transfer);
            COURIER_LOG_INFO("Retrying transfer {} (attempt {} of {})",
                             id, transfer->retryCount(), m_options.maxRetries);

            scheduleLocked();
            effects.state = buildStateLocked();
        }
        flush(effects);
        return true;
    }

    /**
     * Stop admitting new transfers; running ones continue
     */
    void pause() {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_paused) return;
            m_paused = true;
            COURIER_LOG_INFO("Transfer queue paused");
            effects.state = buildStateLocked();
            m_idleCondition.notify_all();
        }
        flush(effects);
    }

    /**
     * Resume admissions
     */
    void start() {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_disposed) return;
            m_paused = false;
            COURIER_LOG_INFO("Transfer queue started");
            scheduleLocked();
            effects.state = buildStateLocked();
        }
        flush(effects);
    }

    /**
     * Pause a running transfer. It keeps its slot; the executor sees the
     * closed latch at its next check.
     * @return false unless the transfer is running
     */
    bool pauseTransfer(const std::string& id) {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto transfer = findLocked(id);
            if (!transfer || transfer->status() != QueuedTransferStatus::Running ||
                transfer->m_cancelRequested) {
                return false;
            }
            pauseLocked(transfer, effects);
            effects.state = buildStateLocked();
        }
        flush(effects);
        return true;
    }

    /**
     * Resume a paused transfer
     * @return false unless the transfer is paused
     */
    bool resumeTransfer(const std::string& id) {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto transfer = findLocked(id);
            if (!transfer || transfer->status() != QueuedTransferStatus::Paused) {
                return false;
            }
            resumeLocked(transfer, effects);
            effects.state = buildStateLocked();
        }
        flush(effects);
        return true;
    }

    /**
     * Stop admissions and pause every running transfer
     */
    void pauseAll() {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_disposed) return;
            m_paused = true;
            for (const auto& transfer : m_running) {
                if (transfer->status() == QueuedTransferStatus::Running &&
                    !transfer->m_cancelRequested) {
                    pauseLocked(transfer, effects);
                }
            }
            COURIER_LOG_INFO("Paused all transfers");
            effects.state = buildStateLocked();
            m_idleCondition.notify_all();
        }
        flush(effects);
    }

    /**
     * Resume every paused transfer and restart admissions
     */
    void resumeAll() {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_disposed) return;
            m_paused = false;
            for (const auto& transfer : m_running) {
                if (transfer->status() == QueuedTransferStatus::Paused) {
                    resumeLocked(transfer, effects);
                }
            }
            COURIER_LOG_INFO("Resumed all transfers");
            scheduleLocked();
            effects.state = buildStateLocked();
        }
        flush(effects);
    }

    /**
     * Move a queued transfer to another tier (behind its new peers' order
     * of arrival)
     * @return false unless the transfer is queued
     */
    bool changePriority(const std::string& id, TransferPriority priority) {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto transfer = findLocked(id);
            if (!transfer || transfer->status() != QueuedTransferStatus::Queued) {
                return false;
            }

            erasePendingLocked(transfer);
            transfer->setPriority(priority);
            insertPendingLocked(transfer);

            scheduleLocked();
            effects.state = buildStateLocked();
        }
        flush(effects);
        return true;
    }

    /**
     * Put a queued transfer ahead of every peer in its tier. Higher tiers
     * still go first.
     * @return false unless the transfer is queued
     */
    bool moveToFront(const std::string& id) {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto transfer = findLocked(id);
            if (!transfer || transfer->status() != QueuedTransferStatus::Queued) {
                return false;
            }

            erasePendingLocked(transfer);
            transfer->m_sequence = m_frontSequence--;
            insertPendingLocked(transfer);

            scheduleLocked();
            effects.state = buildStateLocked();
        }
        flush(effects);
        return true;
    }

    size_t maxConcurrent() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_maxConcurrent;
    }

    /**
     * Change the concurrency ceiling. Raising it admits pending work at once;
     * lowering it never preempts running transfers.
     * @throws std::invalid_argument if value is 0
     */
    void setMaxConcurrent(size_t value) {
        if (value < 1) {
            COURIER_LOG_ERROR("Rejected maxConcurrent of 0");
            throw std::invalid_argument("maxConcurrent must be greater than 0");
        }

        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_maxConcurrent = value;
            if (m_pool) {
                m_pool->ensureWorkers(value);
            }
            scheduleLocked();
            effects.state = buildStateLocked();
        }
        flush(effects);
    }

    /**
     * Forget a transfer. A transfer that is not terminal is cancelled first;
     * a running one is forgotten once its executor reports back.
     * @return false if the id is unknown
     */
    bool remove(const std::string& id) {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto transfer = findLocked(id);
            if (!transfer) return false;

            if (!transfer->isTerminal()) {
                cancelLocked(transfer, effects);
            }
            auto status = transfer->status();
            if (status == QueuedTransferStatus::Running || status == QueuedTransferStatus::Paused) {
                transfer->m_removeRequested = true;
            } else {
                forgetLocked(id);
            }
            effects.state = buildStateLocked();
        }
        flush(effects);
        return true;
    }

    /**
     * Forget every terminal transfer
     * @return Number of transfers removed
     */
    size_t clearFinished() {
        Effects effects;
        size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<std::string> ids;
            for (const auto& [id, transfer] : m_transfers) {
                if (transfer->isTerminal()) {
                    ids.push_back(id);
                }
            }
            for (const auto& id : ids) {
                forgetLocked(id);
            }
            removed = ids.size();
            effects.state = buildStateLocked();
        }
        flush(effects);
        return removed;
    }

    TransferPtr getTransfer(const std::string& id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return findLocked(id);
    }

    std::vector<TransferPtr> runningTransfers() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

    std::vector<TransferPtr> pendingTransfers() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending;
    }

    size_t runningCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running.size();
    }

    size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending.size();
    }

    /**
     * Number of tracked transfers, finished ones included
     */
    size_t totalCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_transfers.size();
    }

    bool isPaused() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_paused;
    }

    bool hasAvailableSlots() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running.size() < m_maxConcurrent;
    }

    bool isDisposed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_disposed;
    }

    /**
     * Synchronous snapshot
     */
    TransferQueueState state() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return snapshotLocked(m_revision);
    }

    /**
     * Subscribe to snapshots emitted on every admission, progress update
     * and terminal transition. Snapshots from different worker threads may
     * arrive out of order; compare revision to discard stale ones.
     */
    SubscriptionPtr subscribeState(StateCallback callback) {
        return m_stateSignal.connect(std::move(callback));
    }

    void unsubscribeState(const SubscriptionPtr& subscription) {
        m_stateSignal.disconnect(subscription);
    }

    /**
     * Block until nothing runs and nothing can be admitted (queue drained,
     * or paused with only pending work)
     * @return false on timeout
     */
    bool waitForIdle(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_idleCondition.wait_for(lock, timeout, [this] {
            return m_running.empty() && (m_pending.empty() || m_paused || m_disposed);
        });
    }

    /**
     * Cancel all non-terminal transfers and wait for executors to return.
     * Idempotent. Must not be called from an executor or a callback.
     */
    void dispose() {
        Effects effects;
        std::unique_ptr<ThreadPool> pool;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_disposed) return;
            m_disposed = true;
            m_paused = true;
            COURIER_LOG_DEBUG("Disposing transfer queue ({} running, {} pending)",
                              m_running.size(), m_pending.size());
            cancelAllLocked(effects);
            effects.state = buildStateLocked();
        }
        flush(effects);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            pool = std::move(m_pool);
        }
        // Joins the workers once every executor has observed its token
        pool.reset();

        m_stateSignal.clear();
        m_idleCondition.notify_all();
    }

private:
    /**
     * Work deferred until the manager lock is released
     */
    struct Effects {
        std::vector<std::function<void()>> actions;
        std::optional<TransferQueueState> state;
    };

    void flush(Effects& effects) {
        for (auto& action : effects.actions) {
            action();
        }
        if (effects.state) {
            m_stateSignal.emit(*effects.state);
        }
    }

    TransferPtr findLocked(const std::string& id) const {
        auto it = m_transfers.find(id);
        return it != m_transfers.end() ? it->second : nullptr;
    }

    /**
     * Pending order: higher priority first, then lower sequence
     */
    static bool comesBefore(const TransferPtr& a, const TransferPtr& b) {
        auto pa = a->priority();
        auto pb = b->priority();
        if (pa != pb) {
            return static_cast<int>(pa) > static_cast<int>(pb);
        }
        return a->m_sequence < b->m_sequence;
    }

    void insertPendingLocked(const TransferPtr& transfer) {
        auto pos = std::upper_bound(m_pending.begin(), m_pending.end(), transfer, comesBefore);
        m_pending.insert(pos, transfer);
        updateQueuePositionsLocked();
    }

    void erasePendingLocked(const TransferPtr& transfer) {
        m_pending.erase(std::remove(m_pending.begin(), m_pending.end(), transfer), m_pending.end());
        updateQueuePositionsLocked();
    }

    void eraseRunningLocked(const TransferPtr& transfer) {
        m_running.erase(std::remove(m_running.begin(), m_running.end(), transfer), m_running.end());
    }

    void updateQueuePositionsLocked() {
        for (size_t i = 0; i < m_pending.size(); ++i) {
            m_pending[i]->setQueuePosition(static_cast<int>(i));
        }
    }

    /**
     * Admit pending transfers while capacity allows
     */
    void scheduleLocked() {
        while (!m_paused && !m_disposed && m_pool &&
               m_running.size() < m_maxConcurrent && !m_pending.empty()) {
            TransferPtr transfer = m_pending.front();
            m_pending.erase(m_pending.begin());

            transfer->transitionTo(QueuedTransferStatus::Running);
            transfer->latch().resume();
            transfer->setProgress(TransferProgress::running(0, TransferProgress::kUnknownSize));
            uint64_t attempt = ++transfer->m_attempt;
            m_running.push_back(transfer);

            COURIER_LOG_DEBUG("Admitted transfer {} ({}/{} running)",
                              transfer->id(), m_running.size(), m_maxConcurrent);

            m_pool->submit([this, transfer, attempt] {
                runAttempt(transfer, attempt);
            });
        }
        updateQueuePositionsLocked();
    }

    /**
     * Worker-thread body of one executor invocation
     */
    void runAttempt(const TransferPtr& transfer, uint64_t attempt) {
        ProgressEmitter emit = [this, transfer, attempt](const TransferProgress& progress) {
            handleProgress(transfer, attempt, progress);
        };

        try {
            m_executor(transfer->task(), transfer->cancellationToken(),
                       transfer->pauseLatch(), emit);
        } catch (const CancellationException&) {
            handleProgress(transfer, attempt, TransferProgress::cancelled(
                transfer->progress().bytesTransferred, transfer->progress().totalBytes));
        } catch (const std::exception& e) {
            COURIER_LOG_WARN("Executor for {} threw: {}", transfer->id(), e.what());
            handleProgress(transfer, attempt, TransferProgress::failed(e.what()));
        } catch (...) {
            COURIER_LOG_WARN("Executor for {} threw a non-standard exception", transfer->id());
            handleProgress(transfer, attempt, TransferProgress::failed("Unknown executor error"));
        }

        handleExecutorReturn(transfer, attempt);
    }

    bool isCurrentAttemptLocked(const TransferPtr& transfer, uint64_t attempt) const {
        if (transfer->m_attempt != attempt) return false;
        auto status = transfer->status();
        return status == QueuedTransferStatus::Running || status == QueuedTransferStatus::Paused;
    }

    void handleProgress(const TransferPtr& transfer, uint64_t attempt,
                        const TransferProgress& reported) {
        TransferProgress progress = reported.normalized();
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!isCurrentAttemptLocked(transfer, attempt)) {
                COURIER_LOG_DEBUG("Ignoring {} progress for {} after its attempt ended",
                                  toString(progress.status), transfer->id());
                return;
            }

            if (progress.isTerminal()) {
                finishAttemptLocked(transfer, progress, effects);
            } else {
                // Reports racing a manual pause must not resume the transfer
                if (transfer->pauseLatch().isPaused() && !progress.isPaused()) {
                    progress = TransferProgress::paused(progress.bytesTransferred,
                                                        progress.totalBytes);
                }
                auto status = transfer->status();
                if (progress.isPaused() && status == QueuedTransferStatus::Running) {
                    transfer->transitionTo(QueuedTransferStatus::Paused);
                } else if (!progress.isPaused() && status == QueuedTransferStatus::Paused) {
                    transfer->transitionTo(QueuedTransferStatus::Running);
                }
                transfer->setProgress(progress);
                effects.actions.push_back([transfer, progress] {
                    transfer->publishProgress(progress);
                });
            }
            effects.state = buildStateLocked();
        }
        flush(effects);
    }

    void handleExecutorReturn(const TransferPtr& transfer, uint64_t attempt) {
        Effects effects;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!isCurrentAttemptLocked(transfer, attempt)) {
                return;
            }

            COURIER_LOG_ERROR("Executor for {} returned without a terminal status", transfer->id());
            auto last = transfer->progress();
            finishAttemptLocked(transfer,
                                TransferProgress::failed("Transfer ended unexpectedly",
                                                         last.bytesTransferred, last.totalBytes),
                                effects);
            effects.state = buildStateLocked();
        }
        flush(effects);
    }

    /**
     * Retire the running attempt: frees its slot, records the outcome,
     * auto-retries if configured, and runs a scheduling pass
     */
    void finishAttemptLocked(const TransferPtr& transfer, TransferProgress progress,
                             Effects& effects) {
        eraseRunningLocked(transfer);

        // A failure after a cancel request is reported as a cancellation
        if (transfer->m_cancelRequested && progress.isFailed()) {
            progress = TransferProgress::cancelled(progress.bytesTransferred, progress.totalBytes);
        }

        transfer->setProgress(progress);
        effects.actions.push_back([transfer, progress] {
            transfer->publishProgress(progress);
        });

        switch (progress.status) {
            case TransferStatus::Completed:
                transfer->transitionTo(QueuedTransferStatus::Completed);
                COURIER_LOG_INFO("Transfer {} completed", transfer->id());
                resolveLocked(transfer, progress, effects);
                break;

            case TransferStatus::Cancelled:
                transfer->transitionTo(QueuedTransferStatus::Cancelled);
                COURIER_LOG_INFO("Transfer {} cancelled", transfer->id());
                resolveLocked(transfer, progress, effects);
                break;

            default:
                transfer->transitionTo(QueuedTransferStatus::Failed);
                if (m_options.autoRetry && !m_disposed &&
                    transfer->retryCount() < m_options.maxRetries) {
                    COURIER_LOG_INFO("Transfer {} failed ({}), retrying (attempt {} of {})",
                                     transfer->id(), progress.errorMessage.value_or(""),
                                     transfer->retryCount() + 1, m_options.maxRetries);
                    requeueLocked(transfer);
                } else {
                    if (transfer->retryCount() >= m_options.maxRetries) {
                        COURIER_LOG_WARN("Transfer {} failed after {} retries: {}",
                                         transfer->id(), transfer->retryCount(),
                                         progress.errorMessage.value_or(""));
                    } else {
                        COURIER_LOG_WARN("Transfer {} failed: {}",
                                         transfer->id(), progress.errorMessage.value_or(""));
                    }
                    resolveLocked(transfer, progress, effects);
                }
                break;
        }

        if (transfer->m_removeRequested && transfer->isTerminal()) {
            forgetLocked(transfer->id());
        } else if (transfer->isFinished()) {
            recordHistoryLocked(transfer);
        }
        scheduleLocked();
        m_idleCondition.notify_all();
    }

    void pauseLocked(const TransferPtr& transfer, Effects& effects) {
        transfer->latch().pause();
        transfer->transitionTo(QueuedTransferStatus::Paused);
        auto last = transfer->progress();
        auto progress = TransferProgress::paused(last.bytesTransferred, last.totalBytes);
        transfer->setProgress(progress);
        COURIER_LOG_INFO("Paused transfer {}", transfer->id());
        effects.actions.push_back([transfer, progress] {
            transfer->publishProgress(progress);
        });
    }

    void resumeLocked(const TransferPtr& transfer, Effects& effects) {
        transfer->latch().resume();
        transfer->transitionTo(QueuedTransferStatus::Running);
        auto last = transfer->progress();
        auto progress = TransferProgress::running(last.bytesTransferred, last.totalBytes);
        transfer->setProgress(progress);
        COURIER_LOG_INFO("Resumed transfer {}", transfer->id());
        effects.actions.push_back([transfer, progress] {
            transfer->publishProgress(progress);
        });
    }

    /**
     * Failed -> Queued at the back of the transfer's tier
     */
    void requeueLocked(const TransferPtr& transfer) {
        transfer->transitionTo(QueuedTransferStatus::Queued);
        transfer->incrementRetryCount();
        transfer->setProgress(TransferProgress::initial());
        transfer->m_sequence = m_nextSequence++;
        insertPendingLocked(transfer);
    }

    void resolveLocked(const TransferPtr& transfer, const TransferProgress& progress,
                       Effects& effects) {
        if (auto promise = transfer->takePromiseForResolution()) {
            effects.actions.push_back([promise, progress] {
                promise->set_value(progress);
            });
        }
    }

    void cancelLocked(const TransferPtr& transfer, Effects& effects) {
        switch (transfer->status()) {
            case QueuedTransferStatus::Queued: {
                erasePendingLocked(transfer);
                transfer->transitionTo(QueuedTransferStatus::Cancelled);
                auto progress = TransferProgress::cancelled();
                transfer->setProgress(progress);
                COURIER_LOG_INFO("Cancelled queued transfer {}", transfer->id());
                effects.actions.push_back([transfer, progress] {
                    transfer->token().cancel("Cancelled by user");
                    transfer->publishProgress(progress);
                });
                resolveLocked(transfer, progress, effects);
                recordHistoryLocked(transfer);
                m_idleCondition.notify_all();
                break;
            }

            case QueuedTransferStatus::Running:
            case QueuedTransferStatus::Paused: {
                if (transfer->m_cancelRequested) break;
                transfer->m_cancelRequested = true;
                COURIER_LOG_INFO("Requested cancellation of running transfer {}", transfer->id());
                // Token callbacks may re-enter the manager
                effects.actions.push_back([transfer] {
                    transfer->token().cancel("Cancelled by user");
                });
                break;
            }

            case QueuedTransferStatus::Failed: {
                auto last = transfer->progress();
                transfer->transitionTo(QueuedTransferStatus::Cancelled);
                transfer->rearm();
                auto progress = TransferProgress::cancelled(last.bytesTransferred, last.totalBytes);
                transfer->setProgress(progress);
                COURIER_LOG_INFO("Cancelled failed transfer {}", transfer->id());
                effects.actions.push_back([transfer, progress] {
                    transfer->token().cancel("Cancelled by user");
                    transfer->publishProgress(progress);
                });
                resolveLocked(transfer, progress, effects);
                recordHistoryLocked(transfer);
                break;
            }

            case QueuedTransferStatus::Completed:
            case QueuedTransferStatus::Cancelled:
                break;
        }
    }

    void cancelAllLocked(Effects& effects) {
        std::vector<TransferPtr> targets;
        for (const auto& [id, transfer] : m_transfers) {
            if (!transfer->isTerminal()) {
                targets.push_back(transfer);
            }
        }
        // Pending first so no cancelled slot admits a doomed transfer
        std::stable_partition(targets.begin(), targets.end(), [](const TransferPtr& t) {
            return t->status() == QueuedTransferStatus::Queued;
        });
        for (const auto& transfer : targets) {
            cancelLocked(transfer, effects);
        }
    }

    void recordHistoryLocked(const TransferPtr& transfer) {
        m_history.erase(std::remove(m_history.begin(), m_history.end(), transfer->id()),
                        m_history.end());
        m_history.push_back(transfer->id());

        while (m_history.size() > m_options.historyLimit) {
            std::string oldest = m_history.front();
            m_history.pop_front();
            auto old = findLocked(oldest);
            if (old && old->isTerminal()) {
                m_transfers.erase(oldest);
            }
        }
    }

    void forgetLocked(const std::string& id) {
        auto transfer = findLocked(id);
        if (!transfer) return;
        if (transfer->m_removeRequested && !transfer->isTerminal()) return;
        erasePendingLocked(transfer);
        eraseRunningLocked(transfer);
        m_transfers.erase(id);
        m_history.erase(std::remove(m_history.begin(), m_history.end(), id), m_history.end());
    }

    TransferQueueState snapshotLocked(uint64_t revision) const {
        TransferQueueState state;
        state.revision = revision;
        state.runningCount = m_running.size();
        state.pendingCount = m_pending.size();
        state.maxConcurrent = m_maxConcurrent;
        state.isPaused = m_paused;

        state.runningTransfers.reserve(m_running.size());
        for (const auto& transfer : m_running) {
            state.runningTransfers.push_back(transfer->info());
        }
        state.pendingTransfers.reserve(m_pending.size());
        for (const auto& transfer : m_pending) {
            state.pendingTransfers.push_back(transfer->info());
        }
        state.overallProgress = computeOverallProgress(state.runningTransfers,
                                                       state.pendingTransfers);
        return state;
    }

    TransferQueueState buildStateLocked() {
        return snapshotLocked(++m_revision);
    }

private:
    Executor m_executor;
    TransferQueueOptions m_options;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_idleCondition;

    std::unordered_map<std::string, TransferPtr> m_transfers;
    std::vector<TransferPtr> m_pending;
    std::vector<TransferPtr> m_running;
    std::deque<std::string> m_history;

    size_t m_maxConcurrent;
    bool m_paused;
    bool m_disposed{false};

    int64_t m_nextSequence{0};
    int64_t m_frontSequence{-1};
    uint64_t m_revision{0};

    Signal<TransferQueueState> m_stateSignal;

    // Declared last: destroyed (and joined) before the state above
    std::unique_ptr<ThreadPool> m_pool;
};

} // namespace courier::core::transfer
