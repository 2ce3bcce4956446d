#pragma once

/**
 * TransferGate.hpp
 *
 * Deduplicating front door of a TransferQueueManager. At most one live
 * transfer exists per resource key; finished results are served from a
 * ResultCache without touching the scheduler.
 */

#include "KeyedMutex.hpp"
#include "ResultCache.hpp"
#include "TransferQueueManager.hpp"
#include "../Logger.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace courier::core::transfer {

template<typename T, typename R>
class TransferGate {
public:
    using Manager = TransferQueueManager<T>;
    using TransferPtr = typename Manager::TransferPtr;
    using Metadata = typename Manager::Metadata;

    /**
     * Derives the cacheable result of a completed transfer
     */
    using ResultExtractor = std::function<std::optional<R>(const T& task,
                                                           const TransferProgress& progress)>;

    // Result already available; the scheduler was not touched
    struct Cached {
        R result;
    };

    // Caller shares a transfer that was already queued or running
    struct Attached {
        TransferPtr transfer;
    };

    // A new transfer was added for the key
    struct Created {
        TransferPtr transfer;
    };

    using Outcome = std::variant<Cached, Attached, Created>;

    /**
     * Constructor
     * @param manager Scheduler receiving new transfers; must outlive the gate
     *                or be disposed before it
     * @param cache Result backend; must outlive the gate
     * @param extractor Result of a completed transfer
     */
    TransferGate(Manager& manager, ResultCache<R>& cache, ResultExtractor extractor)
        : m_manager(manager)
        , m_cache(cache)
        , m_extractor(std::move(extractor)) {}

    TransferGate(const TransferGate&) = delete;
    TransferGate& operator=(const TransferGate&) = delete;

    /**
     * Resolve a request for the resource identified by key. The key doubles
     * as the transfer id.
     */
    Outcome request(const std::string& key, T task,
                    TransferPriority priority = TransferPriority::Normal,
                    Metadata metadata = {}) {
        auto guard = m_keyLocks.lock(key);

        if (auto cached = m_cache.lookup(key)) {
            COURIER_LOG_DEBUG("Cache hit for {}", key);
            return Cached{std::move(*cached)};
        }

        if (auto existing = m_manager.getTransfer(key)) {
            if (existing->status() == QueuedTransferStatus::Completed) {
                if (auto result = m_extractor(existing->task(), existing->progress())) {
                    m_cache.store(key, *result);
                    return Cached{std::move(*result)};
                }
            } else if (!existing->isTerminal()) {
                if (existing->status() == QueuedTransferStatus::Failed) {
                    m_manager.retry(key);
                }
                COURIER_LOG_DEBUG("Attaching to existing transfer for {}", key);
                return Attached{existing};
            }
        }

        auto [transfer, inserted] = m_manager.tryAdd(std::move(task), key, priority,
                                                      std::move(metadata));
        if (!inserted) {
            return Attached{transfer};
        }

        COURIER_LOG_DEBUG("Cache miss for {}, created transfer", key);
        transfer->onProgress([this, key, raw = transfer.get()](const TransferProgress& progress) {
            if (!progress.isCompleted()) return;
            if (auto result = m_extractor(raw->task(), progress)) {
                m_cache.store(key, *result);
            }
        });
        // The executor may have finished before the listener was connected
        if (transfer->status() == QueuedTransferStatus::Completed) {
            if (auto result = m_extractor(transfer->task(), transfer->progress())) {
                m_cache.store(key, *result);
            }
        }
        return Created{transfer};
    }

    bool isInFlight(const std::string& key) const {
        auto transfer = m_manager.getTransfer(key);
        return transfer && !transfer->isFinished();
    }

    /**
     * Transfer behind an outcome; nullptr for Cached
     */
    static TransferPtr transferOf(const Outcome& outcome) {
        if (auto attached = std::get_if<Attached>(&outcome)) {
            return attached->transfer;
        }
        if (auto created = std::get_if<Created>(&outcome)) {
            return created->transfer;
        }
        return nullptr;
    }

    KeyedMutex& keyLocks() { return m_keyLocks; }

private:
    Manager& m_manager;
    ResultCache<R>& m_cache;
    ResultExtractor m_extractor;
    KeyedMutex m_keyLocks;
};

} // namespace courier::core::transfer
