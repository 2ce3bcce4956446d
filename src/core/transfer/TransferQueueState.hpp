#pragma once

/**
 * TransferQueueState.hpp
 *
 * Read-only snapshots pushed to observers on every queue transition.
 */

#include "TransferProgress.hpp"
#include "TransferTypes.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace courier::core::transfer {

/**
 * Value snapshot of one QueuedTransfer
 */
struct TransferInfo {
    std::string id;
    TransferPriority priority{TransferPriority::Normal};
    QueuedTransferStatus status{QueuedTransferStatus::Queued};
    TransferProgress progress;
    int retryCount{0};
    int queuePosition{-1};
    std::chrono::system_clock::time_point createdAt;
};

/**
 * Queue snapshot
 */
struct TransferQueueState {
    uint64_t revision{0};
    size_t runningCount{0};
    size_t pendingCount{0};
    size_t maxConcurrent{0};
    bool isPaused{false};
    double overallProgress{0.0};

    // Running in admission order, pending in admission order
    std::vector<TransferInfo> runningTransfers;
    std::vector<TransferInfo> pendingTransfers;

    size_t totalCount() const { return runningCount + pendingCount; }
    bool isEmpty() const { return totalCount() == 0; }
    bool isFull() const { return runningCount >= maxConcurrent; }
    size_t availableSlots() const {
        return runningCount >= maxConcurrent ? 0 : maxConcurrent - runningCount;
    }

    std::string toString() const;
};

/**
 * Aggregate progress over the given non-terminal transfers.
 * Weighted by bytes when every size is known, plain average of ratios
 * otherwise; 0 for an empty set.
 */
double computeOverallProgress(const std::vector<TransferInfo>& running,
                              const std::vector<TransferInfo>& pending);

void to_json(nlohmann::json& j, const TransferProgress& progress);
void to_json(nlohmann::json& j, const TransferInfo& info);
void to_json(nlohmann::json& j, const TransferQueueState& state);

} // namespace courier::core::transfer
