/**
 * TransferQueueState.cpp
 */

#include "TransferQueueState.hpp"

#include <sstream>

namespace courier::core::transfer {

std::string TransferQueueState::toString() const {
    std::ostringstream oss;
    oss << "TransferQueueState(running: " << runningCount << "/" << maxConcurrent
        << ", pending: " << pendingCount
        << ", paused: " << (isPaused ? "true" : "false") << ")";
    return oss.str();
}

double computeOverallProgress(const std::vector<TransferInfo>& running,
                              const std::vector<TransferInfo>& pending) {
    size_t count = running.size() + pending.size();
    if (count == 0) return 0.0;

    bool allSized = true;
    int64_t transferred = 0;
    int64_t total = 0;
    double ratioSum = 0.0;

    auto accumulate = [&](const std::vector<TransferInfo>& infos) {
        for (const auto& info : infos) {
            const auto& p = info.progress;
            ratioSum += p.ratio();
            if (p.totalBytes > 0) {
                transferred += p.bytesTransferred;
                total += p.totalBytes;
            } else {
                allSized = false;
            }
        }
    };
    accumulate(running);
    accumulate(pending);

    if (allSized && total > 0) {
        return static_cast<double>(transferred) / static_cast<double>(total);
    }
    return ratioSum / static_cast<double>(count);
}

void to_json(nlohmann::json& j, const TransferProgress& progress) {
    j = nlohmann::json{
        {"status", toString(progress.status)},
        {"bytesTransferred", progress.bytesTransferred},
        {"totalBytes", progress.totalBytes},
        {"bytesPerSecond", progress.bytesPerSecond},
        {"ratio", progress.ratio()}
    };
    if (progress.estimatedTimeRemaining) {
        j["etaMs"] = progress.estimatedTimeRemaining->count();
    }
    if (progress.errorMessage) {
        j["error"] = *progress.errorMessage;
    }
}

void to_json(nlohmann::json& j, const TransferInfo& info) {
    j = nlohmann::json{
        {"id", info.id},
        {"priority", toString(info.priority)},
        {"status", toString(info.status)},
        {"progress", info.progress},
        {"retryCount", info.retryCount},
        {"queuePosition", info.queuePosition}
    };
}

void to_json(nlohmann::json& j, const TransferQueueState& state) {
    j = nlohmann::json{
        {"revision", state.revision},
        {"runningCount", state.runningCount},
        {"pendingCount", state.pendingCount},
        {"maxConcurrent", state.maxConcurrent},
        {"isPaused", state.isPaused},
        {"overallProgress", state.overallProgress},
        {"running", state.runningTransfers},
        {"pending", state.pendingTransfers}
    };
}

} // namespace courier::core::transfer
