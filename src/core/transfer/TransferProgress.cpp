/**
 * TransferProgress.cpp
 */

#include "TransferProgress.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <sstream>

namespace courier::core::transfer {

using utils::StringUtils;

const char* toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:   return "pending";
        case TransferStatus::Running:   return "running";
        case TransferStatus::Paused:    return "paused";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed:    return "failed";
        case TransferStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

TransferProgress TransferProgress::initial(int64_t totalBytes) {
    TransferProgress progress;
    progress.totalBytes = totalBytes;
    progress.status = TransferStatus::Pending;
    return progress;
}

TransferProgress TransferProgress::running(int64_t bytesTransferred, int64_t totalBytes,
                                           double bytesPerSecond) {
    TransferProgress progress;
    progress.bytesTransferred = bytesTransferred;
    progress.totalBytes = totalBytes;
    progress.bytesPerSecond = bytesPerSecond;
    progress.status = TransferStatus::Running;

    if (bytesPerSecond > 0.0 && totalBytes > bytesTransferred) {
        auto remaining = static_cast<double>(totalBytes - bytesTransferred) / bytesPerSecond;
        progress.estimatedTimeRemaining =
            std::chrono::milliseconds(static_cast<int64_t>(remaining * 1000.0));
    }
    return progress.normalized();
}

TransferProgress TransferProgress::paused(int64_t bytesTransferred, int64_t totalBytes) {
    TransferProgress progress;
    progress.bytesTransferred = bytesTransferred;
    progress.totalBytes = totalBytes;
    progress.status = TransferStatus::Paused;
    return progress.normalized();
}

TransferProgress TransferProgress::completed(int64_t totalBytes) {
    TransferProgress progress;
    progress.bytesTransferred = std::max<int64_t>(totalBytes, 0);
    progress.totalBytes = totalBytes;
    progress.status = TransferStatus::Completed;
    return progress.normalized();
}

TransferProgress TransferProgress::failed(const std::string& message,
                                          int64_t bytesTransferred, int64_t totalBytes) {
    TransferProgress progress;
    progress.bytesTransferred = bytesTransferred;
    progress.totalBytes = totalBytes;
    progress.status = TransferStatus::Failed;
    progress.errorMessage = message;
    return progress.normalized();
}

TransferProgress TransferProgress::cancelled(int64_t bytesTransferred, int64_t totalBytes) {
    TransferProgress progress;
    progress.bytesTransferred = bytesTransferred;
    progress.totalBytes = totalBytes;
    progress.status = TransferStatus::Cancelled;
    return progress.normalized();
}

double TransferProgress::ratio() const {
    if (status == TransferStatus::Completed) return 1.0;
    if (totalBytes <= 0) return 0.0;
    return std::clamp(static_cast<double>(bytesTransferred) / static_cast<double>(totalBytes),
                      0.0, 1.0);
}

TransferProgress TransferProgress::normalized() const {
    TransferProgress copy = *this;

    copy.bytesTransferred = std::max<int64_t>(copy.bytesTransferred, 0);
    if (copy.totalBytes < 0) {
        copy.totalBytes = kUnknownSize;
    } else if (copy.bytesTransferred > copy.totalBytes) {
        copy.bytesTransferred = copy.totalBytes;
    }
    copy.bytesPerSecond = std::max(copy.bytesPerSecond, 0.0);

    if (copy.status == TransferStatus::Failed) {
        if (!copy.errorMessage || copy.errorMessage->empty()) {
            copy.errorMessage = "Unknown error";
        }
    } else {
        copy.errorMessage.reset();
    }
    return copy;
}

std::string TransferProgress::toString() const {
    std::ostringstream oss;
    oss << "TransferProgress(status: " << transfer::toString(status)
        << ", progress: " << StringUtils::formatPercentage(ratio())
        << ", bytes: " << StringUtils::formatBytes(bytesTransferred)
        << " / " << StringUtils::formatBytes(totalBytes)
        << ", speed: " << StringUtils::formatSpeed(bytesPerSecond);

    if (estimatedTimeRemaining) {
        oss << ", eta: " << StringUtils::formatDuration(
            std::chrono::duration_cast<std::chrono::seconds>(*estimatedTimeRemaining));
    }
    if (errorMessage) {
        oss << ", error: " << *errorMessage;
    }
    oss << ")";
    return oss.str();
}

} // namespace courier::core::transfer
