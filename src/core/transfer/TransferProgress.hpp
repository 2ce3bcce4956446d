#pragma once

/**
 * TransferProgress.hpp
 *
 * Immutable snapshot of one transfer's progress as reported by an executor.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace courier::core::transfer {

/**
 * Transfer status as seen by executors and progress subscribers
 */
enum class TransferStatus {
    Pending,
    Running,
    Paused,
    Completed,
    Failed,
    Cancelled
};

const char* toString(TransferStatus status);

/**
 * TransferProgress - progress value type
 *
 * Invariants (established by the factories and by normalized()):
 * - bytesTransferred >= 0, and <= totalBytes whenever totalBytes is known
 * - errorMessage is present iff status == Failed
 */
struct TransferProgress {
    static constexpr int64_t kUnknownSize = -1;

    int64_t bytesTransferred{0};
    int64_t totalBytes{kUnknownSize};
    double bytesPerSecond{0.0};
    std::optional<std::chrono::milliseconds> estimatedTimeRemaining;
    TransferStatus status{TransferStatus::Pending};
    std::optional<std::string> errorMessage;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static TransferProgress initial(int64_t totalBytes = kUnknownSize);
    static TransferProgress running(int64_t bytesTransferred, int64_t totalBytes,
                                    double bytesPerSecond = 0.0);
    static TransferProgress paused(int64_t bytesTransferred, int64_t totalBytes);
    static TransferProgress completed(int64_t totalBytes);
    static TransferProgress failed(const std::string& message,
                                   int64_t bytesTransferred = 0,
                                   int64_t totalBytes = kUnknownSize);
    static TransferProgress cancelled(int64_t bytesTransferred = 0,
                                      int64_t totalBytes = kUnknownSize);

    /**
     * Fraction complete in [0, 1]; 0 when the size is unknown,
     * 1 for a completed transfer.
     */
    double ratio() const;
    double percent() const { return ratio() * 100.0; }

    bool hasTotalBytes() const { return totalBytes >= 0; }
    bool isCompleted() const { return status == TransferStatus::Completed; }
    bool isFailed() const { return status == TransferStatus::Failed; }
    bool isCancelled() const { return status == TransferStatus::Cancelled; }
    bool isPaused() const { return status == TransferStatus::Paused; }
    bool isTerminal() const { return isCompleted() || isFailed() || isCancelled(); }

    /**
     * Copy with invariants restored: clamps byte counts and fills in or
     * drops the error message according to the status.
     */
    TransferProgress normalized() const;

    std::string toString() const;
};

} // namespace courier::core::transfer
