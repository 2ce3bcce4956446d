#pragma once

/**
 * TransferTypes.hpp
 *
 * Enumerations and error types shared by the queue, its transfers and the
 * dedup gate.
 */

#include <stdexcept>
#include <string>

namespace courier::core::transfer {

/**
 * Priority tiers; higher values are admitted first
 */
enum class TransferPriority {
    Low = 0,
    Normal = 1,
    High = 2,
    Urgent = 3
};

/**
 * Lifecycle of a QueuedTransfer
 *
 *   Queued -> Running -> Completed | Failed | Cancelled | Paused
 *   Paused -> Running (and to any terminal status)
 *   Failed -> Queued (retry) | Cancelled
 *   Queued -> Cancelled
 */
enum class QueuedTransferStatus {
    Queued,
    Running,
    Paused,
    Completed,
    Failed,
    Cancelled
};

const char* toString(TransferPriority priority);
const char* toString(QueuedTransferStatus status);

/**
 * Raised on programmer errors: illegal state-machine transitions and use of
 * a disposed queue. Never raised for recoverable transfer failures.
 */
class TransferStateError : public std::logic_error {
public:
    explicit TransferStateError(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace courier::core::transfer
