/**
 * TransferTypes.cpp
 */

#include "TransferTypes.hpp"

namespace courier::core::transfer {

const char* toString(TransferPriority priority) {
    switch (priority) {
        case TransferPriority::Low:    return "low";
        case TransferPriority::Normal: return "normal";
        case TransferPriority::High:   return "high";
        case TransferPriority::Urgent: return "urgent";
    }
    return "unknown";
}

const char* toString(QueuedTransferStatus status) {
    switch (status) {
        case QueuedTransferStatus::Queued:    return "queued";
        case QueuedTransferStatus::Running:   return "running";
        case QueuedTransferStatus::Paused:    return "paused";
        case QueuedTransferStatus::Completed: return "completed";
        case QueuedTransferStatus::Failed:    return "failed";
        case QueuedTransferStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace courier::core::transfer
