#pragma once

/**
 * TransferQueueOptions.hpp
 *
 * Tunables of a TransferQueueManager.
 */

#include <cstddef>

namespace courier::core {
class Config;
}

namespace courier::core::transfer {

struct TransferQueueOptions {
    // Ceiling on simultaneously running transfers (>= 1)
    size_t maxConcurrent{3};

    // When false the queue is created paused and only start() admits work
    bool autoStart{true};

    // Re-queue failed transfers automatically until maxRetries is reached
    bool autoRetry{false};
    int maxRetries{3};

    // Finished transfers kept for lookup before the oldest are dropped
    size_t historyLimit{100};

    /**
     * Build options from the "transfers.*" configuration keys
     */
    static TransferQueueOptions fromConfig(const Config& config);

    /**
     * @throws std::invalid_argument on out-of-range values
     */
    void validate() const;
};

} // namespace courier::core::transfer
