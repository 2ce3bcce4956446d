/**
 * TransferQueueOptions.cpp
 */

#include "TransferQueueOptions.hpp"
#include "../Config.hpp"

#include <stdexcept>
#include <string>

namespace courier::core::transfer {

TransferQueueOptions TransferQueueOptions::fromConfig(const Config& config) {
    TransferQueueOptions defaults;
    TransferQueueOptions options;

    int maxConcurrent = config.get<int>("transfers.maxConcurrent",
                                        static_cast<int>(defaults.maxConcurrent));
    options.maxConcurrent = maxConcurrent > 0 ? static_cast<size_t>(maxConcurrent) : 0;
    options.autoStart = config.get<bool>("transfers.autoStart", defaults.autoStart);
    options.autoRetry = config.get<bool>("transfers.autoRetry", defaults.autoRetry);
    options.maxRetries = config.get<int>("transfers.maxRetries", defaults.maxRetries);

    int historyLimit = config.get<int>("transfers.historyLimit",
                                       static_cast<int>(defaults.historyLimit));
    options.historyLimit = historyLimit > 0 ? static_cast<size_t>(historyLimit) : 0;

    options.validate();
    return options;
}

void TransferQueueOptions::validate() const {
    if (maxConcurrent < 1) {
        throw std::invalid_argument("maxConcurrent must be greater than 0");
    }
    if (maxRetries < 0) {
        throw std::invalid_argument("maxRetries must not be negative, got " +
                                    std::to_string(maxRetries));
    }
}

} // namespace courier::core::transfer
