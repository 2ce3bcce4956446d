#pragma once

/**
 * FileCopyExecutor.hpp
 *
 * Transfer executor for local sources (file:// URLs and plain paths).
 * Copies in chunks into "<destination>.part", reporting progress after each
 * chunk and checking the cancellation token and pause latch between chunks,
 * then verifies size/checksum and renames into place.
 */

#include "DownloadTask.hpp"
#include "../transfer/CancellationToken.hpp"
#include "../transfer/PauseLatch.hpp"
#include "../transfer/TransferProgress.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace courier::core::downloader {

class FileCopyExecutor {
public:
    using ProgressEmitter = std::function<void(const transfer::TransferProgress&)>;

    struct Options {
        // Bytes copied between progress reports / cancellation checks
        size_t chunkSize{64 * 1024};

        // Pause after each chunk (throttling); 0 = none
        std::chrono::milliseconds chunkDelay{0};
    };

    FileCopyExecutor() = default;
    explicit FileCopyExecutor(Options options);

    /**
     * Run one transfer. Always ends with exactly one terminal progress;
     * errors are reported as failed progress, never thrown.
     */
    void operator()(const DownloadTask& task,
                    const transfer::CancellationToken& token,
                    const transfer::PauseLatch& pause,
                    const ProgressEmitter& emit) const;

    /**
     * Local path for a URL; empty for unsupported schemes
     */
    static std::filesystem::path resolveSource(const std::string& url);

    const Options& options() const { return m_options; }

private:
    Options m_options;
};

} // namespace courier::core::downloader
