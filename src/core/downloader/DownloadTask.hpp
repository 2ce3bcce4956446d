#pragma once

/**
 * DownloadTask.hpp
 *
 * Payload scheduled by the DownloadManager. The URL doubles as the transfer
 * id and the cache key, so two tasks for one URL are the same transfer.
 */

#include <cstdint>
#include <string>
#include <utility>

namespace courier::core::downloader {

struct DownloadTask {
    std::string url;           // file://, or a plain local path
    std::string destination;   // empty until the manager picks a cache path
    std::string sha1;          // expected hex digest; empty skips verification
    int64_t expectedSize{-1};  // -1 skips the size check

    DownloadTask() = default;

    DownloadTask(std::string source, std::string target, std::string checksum = {})
        : url(std::move(source)),
          destination(std::move(target)),
          sha1(std::move(checksum)) {}

    bool hasChecksum() const { return !sha1.empty(); }
};

} // namespace courier::core::downloader
