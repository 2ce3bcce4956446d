#pragma once

/**
 * DownloadManager.hpp
 *
 * URL-keyed download front end: deduplicates requests through a
 * TransferGate, serves finished downloads from the CacheManager and
 * schedules the rest on a TransferQueueManager.
 */

#include "DownloadTask.hpp"
#include "CacheManager.hpp"
#include "../Signal.hpp"
#include "../transfer/TransferGate.hpp"
#include "../transfer/TransferQueueManager.hpp"
#include "../transfer/TransferQueueOptions.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace courier::core {
class Config;
}

namespace courier::core::downloader {

/**
 * DownloadManager - Deduplicated, cached, prioritized downloads
 *
 * Features:
 * - One transfer per URL, shared by every caller asking for it
 * - Cache hits answered without scheduling
 * - Priority queue with bounded concurrency and retries
 * - Aggregated per-URL progress
 * - Extra destinations for callers joining an in-flight download
 */
class DownloadManager {
public:
    using Queue = transfer::TransferQueueManager<DownloadTask>;
    using Gate = transfer::TransferGate<DownloadTask, std::string>;
    using Outcome = Gate::Outcome;
    using TransferPtr = Queue::TransferPtr;
    using ProgressMap = std::map<std::string, transfer::TransferProgress>;
    using ProgressMapCallback = std::function<void(const ProgressMap&)>;

    struct Settings {
        transfer::TransferQueueOptions queue;

        // Empty = application cache path
        std::string cacheDirectory;
        size_t cacheMaxEntries{CacheManager::kDefaultMaxEntries};

        /**
         * Build from the "transfers.*" and "cache.*" configuration keys
         */
        static Settings fromConfig(const Config& config);
    };

    /**
     * Constructor
     * @param executor Performs each download
     * @param settings Queue and cache settings
     */
    DownloadManager(Queue::Executor executor, Settings settings);

    /**
     * Destructor - cancels outstanding downloads and waits for executors
     */
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * Cancel everything, wait for executors and persist the cache index.
     * Idempotent.
     */
    void shutdown();

    /**
     * Request a URL
     * @param url Source URL, also the deduplication key
     * @param destination Target path (empty = file inside the cache directory)
     * @param priority Scheduling tier
     * @return Cached, Attached or Created
     */
    Outcome enqueue(const std::string& url,
                    const std::string& destination = "",
                    transfer::TransferPriority priority = transfer::TransferPriority::Normal);

    /**
     * Request a fully described download (checksum, expected size)
     */
    Outcome enqueue(DownloadTask task,
                    transfer::TransferPriority priority = transfer::TransferPriority::Normal);

    /**
     * Enqueue and return the key to wait on
     */
    std::string addUrl(const std::string& url,
                       const std::string& destination = "",
                       transfer::TransferPriority priority = transfer::TransferPriority::Normal);

    /**
     * Enqueue several URLs into a directory, named after their last path segment
     * @param destinationDir Target directory (empty = cache directory)
     */
    std::vector<std::string> addUrls(const std::vector<std::string>& urls,
                                     const std::string& destinationDir = "",
                                     transfer::TransferPriority priority = transfer::TransferPriority::Normal);

    /**
     * Block until the download for url finishes
     * @return Local path on success; nullopt on failure, cancellation,
     *         timeout or unknown url
     */
    std::optional<std::string> waitFor(const std::string& url,
                                       std::chrono::milliseconds timeout = std::chrono::hours(24));

    /**
     * Block until the queue is idle
     * @return false on timeout
     */
    bool waitForAll(std::chrono::milliseconds timeout = std::chrono::hours(24));

    bool cancel(const std::string& url);
    void cancelAll();
    bool retry(const std::string& url);
    void pause();
    void start();

    /**
     * Pause or resume a single running download
     * @return false if the download is not in the right state
     */
    bool pauseDownload(const std::string& url);
    bool resumeDownload(const std::string& url);

    /**
     * Pause every running download and stop admissions; resumeAll undoes both
     */
    void pauseAll();
    void resumeAll();

    /**
     * Forget a URL: cancels it if active and drops its progress entry
     * @return false if the URL is unknown
     */
    bool remove(const std::string& url);

    /**
     * Forget every finished download and its progress entry
     * @return Number of transfers removed
     */
    size_t clearFinished();
    bool changePriority(const std::string& url, transfer::TransferPriority priority);
    bool moveToFront(const std::string& url);
    void setMaxConcurrent(size_t value);
    size_t maxConcurrent() const;

    TransferPtr getTransfer(const std::string& url) const;
    transfer::TransferQueueState state() const;

    /**
     * Latest progress of every URL requested so far
     */
    ProgressMap progressMap() const;

    std::optional<transfer::TransferProgress> progressFor(const std::string& url) const;

    /**
     * Observe the per-URL progress map; called on every change
     */
    SubscriptionPtr subscribeProgress(ProgressMapCallback callback);
    void unsubscribeProgress(const SubscriptionPtr& subscription);

    SubscriptionPtr subscribeState(Queue::StateCallback callback);
    void unsubscribeState(const SubscriptionPtr& subscription);

    Queue& queue() { return *m_queue; }
    CacheManager& getCacheManager() { return *m_cacheManager; }

private:
    /**
     * Record progress for url and notify observers
     */
    void updateProgress(const std::string& url, const transfer::TransferProgress& progress);

    /**
     * Record the transfer's current progress. Reads it under the progress
     * lock so a concurrent callback can never be overwritten by an older value.
     */
    void refreshProgress(const std::string& url,
                         const transfer::QueuedTransfer<DownloadTask>& transfer);

    /**
     * Copy a cached file to the requested destination if it lives elsewhere
     * @return false if the cache could not provide the file
     */
    bool materializeCached(const std::string& url, const std::string& cachedPath,
                           const std::string& destination);

    /**
     * Remember a destination for a download already heading elsewhere
     * @return false if it was already recorded
     */
    bool addExtraDestination(const std::string& url, const std::string& destination);
    std::vector<std::string> takeExtraDestinations(const std::string& url);

    /**
     * Copy a finished download into every extra destination
     * @param source Where the transfer itself wrote the file
     */
    void deliverExtraDestinations(const std::string& url, const std::string& source);

    // Drop finished entries whose transfer the queue no longer tracks
    void pruneProgressLocked(const std::string& keep);

private:
    std::unique_ptr<CacheManager> m_cacheManager;
    std::unique_ptr<Queue> m_queue;
    std::unique_ptr<Gate> m_gate;

    mutable std::mutex m_progressMutex;
    ProgressMap m_progress;
    // Cleared by remove() so late callbacks of a forgotten transfer are ignored
    std::map<std::string, std::shared_ptr<std::atomic<bool>>> m_tracking;
    Signal<ProgressMap> m_progressSignal;

    std::mutex m_destinationsMutex;
    std::map<std::string, std::vector<std::string>> m_extraDestinations;

    std::atomic<bool> m_shutdown{false};
};

} // namespace courier::core::downloader
