#pragma once

/**
 * CacheManager.hpp
 *
 * URL -> local file index backing the transfer gate.
 * Finished downloads are recorded here so that requesting the same URL again
 * is answered without scheduling a transfer.
 */

#include "../transfer/ResultCache.hpp"

#include <string>
#include <filesystem>
#include <unordered_map>
#include <mutex>
#include <optional>
#include <chrono>
#include <cstdint>

namespace courier::core::downloader {

/**
 * Cache entry metadata
 */
struct CacheEntry {
    std::string url;
    std::string localPath;
    int64_t size{0};
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point lastAccess;
    int accessCount{0};

    // LRU order within this process
    uint64_t accessTick{0};
};

/**
 * Outcome of a detailed lookup
 */
enum class CacheLookupStatus {
    Hit,
    Miss,
    Stale   // Indexed, but the file is gone; the entry was dropped
};

struct CacheLookup {
    CacheLookupStatus status{CacheLookupStatus::Miss};
    std::optional<CacheEntry> entry;

    bool isHit() const { return status == CacheLookupStatus::Hit; }
};

/**
 * CacheManager - Persistent URL cache
 *
 * Features:
 * - Lookup by URL reporting hit/miss/stale
 * - LRU eviction past a maximum entry count
 * - JSON index persisted in the cache directory
 * - Hit/miss counters
 */
class CacheManager : public transfer::ResultCache<std::string> {
public:
    static constexpr size_t kDefaultMaxEntries = 1000;

    CacheManager();
    ~CacheManager() override;

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    /**
     * Initialize cache
     * @param cachePath Cache directory path (index.json lives here)
     * @param maxEntries Maximum number of indexed entries
     */
    void initialize(const std::string& cachePath, size_t maxEntries = kDefaultMaxEntries);

    /**
     * Persist the index and stop accepting entries
     */
    void shutdown();

    bool isInitialized() const;

    /**
     * Gate lookup: local path for a URL whose file still exists
     */
    std::optional<std::string> lookup(const std::string& url) override;

    /**
     * Gate store: record a finished download
     */
    void store(const std::string& url, const std::string& localPath) override;

    /**
     * Detailed lookup. Updates LRU order and hit/miss counters.
     */
    CacheLookup lookupEntry(const std::string& url);

    /**
     * Check if a URL is indexed (no counters, no file check)
     */
    bool has(const std::string& url) const;

    /**
     * Copy the cached file for a URL to destination
     * @return true if copied successfully
     */
    bool copyTo(const std::string& url, const std::string& destination);

    /**
     * Remove an entry from the index
     * @return true if removed
     */
    bool remove(const std::string& url);

    /**
     * Drop every entry and reset counters
     */
    void clear();

    /**
     * Stable file path inside the cache directory for a URL
     * (SHA-1 of the URL, keeping the URL's extension)
     */
    std::filesystem::path cachePathFor(const std::string& url) const;

    std::filesystem::path getCacheDirectory() const;

    size_t getMaxEntries() const;
    void setMaxEntries(size_t maxEntries);

    size_t getHitCount() const;
    size_t getMissCount() const;
    size_t getEntryCount() const;

    /**
     * Drop entries whose files no longer exist
     * @return Number of entries dropped
     */
    size_t runMaintenance();

private:
    void loadIndex();
    void saveIndex() const;

    /**
     * Evict least recently used entries until within maxEntries
     */
    void evict();

    std::string getLRUEntry() const;

private:
    std::filesystem::path m_cachePath;
    std::unordered_map<std::string, CacheEntry> m_entries;
    mutable std::mutex m_mutex;

    size_t m_maxEntries{kDefaultMaxEntries};
    size_t m_hitCount{0};
    size_t m_missCount{0};
    uint64_t m_tick{0};

    bool m_initialized{false};
};

} // namespace courier::core::downloader
