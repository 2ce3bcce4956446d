/**
 * CacheManager.cpp
 *
 * Persistent URL cache with LRU eviction.
 */

#include "CacheManager.hpp"
#include "../Logger.hpp"
#include "../../utils/HashUtils.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <algorithm>
#include <vector>

namespace courier::core::downloader {

using json = nlohmann::json;

namespace {

int64_t toMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromMillis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

CacheManager::CacheManager() = default;

CacheManager::~CacheManager() {
    shutdown();
}

void CacheManager::initialize(const std::string& cachePath, size_t maxEntries) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_cachePath = cachePath;
    m_maxEntries = maxEntries > 0 ? maxEntries : kDefaultMaxEntries;
    m_entries.clear();

    std::error_code ec;
    std::filesystem::create_directories(m_cachePath, ec);
    if (ec) {
        Logger::instance().warn("Could not create cache directory {}: {}", cachePath, ec.message());
    }

    loadIndex();
    evict();

    m_initialized = true;
    Logger::instance().info("CacheManager initialized at {} ({} entries)", cachePath, m_entries.size());
}

void CacheManager::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) return;

    saveIndex();
    m_initialized = false;
}

bool CacheManager::isInitialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized;
}

std::optional<std::string> CacheManager::lookup(const std::string& url) {
    auto result = lookupEntry(url);
    if (!result.isHit()) {
        return std::nullopt;
    }
    return result.entry->localPath;
}

void CacheManager::store(const std::string& url, const std::string& localPath) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_initialized) {
        Logger::instance().warn("Cache not initialized, not storing {}", url);
        return;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(localPath, ec);
    if (ec) {
        Logger::instance().warn("Not caching {}: {} is unreadable ({})", url, localPath, ec.message());
        return;
    }

    auto now = std::chrono::system_clock::now();

    CacheEntry entry;
    entry.url = url;
    entry.localPath = localPath;
    entry.size = static_cast<int64_t>(size);
    entry.createdAt = now;
    entry.lastAccess = now;
    entry.accessCount = 0;
    entry.accessTick = ++m_tick;

    m_entries[url] = entry;
    evict();
    saveIndex();

    Logger::instance().debug("Cached {} -> {}", url, localPath);
}

CacheLookup CacheManager::lookupEntry(const std::string& url) {
    std::lock_guard<std::mutex> lock(m_mutex);

    CacheLookup result;

    auto it = m_entries.find(url);
    if (it == m_entries.end()) {
        ++m_missCount;
        Logger::instance().debug("Cache miss: {}", url);
        return result;
    }

    if (!std::filesystem::exists(it->second.localPath)) {
        Logger::instance().debug("Cache entry for {} is stale, {} is gone", url, it->second.localPath);
        result.status = CacheLookupStatus::Stale;
        result.entry = it->second;
        m_entries.erase(it);
        ++m_missCount;
        saveIndex();
        return result;
    }

    it->second.lastAccess = std::chrono::system_clock::now();
    it->second.accessTick = ++m_tick;
    ++it->second.accessCount;
    ++m_hitCount;

    result.status = CacheLookupStatus::Hit;
    result.entry = it->second;
    return result;
}

bool CacheManager::has(const std::string& url) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.find(url) != m_entries.end();
}

bool CacheManager::copyTo(const std::string& url, const std::string& destination) {
    auto cached = lookup(url);
    if (!cached) return false;

    try {
        auto src = std::filesystem::path(*cached);
        auto dst = std::filesystem::path(destination);
        if (std::filesystem::exists(dst) && std::filesystem::equivalent(src, dst)) {
            return true;
        }

        if (dst.has_parent_path()) {
            std::filesystem::create_directories(dst.parent_path());
        }
        std::filesystem::copy_file(src, dst,
            std::filesystem::copy_options::overwrite_existing);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Cache copyTo error: {}", e.what());
        return false;
    }
}

bool CacheManager::remove(const std::string& url) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(url);
    if (it == m_entries.end()) return false;

    m_entries.erase(it);
    saveIndex();
    return true;
}

void CacheManager::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_entries.clear();
    m_hitCount = 0;
    m_missCount = 0;

    saveIndex();
}

std::filesystem::path CacheManager::cachePathFor(const std::string& url) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string name = utils::HashUtils::sha1String(url);

    // Keep the extension of the last path segment so tools recognize the file
    auto query = url.find_first_of("?#");
    std::string path = url.substr(0, query);
    auto ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext.size() <= 10) {
        name += ext;
    }

    return m_cachePath / name;
}

std::filesystem::path CacheManager::getCacheDirectory() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cachePath;
}

size_t CacheManager::getMaxEntries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_maxEntries;
}

void CacheManager::setMaxEntries(size_t maxEntries) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_maxEntries = maxEntries > 0 ? maxEntries : kDefaultMaxEntries;

    if (m_entries.size() > m_maxEntries) {
        evict();
        saveIndex();
    }
}

size_t CacheManager::getHitCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hitCount;
}

size_t CacheManager::getMissCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_missCount;
}

size_t CacheManager::getEntryCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

size_t CacheManager::runMaintenance() {
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t dropped = 0;
    for (auto it = m_entries.begin(); it != m_entries.end(); ) {
        if (!std::filesystem::exists(it->second.localPath)) {
            it = m_entries.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }

    if (dropped > 0) {
        saveIndex();
    }
    return dropped;
}

void CacheManager::loadIndex() {
    auto indexPath = m_cachePath / "index.json";
    if (!std::filesystem::exists(indexPath)) return;

    try {
        std::ifstream file(indexPath);
        auto j = json::parse(file);

        std::vector<CacheEntry> loaded;
        for (const auto& data : j.value("entries", json::array())) {
            CacheEntry entry;
            entry.url = data.value("url", "");
            entry.localPath = data.value("localPath", "");
            entry.size = data.value("size", int64_t(0));
            entry.createdAt = fromMillis(data.value("createdAt", int64_t(0)));
            entry.lastAccess = fromMillis(data.value("lastAccess", int64_t(0)));
            entry.accessCount = data.value("accessCount", 0);

            if (entry.url.empty() || entry.localPath.empty()) continue;
            loaded.push_back(entry);
        }

        // Rebuild LRU order from the persisted access times
        std::sort(loaded.begin(), loaded.end(), [](const CacheEntry& a, const CacheEntry& b) {
            return a.lastAccess < b.lastAccess;
        });
        for (auto& entry : loaded) {
            entry.accessTick = ++m_tick;
            m_entries[entry.url] = entry;
        }
    } catch (const std::exception& e) {
        Logger::instance().warn("Failed to load cache index: {}", e.what());
    }
}

void CacheManager::saveIndex() const {
    if (m_cachePath.empty()) return;

    auto indexPath = m_cachePath / "index.json";

    try {
        json entries = json::array();
        for (const auto& [url, entry] : m_entries) {
            entries.push_back({
                {"url", entry.url},
                {"localPath", entry.localPath},
                {"size", entry.size},
                {"createdAt", toMillis(entry.createdAt)},
                {"lastAccess", toMillis(entry.lastAccess)},
                {"accessCount", entry.accessCount}
            });
        }

        json j = {
            {"version", 1},
            {"entries", entries}
        };

        std::ofstream file(indexPath);
        if (!file.is_open()) {
            Logger::instance().warn("Failed to save cache index: cannot open {}", indexPath.string());
            return;
        }
        file << j.dump(2);
    } catch (const std::exception& e) {
        Logger::instance().warn("Failed to save cache index: {}", e.what());
    }
}

void CacheManager::evict() {
    while (m_entries.size() > m_maxEntries) {
        auto lru = getLRUEntry();
        if (lru.empty()) break;

        Logger::instance().debug("Evicting cache entry {}", lru);
        m_entries.erase(lru);
    }
}

std::string CacheManager::getLRUEntry() const {
    std::string lruUrl;
    uint64_t oldest = UINT64_MAX;

    for (const auto& [url, entry] : m_entries) {
        if (entry.accessTick < oldest) {
            oldest = entry.accessTick;
            lruUrl = url;
        }
    }

    return lruUrl;
}

} // namespace courier::core::downloader
