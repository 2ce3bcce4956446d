#pragma once

/**
 * ResultCache.hpp
 *
 * Lookup backend of the TransferGate: completed results keyed by the
 * logical resource identity.
 */

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace courier::core::transfer {

template<typename R>
class ResultCache {
public:
    virtual ~ResultCache() = default;

    /**
     * @return The cached result, or nullopt on miss
     */
    virtual std::optional<R> lookup(const std::string& key) = 0;

    virtual void store(const std::string& key, const R& result) = 0;
};

/**
 * In-memory implementation, unbounded
 */
template<typename R>
class MemoryResultCache : public ResultCache<R> {
public:
    std::optional<R> lookup(const std::string& key) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_results.find(key);
        if (it == m_results.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void store(const std::string& key, const R& result) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_results[key] = result;
    }

    bool erase(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_results.erase(key) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_results.size();
    }

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, R> m_results;
};

} // namespace courier::core::transfer
