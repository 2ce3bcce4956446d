#pragma once

/**
 * KeyedMutex.hpp
 *
 * Table of mutexes created on demand per key. Distinct keys never contend;
 * an entry lives only while someone holds or waits for it.
 */

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace courier::core::transfer {

class KeyedMutex {
public:
    /**
     * RAII ownership of one key. Move-only; unlocks on destruction.
     */
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool ownsLock() const { return m_owner != nullptr; }
        const std::string& key() const { return m_key; }

        /**
         * Release early; no-op if not owning
         */
        void unlock();

    private:
        friend class KeyedMutex;
        Guard(KeyedMutex* owner, std::string key);

        KeyedMutex* m_owner{nullptr};
        std::string m_key;
    };

    KeyedMutex() = default;
    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    /**
     * Block until the key is free, then take it
     */
    Guard lock(const std::string& key);

    /**
     * Take the key only if nobody holds it
     * @return Non-owning guard when the key is busy
     */
    Guard tryLock(const std::string& key);

    bool isLocked(const std::string& key) const;

    /**
     * Threads currently blocked in lock() for the key
     */
    size_t waiterCount(const std::string& key) const;

    /**
     * Keys with a holder or waiter
     */
    size_t size() const;

private:
    struct Entry {
        bool locked{false};
        size_t waiters{0};
        std::condition_variable released;
    };

    void release(const std::string& key);

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
};

} // namespace courier::core::transfer
