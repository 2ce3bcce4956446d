#include "KeyedMutex.hpp"

#include <utility>

namespace courier::core::transfer {

KeyedMutex::Guard::Guard(KeyedMutex* owner, std::string key)
    : m_owner(owner), m_key(std::move(key)) {}

KeyedMutex::Guard::Guard(Guard&& other) noexcept
    : m_owner(other.m_owner), m_key(std::move(other.m_key)) {
    other.m_owner = nullptr;
}

KeyedMutex::Guard& KeyedMutex::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        unlock();
        m_owner = other.m_owner;
        m_key = std::move(other.m_key);
        other.m_owner = nullptr;
    }
    return *this;
}

KeyedMutex::Guard::~Guard() {
    unlock();
}

void KeyedMutex::Guard::unlock() {
    if (m_owner) {
        m_owner->release(m_key);
        m_owner = nullptr;
    }
}

KeyedMutex::Guard KeyedMutex::lock(const std::string& key) {
    std::unique_lock<std::mutex> lock(m_mutex);

    // unordered_map keeps element addresses stable across rehashing
    Entry& entry = m_entries[key];
    ++entry.waiters;
    entry.released.wait(lock, [&entry] { return !entry.locked; });
    --entry.waiters;
    entry.locked = true;

    return Guard(this, key);
}

KeyedMutex::Guard KeyedMutex::tryLock(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(key);
    if (it != m_entries.end() && it->second.locked) {
        return Guard();
    }

    m_entries[key].locked = true;
    return Guard(this, key);
}

bool KeyedMutex::isLocked(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    return it != m_entries.end() && it->second.locked;
}

size_t KeyedMutex::waiterCount(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    return it != m_entries.end() ? it->second.waiters : 0;
}

size_t KeyedMutex::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void KeyedMutex::release(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(key);
    if (it == m_entries.end()) return;

    it->second.locked = false;
    if (it->second.waiters == 0) {
        m_entries.erase(it);
    } else {
        it->second.released.notify_one();
    }
}

} // namespace courier::core::transfer
