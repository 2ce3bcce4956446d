#pragma once

/**
 * Config.hpp
 *
 * JSON configuration with dot-notation keys ("transfers.maxConcurrent").
 * A file loaded with load() is merged over the built-in defaults, so a
 * config file only needs the keys it changes.
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace courier::core {

using json = nlohmann::json;

class Config {
public:
    // Configuration used by the CLI
    static Config& instance() {
        static Config config;
        return config;
    }

    Config() : m_values(defaults()) {}

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json defaults() {
        return {
            {"transfers", {
                {"maxConcurrent", 3},
                {"autoStart", true},
                {"autoRetry", false},
                {"maxRetries", 3},
                {"historyLimit", 100}
            }},
            {"cache", {
                {"directory", ""},
                {"maxEntries", 1000}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""}
            }}
        };
    }

    /**
     * Merge a JSON file over the current values
     * @return false if the file is missing or not a JSON object; values are unchanged
     */
    bool load(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            COURIER_LOG_DEBUG("No configuration at {}", path);
            return false;
        }

        json parsed = json::parse(file, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            COURIER_LOG_WARN("Configuration {} is not a JSON object", path);
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_values.merge_patch(parsed);
        m_path = path;
        return true;
    }

    /**
     * Write all values as indented JSON, creating parent directories
     * @param path Target file; empty reuses the last loaded path
     */
    bool save(const std::string& path = "") {
        std::string target;
        std::string contents;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            target = path.empty() ? m_path : path;
            contents = m_values.dump(4);
        }
        if (target.empty()) {
            return false;
        }

        std::error_code ec;
        auto parent = std::filesystem::path(target).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }

        std::ofstream file(target, std::ios::trunc);
        if (ec || !(file << contents)) {
            COURIER_LOG_WARN("Could not write configuration {}", target);
            return false;
        }
        return true;
    }

    /**
     * Typed lookup; a missing key or a value of another type yields defaultValue
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto pointer = toPointer(key);
        if (!m_values.contains(pointer)) {
            return defaultValue;
        }
        try {
            return m_values.at(pointer).get<T>();
        } catch (const json::type_error&) {
            return defaultValue;
        }
    }

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values[toPointer(key)] = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_values.contains(toPointer(key));
    }

    void merge(const json& patch) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values.merge_patch(patch);
    }

private:
    // "a.b.c" -> "/a/b/c"
    static json::json_pointer toPointer(std::string key) {
        for (auto& c : key) {
            if (c == '.') c = '/';
        }
        return json::json_pointer("/" + key);
    }

    mutable std::mutex m_mutex;
    json m_values;
    std::string m_path;
};

} // namespace courier::core
