#pragma once

/**
 * PathUtils.hpp
 *
 * Per-user locations for Courier's config, cache and logs.
 */

#include <cstdlib>
#include <filesystem>
#include <string>

namespace courier::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    /**
     * Root of Courier's state: $COURIER_HOME when set, otherwise a "Courier"
     * directory under the platform's per-user data directory
     */
    static fs::path getCourierPath() {
        if (auto home = env("COURIER_HOME")) {
            return fs::path(home);
        }
        return platformDataPath() / "Courier";
    }

    static fs::path getConfigPath() { return getCourierPath() / "config.json"; }
    static fs::path getCachePath() { return getCourierPath() / "cache"; }
    static fs::path getLogsPath() { return getCourierPath() / "logs"; }

    // Configured directory if any, else the fallback
    static fs::path resolveDirectory(const std::string& configured, const fs::path& fallback) {
        return configured.empty() ? fallback : fs::path(configured);
    }

private:
    static const char* env(const char* name) {
        const char* value = std::getenv(name);
        return (value && *value) ? value : nullptr;
    }

    static fs::path platformDataPath() {
#ifdef _WIN32
        if (auto appData = env("APPDATA")) return fs::path(appData);
#elif defined(__APPLE__)
        if (auto home = env("HOME")) return fs::path(home) / "Library" / "Application Support";
#else
        if (auto dataHome = env("XDG_DATA_HOME")) return fs::path(dataHome);
        if (auto home = env("HOME")) return fs::path(home) / ".local" / "share";
#endif
        return fs::temp_directory_path();
    }
};

} // namespace courier::utils
