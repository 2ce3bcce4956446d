// Courier - String Utilities
// Human-readable formatting for progress output and transfer id generation

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace courier::utils {

class StringUtils {
public:
    // Case-insensitive prefix test ("FILE://x" matches "file://")
    static bool startsWithIgnoreCase(const std::string& str, const std::string& prefix);

    /**
     * @brief Binary-unit size ("1.5 MB"); negative sizes (unknown) render as "--"
     */
    static std::string formatBytes(int64_t bytes);

    static std::string formatSpeed(double bytesPerSecond);

    /**
     * @brief Compact remaining-time rendering: "45s", "3m 07s", "2h 05m"
     */
    static std::string formatDuration(std::chrono::seconds duration);

    // ratio in [0,1] -> "42.0%"
    static std::string formatPercentage(double ratio, int precision = 1);

    /**
     * @brief Random RFC 4122 version-4 identifier, used for transfers added without an id
     */
    static std::string generateUUID();
};

} // namespace courier::utils
