/**
 * StringUtils.cpp
 */

#include "StringUtils.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cctype>
#include <random>

namespace courier::utils {

bool StringUtils::startsWithIgnoreCase(const std::string& str, const std::string& prefix) {
    if (str.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(str[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::string StringUtils::formatBytes(int64_t bytes) {
    if (bytes < 0) return "--";

    static constexpr std::array<const char*, 5> kUnits{"B", "KB", "MB", "GB", "TB"};
    size_t unit = 0;
    double value = static_cast<double>(bytes);
    for (; value >= 1024.0 && unit + 1 < kUnits.size(); ++unit) {
        value /= 1024.0;
    }

    if (unit == 0) {
        return fmt::format("{} B", bytes);
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

std::string StringUtils::formatSpeed(double bytesPerSecond) {
    if (bytesPerSecond <= 0.0) return "--";
    return formatBytes(static_cast<int64_t>(bytesPerSecond)) + "/s";
}

std::string StringUtils::formatDuration(std::chrono::seconds duration) {
    auto total = duration.count();
    if (total < 0) total = 0;

    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    if (hours > 0) return fmt::format("{}h {:02}m", hours, minutes);
    if (minutes > 0) return fmt::format("{}m {:02}s", minutes, seconds);
    return fmt::format("{}s", seconds);
}

std::string StringUtils::formatPercentage(double ratio, int precision) {
    return fmt::format("{:.{}f}%", ratio * 100.0, precision);
}

std::string StringUtils::generateUUID() {
    thread_local std::mt19937_64 engine{std::random_device{}()};

    uint64_t high = engine();
    uint64_t low = engine();
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;    // RFC 4122 variant

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       high >> 32, (high >> 16) & 0xFFFF, high & 0xFFFF,
                       low >> 48, low & 0xFFFFFFFFFFFFULL);
}

} // namespace courier::utils
