#pragma once

/**
 * Logger.hpp
 *
 * Process-wide spdlog logger for the transfer core and the CLI.
 * Calls made before initialize() are dropped, so library code and unit
 * tests log unconditionally.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace courier::core {

// Same order as spdlog::level::level_enum
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * (Re)build the sinks. May be called again once the log directory is
     * known; the previous logger is replaced.
     * @param level Minimum level for the console; the file sink records everything
     * @param logDir Directory for courier.log, empty for console only
     */
    void initialize(LogLevel level, const std::string& logDir = "") {
        std::vector<spdlog::sink_ptr> sinks;
        std::string fileError;

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(toSpdlog(level));
        console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console);

        if (!logDir.empty()) {
            try {
                sinks.push_back(makeFileSink(logDir));
            } catch (const std::exception& e) {
                fileError = e.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>("courier", sinks.begin(), sinks.end());
        logger->set_level(toSpdlog(level));
        logger->flush_on(spdlog::level::warn);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_logger = logger;
        }

        if (!fileError.empty()) {
            logger->warn("File logging disabled ({}): {}", logDir, fileError);
        }
    }

    /**
     * Level from its configuration name; unknown names yield Info
     */
    static LogLevel parseLevel(const std::string& name) {
        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            return LogLevel::Info;
        }
        return static_cast<LogLevel>(level);
    }

    template<typename... Args>
    void log(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = current()) {
            logger->log(toSpdlog(level), fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> current() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_logger;
    }

    // courier.log, 10 MB x 5 rotated files
    static spdlog::sink_ptr makeFileSink(const std::string& logDir) {
        std::filesystem::create_directories(logDir);
        auto path = std::filesystem::path(logDir) / "courier.log";

        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path.string(), 10 * 1024 * 1024, 5);
        sink->set_level(spdlog::level::trace);
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        return sink;
    }

    static spdlog::level::level_enum toSpdlog(LogLevel level) {
        return static_cast<spdlog::level::level_enum>(level);
    }

    std::mutex m_mutex;
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace courier::core

#define COURIER_LOG_TRACE(...)    courier::core::Logger::instance().trace(__VA_ARGS__)
#define COURIER_LOG_DEBUG(...)    courier::core::Logger::instance().debug(__VA_ARGS__)
#define COURIER_LOG_INFO(...)     courier::core::Logger::instance().info(__VA_ARGS__)
#define COURIER_LOG_WARN(...)     courier::core::Logger::instance().warn(__VA_ARGS__)
#define COURIER_LOG_ERROR(...)    courier::core::Logger::instance().error(__VA_ARGS__)
#define COURIER_LOG_CRITICAL(...) courier::core::Logger::instance().critical(__VA_ARGS__)
