/**
 * Courier - Transfer scheduler command line
 *
 * Queues local files (paths or file:// URLs) for copying into a destination
 * directory, with bounded concurrency, deduplication and a persistent cache.
 */

#include <memory>
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Logger.hpp"
#include "core/Config.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

// Global application instance
std::unique_ptr<courier::core::Application> g_app;

// Set from the signal handler, consumed by the wait loop
std::atomic<bool> g_interrupted{false};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int) {
    g_interrupted = true;
}

/**
 * Setup signal handlers for graceful shutdown
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, signalHandler);
#endif
}

void printUsage(const char* program) {
    std::cout << "Courier - Concurrent transfer scheduler\n"
              << "\nUsage: " << program << " [options] SOURCE...\n"
              << "\nSOURCE is a local path or a file:// URL.\n"
              << "\nOptions:\n"
              << "  -o, --output DIR     Destination directory (default: current directory)\n"
              << "  -c, --config FILE    Configuration file (default: "
              << courier::utils::PathUtils::getConfigPath().string() << ")\n"
              << "  -j, --jobs N         Maximum concurrent transfers\n"
              << "      --retries N      Retry failed transfers up to N times\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

/**
 * Parse a positive integer option value
 */
bool parseCount(const std::string& value, int& out) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size() || parsed < 0) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

/**
 * Load configuration, creating the default file on first run
 */
bool loadConfiguration(const std::string& explicitPath) {
    auto& logger = courier::core::Logger::instance();
    auto& config = courier::core::Config::instance();

    if (!explicitPath.empty()) {
        if (!config.load(explicitPath)) {
            logger.error("Could not read configuration {}", explicitPath);
            return false;
        }
        logger.info("Configuration loaded from {}", explicitPath);
        return true;
    }

    auto configPath = courier::utils::PathUtils::getConfigPath();
    if (fs::exists(configPath)) {
        if (config.load(configPath.string())) {
            logger.info("Configuration loaded from {}", configPath.string());
        } else {
            logger.warn("Ignoring unreadable configuration {}", configPath.string());
        }
    } else if (config.save(configPath.string())) {
        logger.info("Default configuration created at {}", configPath.string());
    }
    return true;
}

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    bool debugMode = false;
    std::string outputDir = ".";
    std::string configPath;
    int jobs = -1;
    int retries = -1;
    std::vector<std::string> sources;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << courier::core::Application::getName() << " v"
                      << courier::core::Application::getVersion() << std::endl;
            return 0;
        } else if (arg == "--output" || arg == "-o") {
            if (!next(outputDir)) return 2;
        } else if (arg == "--config" || arg == "-c") {
            if (!next(configPath)) return 2;
        } else if (arg == "--jobs" || arg == "-j" || arg == "--retries") {
            std::string value;
            if (!next(value)) return 2;
            int& target = arg == "--retries" ? retries : jobs;
            if (!parseCount(value, target) || (arg != "--retries" && target < 1)) {
                std::cerr << "Invalid value for " << arg << ": " << value << std::endl;
                return 2;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        } else {
            sources.push_back(arg);
        }
    }

    if (sources.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    auto& config = courier::core::Config::instance();
    auto& logger = courier::core::Logger::instance();

    // Console-only until the configured log directory is known
    logger.initialize(debugMode ? courier::core::LogLevel::Debug : courier::core::LogLevel::Info);

    if (!loadConfiguration(configPath)) {
        return 1;
    }

    auto logDir = courier::utils::PathUtils::resolveDirectory(
        config.get<std::string>("logging.directory", ""),
        courier::utils::PathUtils::getLogsPath());
    auto level = debugMode ? courier::core::LogLevel::Debug
                           : courier::core::Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    logger.initialize(level, logDir.string());

    if (jobs > 0) {
        config.set("transfers.maxConcurrent", jobs);
    }
    if (retries >= 0) {
        config.set("transfers.autoRetry", retries > 0);
        config.set("transfers.maxRetries", retries);
    }

    setupSignalHandlers();

    try {
        g_app = std::make_unique<courier::core::Application>();
        if (!g_app->initialize(config)) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        auto downloads = g_app->getDownloadManager();
        auto keys = downloads->addUrls(sources, fs::absolute(outputDir).string());
        downloads->start();

        bool cancelled = false;
        while (!downloads->waitForAll(std::chrono::milliseconds(200))) {
            if (g_interrupted && !cancelled) {
                logger.warn("Interrupted, cancelling transfers...");
                downloads->cancelAll();
                cancelled = true;
            }
        }

        size_t failures = 0;
        for (const auto& key : keys) {
            auto progress = downloads->progressFor(key);
            if (progress && progress->isCompleted()) {
                std::cout << "OK    " << key << " ("
                          << courier::utils::StringUtils::formatBytes(progress->bytesTransferred)
                          << ")" << std::endl;
            } else {
                ++failures;
                std::string reason = progress ? progress->errorMessage.value_or(
                                                    courier::core::transfer::toString(progress->status))
                                              : "not scheduled";
                std::cout << "FAIL  " << key << ": " << reason << std::endl;
            }
        }

        g_app->shutdown();
        g_app.reset();

        if (g_interrupted) return 130;
        return failures == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
