/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "Config.hpp"
#include "EventBus.hpp"
#include "downloader/FileCopyExecutor.hpp"
#include "transfer/TransferQueueState.hpp"

#include <chrono>

namespace courier::core {

const char* toString(AppState state) {
    switch (state) {
        case AppState::Uninitialized: return "uninitialized";
        case AppState::Initializing:  return "initializing";
        case AppState::Ready:         return "ready";
        case AppState::ShuttingDown:  return "shutting-down";
        case AppState::Error:         return "error";
    }
    return "unknown";
}

Application::Application(EventBus& bus)
    : m_bus(bus) {
    Logger::instance().debug("Application instance created");
}

Application::Application()
    : Application(EventBus::instance()) {}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
    Logger::instance().debug("Application instance destroyed");
}

bool Application::initialize(const Config& config, Executor executor) {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    Logger::instance().info("Initializing application...");

    auto startTime = std::chrono::steady_clock::now();

    if (!initializeDownloader(config, std::move(executor))) {
        Logger::instance().error("Failed to initialize downloader");
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());

    setState(AppState::Ready);
    m_bus.emit(events::AppInitialized, {{"version", getVersion()}});

    return true;
}

void Application::shutdown() {
    auto state = m_state.load();
    if (state == AppState::ShuttingDown || state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    if (m_downloadManager) {
        m_downloadManager->unsubscribeState(m_stateSubscription);
        m_downloadManager->unsubscribeProgress(m_progressSubscription);
        m_downloadManager->shutdown();
        m_downloadManager.reset();
    }
    m_stateSubscription.reset();
    m_progressSubscription.reset();

    m_bus.emit(events::AppShutdown);
    Logger::instance().info("Application shutdown complete");

    setState(AppState::Uninitialized);
}

bool Application::isRunning() const {
    return m_state.load() == AppState::Ready;
}

SubscriptionPtr Application::onStateChange(std::function<void(const AppState&)> callback) {
    return m_stateSignal.connect(std::move(callback));
}

void Application::setState(AppState state) {
    m_state = state;
    Logger::instance().debug("Application state: {}", toString(state));
    m_stateSignal.emit(state);
}

bool Application::initializeDownloader(const Config& config, Executor executor) {
    try {
        if (!executor) {
            executor = downloader::FileCopyExecutor();
        }

        auto settings = downloader::DownloadManager::Settings::fromConfig(config);
        m_downloadManager = std::make_shared<downloader::DownloadManager>(
            std::move(executor), std::move(settings));

        m_stateSubscription = m_downloadManager->subscribeState(
            [this](const transfer::TransferQueueState& state) {
                m_bus.emit(events::TransfersState, json(state));
            });

        m_progressSubscription = m_downloadManager->subscribeProgress(
            [this](const downloader::DownloadManager::ProgressMap& progress) {
                publishFinished(progress);
            });

        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Downloader initialization error: {}", e.what());
        m_downloadManager.reset();
        return false;
    }
}

void Application::publishFinished(const downloader::DownloadManager::ProgressMap& progress) {
    std::vector<std::pair<std::string, transfer::TransferProgress>> finished;
    {
        std::lock_guard<std::mutex> lock(m_reportedMutex);
        // URLs the download manager has forgotten
        for (auto it = m_reported.begin(); it != m_reported.end();) {
            if (progress.count(it->first) == 0) {
                it = m_reported.erase(it);
            } else {
                ++it;
            }
        }
        for (const auto& [url, p] : progress) {
            if (!p.isCompleted() && !p.isFailed()) {
                // A retried download may finish again
                m_reported.erase(url);
                continue;
            }
            auto it = m_reported.find(url);
            if (it != m_reported.end() && it->second == p.status) {
                continue;
            }
            m_reported[url] = p.status;
            finished.emplace_back(url, p);
        }
    }

    for (const auto& [url, p] : finished) {
        json payload = {{"url", url}, {"progress", p}};
        m_bus.emit(p.isCompleted() ? events::TransferCompleted : events::TransferFailed, payload);
    }
}

} // namespace courier::core
