#pragma once

/**
 * Application.hpp
 *
 * Composition root: builds the download stack from configuration and
 * republishes transfer activity on the EventBus for presentation layers.
 */

#include "downloader/DownloadManager.hpp"
#include "Signal.hpp"

#include <memory>
#include <atomic>
#include <string>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace courier::core {

class Config;
class EventBus;

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

const char* toString(AppState state);

/**
 * Main application class
 *
 * Owns the DownloadManager and bridges it to the EventBus:
 * - "transfers.state"     queue snapshot (JSON) on every change
 * - "transfers.completed" {url, progress} once per finished download
 * - "transfers.failed"    {url, progress} once per failed download
 */
class Application {
public:
    using Executor = downloader::DownloadManager::Queue::Executor;

    /**
     * Constructor
     * @param bus Event bus receiving transfer events
     */
    explicit Application(EventBus& bus);
    Application();

    ~Application();

    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Build all subsystems
     * @param config Source of transfer and cache settings
     * @param executor Download executor (empty = local file copy)
     * @return true if initialization successful
     */
    bool initialize(const Config& config, Executor executor = nullptr);

    /**
     * Cancel outstanding transfers and tear everything down
     */
    void shutdown();

    AppState getState() const { return m_state.load(); }

    /**
     * Check if application is running
     * @return true if Ready
     */
    bool isRunning() const;

    /**
     * Get download manager instance
     * @return Shared pointer to DownloadManager (null before initialize)
     */
    std::shared_ptr<downloader::DownloadManager> getDownloadManager() const { return m_downloadManager; }

    // Invoked on the thread that changes the state
    SubscriptionPtr onStateChange(std::function<void(const AppState&)> callback);

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "Courier"; }

private:
    void setState(AppState state);

    bool initializeDownloader(const Config& config, Executor executor);

    /**
     * Emit completed/failed events for downloads that newly reached them
     */
    void publishFinished(const downloader::DownloadManager::ProgressMap& progress);

private:
    EventBus& m_bus;

    std::atomic<AppState> m_state{AppState::Uninitialized};

    Signal<AppState> m_stateSignal;

    std::shared_ptr<downloader::DownloadManager> m_downloadManager;
    SubscriptionPtr m_stateSubscription;
    SubscriptionPtr m_progressSubscription;

    // Last terminal status announced per URL
    std::mutex m_reportedMutex;
    std::unordered_map<std::string, transfer::TransferStatus> m_reported;
};

} // namespace courier::core
