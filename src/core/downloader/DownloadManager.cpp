/**
 * DownloadManager.cpp
 *
 * Implementation of the deduplicating download front end.
 */

#include "DownloadManager.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/PathUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <stdexcept>
#include <variant>

namespace courier::core::downloader {

using transfer::TransferPriority;
using transfer::TransferProgress;

namespace {

// Last path segment of a URL, or its SHA-1 when it has none
std::string fileNameFor(const std::string& url) {
    auto end = url.find_first_of("?#");
    auto name = std::filesystem::path(url.substr(0, end)).filename().string();
    return name.empty() ? utils::HashUtils::sha1String(url) : name;
}

} // namespace

DownloadManager::Settings DownloadManager::Settings::fromConfig(const Config& config) {
    Settings settings;
    settings.queue = transfer::TransferQueueOptions::fromConfig(config);
    settings.cacheDirectory = config.get<std::string>("cache.directory", "");

    int maxEntries = config.get<int>("cache.maxEntries",
                                     static_cast<int>(CacheManager::kDefaultMaxEntries));
    settings.cacheMaxEntries = maxEntries > 0 ? static_cast<size_t>(maxEntries)
                                              : CacheManager::kDefaultMaxEntries;
    return settings;
}

DownloadManager::DownloadManager(Queue::Executor executor, Settings settings)
    : m_cacheManager(std::make_unique<CacheManager>()) {

    auto cacheDir = utils::PathUtils::resolveDirectory(settings.cacheDirectory,
                                                       utils::PathUtils::getCachePath());
    m_cacheManager->initialize(cacheDir.string(), settings.cacheMaxEntries);

    m_queue = std::make_unique<Queue>(std::move(executor), settings.queue);
    m_gate = std::make_unique<Gate>(*m_queue, *m_cacheManager,
        [](const DownloadTask& task, const TransferProgress&) -> std::optional<std::string> {
            return task.destination;
        });

    Logger::instance().info("DownloadManager initialized (max concurrent: {}, cache: {})",
                            settings.queue.maxConcurrent, cacheDir.string());
}

DownloadManager::~DownloadManager() {
    shutdown();
}

void DownloadManager::shutdown() {
    if (m_shutdown.exchange(true)) return;

    Logger::instance().info("Shutting down DownloadManager");

    m_queue->dispose();
    m_cacheManager->shutdown();
    m_progressSignal.clear();
}

DownloadManager::Outcome DownloadManager::enqueue(const std::string& url,
                                                  const std::string& destination,
                                                  TransferPriority priority) {
    return enqueue(DownloadTask(url, destination), priority);
}

DownloadManager::Outcome DownloadManager::enqueue(DownloadTask task, TransferPriority priority) {
    if (task.url.empty()) {
        throw std::invalid_argument("Download URL must not be empty");
    }
    if (task.destination.empty()) {
        task.destination = m_cacheManager->cachePathFor(task.url).string();
    }

    const std::string url = task.url;
    const std::string destination = task.destination;

    auto outcome = m_gate->request(url, task, priority);

    if (auto cached = std::get_if<Gate::Cached>(&outcome)) {
        if (materializeCached(url, cached->result, destination)) {
            std::error_code ec;
            auto size = std::filesystem::file_size(destination, ec);
            updateProgress(url, TransferProgress::completed(ec ? 0 : static_cast<int64_t>(size)));
            return outcome;
        }

        // The cached file could not be delivered; forget it and download again
        Logger::instance().warn("Cached copy of {} unusable, downloading again", url);
        m_cacheManager->remove(url);
        if (auto finished = m_queue->getTransfer(url); finished && finished->isTerminal()) {
            m_queue->remove(url);
        }
        outcome = m_gate->request(url, std::move(task), priority);
    }

    if (auto created = std::get_if<Gate::Created>(&outcome)) {
        const auto& transfer = created->transfer;
        auto tracked = std::make_shared<std::atomic<bool>>(true);
        {
            std::lock_guard<std::mutex> lock(m_progressMutex);
            m_tracking[url] = tracked;
        }
        transfer->onProgress([this, url, destination, tracked](const TransferProgress& progress) {
            if (!tracked->load()) return;
            if (progress.isCompleted()) {
                deliverExtraDestinations(url, destination);
            } else if (progress.isCancelled()) {
                takeExtraDestinations(url);
            }
            updateProgress(url, progress);
        });
        // Catch up on anything reported before the subscription existed
        refreshProgress(url, *transfer);
        Logger::instance().debug("Added download: {} -> {}", url, destination);
    } else if (auto attached = std::get_if<Gate::Attached>(&outcome)) {
        const auto& transfer = attached->transfer;
        if (transfer->task().destination != destination &&
            addExtraDestination(url, destination)) {
            Logger::instance().debug("{} already in flight to {}, will also copy to {}",
                                     url, transfer->task().destination, destination);
            // Finished before the destination was recorded
            if (transfer->status() == transfer::QueuedTransferStatus::Completed) {
                deliverExtraDestinations(url, transfer->task().destination);
            }
        }
    }

    return outcome;
}

std::string DownloadManager::addUrl(const std::string& url,
                                    const std::string& destination,
                                    TransferPriority priority) {
    enqueue(url, destination, priority);
    return url;
}

std::vector<std::string> DownloadManager::addUrls(const std::vector<std::string>& urls,
                                                  const std::string& destinationDir,
                                                  TransferPriority priority) {
    std::vector<std::string> keys;
    keys.reserve(urls.size());

    for (const auto& url : urls) {
        std::string destination;
        if (!destinationDir.empty()) {
            destination = (std::filesystem::path(destinationDir) / fileNameFor(url)).string();
        }
        keys.push_back(addUrl(url, destination, priority));
    }

    return keys;
}

std::optional<std::string> DownloadManager::waitFor(const std::string& url,
                                                    std::chrono::milliseconds timeout) {
    auto transfer = m_queue->getTransfer(url);
    if (!transfer) {
        return m_cacheManager->lookup(url);
    }

    auto completion = transfer->completion();
    if (completion.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }

    if (!completion.get().isCompleted()) {
        return std::nullopt;
    }
    return transfer->task().destination;
}

bool DownloadManager::waitForAll(std::chrono::milliseconds timeout) {
    return m_queue->waitForIdle(timeout);
}

bool DownloadManager::cancel(const std::string& url) {
    return m_queue->cancel(url);
}

void DownloadManager::cancelAll() {
    m_queue->cancelAll();
}

bool DownloadManager::retry(const std::string& url) {
    return m_queue->retry(url);
}

void DownloadManager::pause() {
    m_queue->pause();
}

void DownloadManager::start() {
    m_queue->start();
}

bool DownloadManager::pauseDownload(const std::string& url) {
    return m_queue->pauseTransfer(url);
}

bool DownloadManager::resumeDownload(const std::string& url) {
    return m_queue->resumeTransfer(url);
}

void DownloadManager::pauseAll() {
    m_queue->pauseAll();
}

void DownloadManager::resumeAll() {
    m_queue->resumeAll();
}

bool DownloadManager::remove(const std::string& url) {
    bool known = m_queue->remove(url);
    takeExtraDestinations(url);

    ProgressMap snapshot;
    {
        std::lock_guard<std::mutex> lock(m_progressMutex);
        if (auto it = m_tracking.find(url); it != m_tracking.end()) {
            it->second->store(false);
            m_tracking.erase(it);
        }
        if (m_progress.erase(url) == 0 && !known) {
            return false;
        }
        snapshot = m_progress;
    }
    Logger::instance().debug("Removed download: {}", url);
    m_progressSignal.emit(snapshot);
    return true;
}

size_t DownloadManager::clearFinished() {
    size_t removed = m_queue->clearFinished();

    ProgressMap snapshot;
    {
        std::lock_guard<std::mutex> lock(m_progressMutex);
        pruneProgressLocked("");
        snapshot = m_progress;
    }
    m_progressSignal.emit(snapshot);
    return removed;
}

bool DownloadManager::changePriority(const std::string& url, TransferPriority priority) {
    return m_queue->changePriority(url, priority);
}

bool DownloadManager::moveToFront(const std::string& url) {
    return m_queue->moveToFront(url);
}

void DownloadManager::setMaxConcurrent(size_t value) {
    m_queue->setMaxConcurrent(value);
}

size_t DownloadManager::maxConcurrent() const {
    return m_queue->maxConcurrent();
}

DownloadManager::TransferPtr DownloadManager::getTransfer(const std::string& url) const {
    return m_queue->getTransfer(url);
}

transfer::TransferQueueState DownloadManager::state() const {
    return m_queue->state();
}

DownloadManager::ProgressMap DownloadManager::progressMap() const {
    std::lock_guard<std::mutex> lock(m_progressMutex);
    return m_progress;
}

std::optional<TransferProgress> DownloadManager::progressFor(const std::string& url) const {
    std::lock_guard<std::mutex> lock(m_progressMutex);
    auto it = m_progress.find(url);
    if (it == m_progress.end()) {
        return std::nullopt;
    }
    return it->second;
}

SubscriptionPtr DownloadManager::subscribeProgress(ProgressMapCallback callback) {
    return m_progressSignal.connect(std::move(callback));
}

void DownloadManager::unsubscribeProgress(const SubscriptionPtr& subscription) {
    m_progressSignal.disconnect(subscription);
}

SubscriptionPtr DownloadManager::subscribeState(Queue::StateCallback callback) {
    return m_queue->subscribeState(std::move(callback));
}

void DownloadManager::unsubscribeState(const SubscriptionPtr& subscription) {
    m_queue->unsubscribeState(subscription);
}

void DownloadManager::updateProgress(const std::string& url, const TransferProgress& progress) {
    ProgressMap snapshot;
    {
        std::lock_guard<std::mutex> lock(m_progressMutex);
        m_progress[url] = progress;
        if (progress.isTerminal()) {
            pruneProgressLocked(url);
        }
        snapshot = m_progress;
    }
    m_progressSignal.emit(snapshot);
}

void DownloadManager::refreshProgress(const std::string& url,
                                      const transfer::QueuedTransfer<DownloadTask>& transfer) {
    ProgressMap snapshot;
    {
        std::lock_guard<std::mutex> lock(m_progressMutex);
        m_progress[url] = transfer.progress();
        snapshot = m_progress;
    }
    m_progressSignal.emit(snapshot);
}

bool DownloadManager::materializeCached(const std::string& url, const std::string& cachedPath,
                                        const std::string& destination) {
    if (cachedPath == destination) {
        return std::filesystem::exists(destination);
    }

    Logger::instance().debug("Using cached file for: {}", url);
    return m_cacheManager->copyTo(url, destination);
}

bool DownloadManager::addExtraDestination(const std::string& url, const std::string& destination) {
    std::lock_guard<std::mutex> lock(m_destinationsMutex);
    auto& targets = m_extraDestinations[url];
    if (std::find(targets.begin(), targets.end(), destination) != targets.end()) {
        return false;
    }
    targets.push_back(destination);
    return true;
}

std::vector<std::string> DownloadManager::takeExtraDestinations(const std::string& url) {
    std::lock_guard<std::mutex> lock(m_destinationsMutex);
    auto it = m_extraDestinations.find(url);
    if (it == m_extraDestinations.end()) {
        return {};
    }
    auto targets = std::move(it->second);
    m_extraDestinations.erase(it);
    return targets;
}

void DownloadManager::deliverExtraDestinations(const std::string& url, const std::string& source) {
    for (const auto& target : takeExtraDestinations(url)) {
        if (m_cacheManager->copyTo(url, target)) {
            continue;
        }

        std::error_code ec;
        auto path = std::filesystem::path(target);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        if (!ec) {
            std::filesystem::copy_file(source, path,
                std::filesystem::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            Logger::instance().warn("Could not copy {} to {}: {}", url, target, ec.message());
        }
    }
}

void DownloadManager::pruneProgressLocked(const std::string& keep) {
    for (auto it = m_progress.begin(); it != m_progress.end();) {
        if (it->first != keep && it->second.isTerminal() && !m_queue->getTransfer(it->first)) {
            m_tracking.erase(it->first);
            it = m_progress.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace courier::core::downloader
