#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <vector>

using namespace courier::core;
using courier::core::transfer::CancellationToken;
using courier::core::transfer::TransferProgress;
using courier::test::TempDir;
using courier::test::waitUntil;

namespace {

class ApplicationTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_config.set("cache.directory", (m_dir.path() / "cache").string());

        m_bus.subscribe("transfers.completed", [this](const json& payload) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_completed.push_back(payload);
        });
        m_bus.subscribe("transfers.failed", [this](const json& payload) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_failed.push_back(payload);
        });
        m_bus.subscribe("transfers.state", [this](const json&) {
            ++m_stateEvents;
        });
    }

    size_t completedCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_completed.size();
    }

    size_t failedCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_failed.size();
    }

    TempDir m_dir;
    EventBus m_bus;
    Config m_config;

    std::mutex m_mutex;
    std::vector<json> m_completed;
    std::vector<json> m_failed;
    std::atomic<int> m_stateEvents{0};
};

} // namespace

TEST_F(ApplicationTest, StateTransitions) {
    std::vector<AppState> states;
    Application app(m_bus);
    app.onStateChange([&](AppState state) { states.push_back(state); });

    EXPECT_EQ(app.getState(), AppState::Uninitialized);
    EXPECT_EQ(app.getDownloadManager(), nullptr);

    ASSERT_TRUE(app.initialize(m_config));
    EXPECT_TRUE(app.isRunning());
    EXPECT_NE(app.getDownloadManager(), nullptr);
    EXPECT_FALSE(app.initialize(m_config));

    app.shutdown();
    EXPECT_FALSE(app.isRunning());
    EXPECT_EQ(app.getDownloadManager(), nullptr);

    EXPECT_EQ(states, (std::vector<AppState>{AppState::Initializing, AppState::Ready,
                                             AppState::ShuttingDown, AppState::Uninitialized}));
    EXPECT_STREQ(toString(AppState::Ready), "ready");
}

TEST_F(ApplicationTest, InvalidConfigurationFailsInitialization) {
    m_config.set("transfers.maxConcurrent", 0);
    Application app(m_bus);

    EXPECT_FALSE(app.initialize(m_config));
    EXPECT_EQ(app.getState(), AppState::Error);
    EXPECT_EQ(app.getDownloadManager(), nullptr);
}

TEST_F(ApplicationTest, PublishesCompletionOncePerDownload) {
    Application app(m_bus);
    ASSERT_TRUE(app.initialize(m_config));
    auto downloads = app.getDownloadManager();

    auto url = "file://" + m_dir.write("source.txt", "payload").string();
    downloads->enqueue(url, (m_dir.path() / "first.txt").string());
    ASSERT_TRUE(waitUntil([&] { return completedCount() == 1; }));

    // Served from the cache: no second announcement
    downloads->enqueue(url, (m_dir.path() / "second.txt").string());
    EXPECT_EQ(completedCount(), 1u);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        EXPECT_EQ(m_completed[0]["url"], url);
        EXPECT_EQ(m_completed[0]["progress"]["status"], "completed");
    }
    EXPECT_GT(m_stateEvents.load(), 0);
    EXPECT_EQ(failedCount(), 0u);
}

TEST_F(ApplicationTest, PublishesAgainAfterDownloadIsForgotten) {
    Application app(m_bus);
    ASSERT_TRUE(app.initialize(m_config));
    auto downloads = app.getDownloadManager();

    auto url = "file://" + m_dir.write("source.txt", "payload").string();
    downloads->enqueue(url, (m_dir.path() / "first.txt").string());
    ASSERT_TRUE(waitUntil([&] { return completedCount() == 1; }));

    ASSERT_TRUE(downloads->remove(url));
    EXPECT_FALSE(downloads->progressFor(url).has_value());

    downloads->enqueue(url, (m_dir.path() / "again.txt").string());
    ASSERT_TRUE(waitUntil([&] { return completedCount() == 2; }));
}

TEST_F(ApplicationTest, PublishesFailures) {
    Application app(m_bus);
    ASSERT_TRUE(app.initialize(m_config));

    auto url = "file://" + (m_dir.path() / "absent.txt").string();
    app.getDownloadManager()->enqueue(url, (m_dir.path() / "absent-copy.txt").string());

    ASSERT_TRUE(waitUntil([&] { return failedCount() == 1; }));
    std::lock_guard<std::mutex> lock(m_mutex);
    EXPECT_EQ(m_failed[0]["url"], url);
    EXPECT_TRUE(m_failed[0]["progress"].contains("error"));
}

TEST_F(ApplicationTest, UsesInjectedExecutor) {
    std::atomic<int> calls{0};
    Application app(m_bus);
    ASSERT_TRUE(app.initialize(m_config,
        [&](const downloader::DownloadTask&, const CancellationToken&,
            const transfer::PauseLatch&,
            const std::function<void(const TransferProgress&)>& emit) {
            ++calls;
            emit(TransferProgress::completed(0));
        }));

    auto downloads = app.getDownloadManager();
    downloads->enqueue("custom://resource", (m_dir.path() / "resource").string());
    ASSERT_TRUE(waitUntil([&] { return completedCount() == 1; }));
    EXPECT_EQ(calls.load(), 1);
}
