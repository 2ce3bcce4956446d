#include "core/downloader/FileCopyExecutor.hpp"
#include "utils/HashUtils.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace courier::core::downloader;
using courier::core::transfer::CancellationToken;
using courier::core::transfer::PauseLatch;
using courier::core::transfer::TransferProgress;
using courier::core::transfer::TransferStatus;
using courier::test::TempDir;
using courier::test::readFile;

namespace fs = std::filesystem;

namespace {

class FileCopyExecutorTest : public ::testing::Test {
protected:
    std::vector<TransferProgress> run(const FileCopyExecutor& executor, const DownloadTask& task,
                                      const std::function<void(const TransferProgress&)>& onReport = {}) {
        std::vector<TransferProgress> reports;
        executor(task, m_token, m_latch, [&](const TransferProgress& progress) {
            reports.push_back(progress);
            if (onReport) onReport(progress);
        });
        return reports;
    }

    TempDir m_dir;
    CancellationToken m_token;
    PauseLatch m_latch;
};

} // namespace

TEST_F(FileCopyExecutorTest, ResolvesSources) {
    EXPECT_EQ(FileCopyExecutor::resolveSource("file:///tmp/a.txt"), fs::path("/tmp/a.txt"));
    EXPECT_EQ(FileCopyExecutor::resolveSource("FILE:///tmp/b.txt"), fs::path("/tmp/b.txt"));
    EXPECT_EQ(FileCopyExecutor::resolveSource("relative/c.txt"), fs::path("relative/c.txt"));
    EXPECT_TRUE(FileCopyExecutor::resolveSource("https://example.com/d").empty());
}

TEST_F(FileCopyExecutorTest, CopiesInChunksWithMonotonicProgress) {
    std::string content(10 * 1024 + 17, 'x');
    auto source = m_dir.write("source.bin", content);
    auto destination = m_dir.path() / "out" / "copy.bin";

    FileCopyExecutor::Options options;
    options.chunkSize = 1024;
    FileCopyExecutor executor(options);

    auto reports = run(executor, DownloadTask("file://" + source.string(), destination.string()));

    ASSERT_GE(reports.size(), 3u);
    EXPECT_TRUE(reports.back().isCompleted());
    EXPECT_EQ(reports.back().bytesTransferred, static_cast<int64_t>(content.size()));

    int64_t last = 0;
    for (size_t i = 0; i + 1 < reports.size(); ++i) {
        EXPECT_EQ(reports[i].status, courier::core::transfer::TransferStatus::Running);
        EXPECT_GE(reports[i].bytesTransferred, last);
        last = reports[i].bytesTransferred;
    }

    EXPECT_EQ(readFile(destination), content);
    EXPECT_FALSE(fs::exists(destination.string() + ".part"));
}

TEST_F(FileCopyExecutorTest, VerifiesChecksumAndSize) {
    auto source = m_dir.write("source.txt", "checked content");
    auto destination = m_dir.path() / "ok.txt";

    DownloadTask task(source.string(), destination.string(),
                      courier::utils::HashUtils::sha1String("checked content"));
    task.expectedSize = 15;

    auto reports = run(FileCopyExecutor(), task);
    ASSERT_FALSE(reports.empty());
    EXPECT_TRUE(reports.back().isCompleted());
    EXPECT_TRUE(fs::exists(destination));
}

TEST_F(FileCopyExecutorTest, ChecksumMismatchFails) {
    auto source = m_dir.write("source.txt", "tampered");
    auto destination = m_dir.path() / "bad.txt";

    DownloadTask task(source.string(), destination.string(), std::string(40, '0'));
    auto reports = run(FileCopyExecutor(), task);

    ASSERT_FALSE(reports.empty());
    EXPECT_TRUE(reports.back().isFailed());
    EXPECT_EQ(reports.back().errorMessage.value_or(""), "Checksum mismatch");
    EXPECT_FALSE(fs::exists(destination));
    EXPECT_FALSE(fs::exists(destination.string() + ".part"));
}

TEST_F(FileCopyExecutorTest, SizeMismatchFails) {
    auto source = m_dir.write("source.txt", "1234");
    DownloadTask task(source.string(), (m_dir.path() / "sized.txt").string());
    task.expectedSize = 10;

    auto reports = run(FileCopyExecutor(), task);
    ASSERT_FALSE(reports.empty());
    EXPECT_EQ(reports.back().errorMessage.value_or(""),
              "Size mismatch: expected 10 bytes, got 4");
}

TEST_F(FileCopyExecutorTest, MissingSourceFails) {
    DownloadTask task((m_dir.path() / "absent").string(), (m_dir.path() / "dest").string());
    auto reports = run(FileCopyExecutor(), task);

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_TRUE(reports[0].isFailed());
    EXPECT_NE(reports[0].errorMessage->find("Source not found"), std::string::npos);
}

TEST_F(FileCopyExecutorTest, UnsupportedSchemeFails) {
    auto reports = run(FileCopyExecutor(),
                       DownloadTask("ftp://example.com/file", (m_dir.path() / "dest").string()));

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_TRUE(reports[0].isFailed());
}

TEST_F(FileCopyExecutorTest, CancelledTokenStopsCopy) {
    auto source = m_dir.write("source.bin", std::string(4096, 'y'));
    auto destination = m_dir.path() / "never.bin";

    m_token.cancel();
    auto reports = run(FileCopyExecutor(), DownloadTask(source.string(), destination.string()));

    ASSERT_FALSE(reports.empty());
    EXPECT_TRUE(reports.back().isCancelled());
    EXPECT_FALSE(fs::exists(destination));
    EXPECT_FALSE(fs::exists(destination.string() + ".part"));
}

TEST_F(FileCopyExecutorTest, WaitsWhilePausedThenFinishes) {
    std::string content(8 * 1024, 'p');
    auto source = m_dir.write("source.bin", content);
    auto destination = m_dir.path() / "paused.bin";

    FileCopyExecutor::Options options;
    options.chunkSize = 1024;
    FileCopyExecutor executor(options);

    std::thread resumer;
    std::atomic<bool> resumed{false};
    auto reports = run(executor, DownloadTask(source.string(), destination.string()),
        [&](const TransferProgress& progress) {
            if (progress.status == TransferStatus::Running && progress.bytesTransferred > 0 && !resumer.joinable()) {
                m_latch.pause();
                resumer = std::thread([&] {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    resumed = true;
                    m_latch.resume();
                });
            }
            if (progress.status == TransferStatus::Running && progress.bytesTransferred > 1024) {
                EXPECT_TRUE(resumed.load());
            }
        });
    resumer.join();

    auto paused = std::find_if(reports.begin(), reports.end(),
                               [](const TransferProgress& p) { return p.isPaused(); });
    ASSERT_NE(paused, reports.end());
    EXPECT_EQ(paused->bytesTransferred, 1024);
    ASSERT_NE(paused + 1, reports.end());
    EXPECT_EQ((paused + 1)->status, TransferStatus::Running);

    EXPECT_TRUE(reports.back().isCompleted());
    EXPECT_EQ(readFile(destination), content);
}

TEST_F(FileCopyExecutorTest, CancelWhilePausedDiscardsPartialFile) {
    auto source = m_dir.write("source.bin", std::string(4096, 'c'));
    auto destination = m_dir.path() / "dropped.bin";

    FileCopyExecutor::Options options;
    options.chunkSize = 1024;
    FileCopyExecutor executor(options);

    std::thread canceller;
    auto reports = run(executor, DownloadTask(source.string(), destination.string()),
        [&](const TransferProgress& progress) {
            if (progress.status == TransferStatus::Running && progress.bytesTransferred > 0 && !canceller.joinable()) {
                m_latch.pause();
                canceller = std::thread([&] {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    m_token.cancel();
                });
            }
        });
    canceller.join();

    ASSERT_FALSE(reports.empty());
    EXPECT_TRUE(reports.back().isCancelled());
    EXPECT_FALSE(fs::exists(destination));
    EXPECT_FALSE(fs::exists(destination.string() + ".part"));
}
