#include "core/transfer/TransferGate.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

using namespace courier::core::transfer;
using courier::test::Job;
using courier::test::ScriptedExecutor;
using courier::test::ready;

namespace {

using Manager = TransferQueueManager<Job>;
using Gate = TransferGate<Job, std::string>;

class TransferGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        TransferQueueOptions options;
        options.maxConcurrent = 2;
        m_manager = std::make_unique<Manager>(m_executor.executor(), options);
        m_gate = std::make_unique<Gate>(*m_manager, m_cache,
            [](const Job& job, const TransferProgress&) -> std::optional<std::string> {
                return "result:" + job.name;
            });
    }

    void TearDown() override {
        m_manager->dispose();
    }

    ScriptedExecutor m_executor;
    MemoryResultCache<std::string> m_cache;
    std::unique_ptr<Manager> m_manager;
    std::unique_ptr<Gate> m_gate;
};

} // namespace

TEST_F(TransferGateTest, CacheHitSkipsScheduler) {
    m_cache.store("k", "stored");

    auto outcome = m_gate->request("k", Job{"k"});

    ASSERT_TRUE(std::holds_alternative<Gate::Cached>(outcome));
    EXPECT_EQ(std::get<Gate::Cached>(outcome).result, "stored");
    EXPECT_EQ(Gate::transferOf(outcome), nullptr);
    EXPECT_EQ(m_manager->totalCount(), 0u);
}

TEST_F(TransferGateTest, MissCreatesTransferAndStoresResult) {
    auto outcome = m_gate->request("k", Job{"k"});
    ASSERT_TRUE(std::holds_alternative<Gate::Created>(outcome));
    EXPECT_TRUE(m_gate->isInFlight("k"));

    auto transfer = Gate::transferOf(outcome);
    ASSERT_NE(transfer, nullptr);
    EXPECT_EQ(transfer->id(), "k");

    m_executor.complete("k");
    ASSERT_TRUE(ready(transfer->completion()));
    EXPECT_FALSE(m_gate->isInFlight("k"));
    EXPECT_EQ(m_cache.lookup("k").value_or(""), "result:k");

    auto again = m_gate->request("k", Job{"k"});
    ASSERT_TRUE(std::holds_alternative<Gate::Cached>(again));
    EXPECT_EQ(m_executor.invocations("k"), 1);
}

TEST_F(TransferGateTest, ConcurrentRequestsShareOneTransfer) {
    constexpr int kCallers = 8;

    std::mutex mutex;
    std::condition_variable go;
    bool released = false;
    std::vector<Gate::Outcome> outcomes(kCallers, Gate::Cached{""});

    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&, i] {
            {
                std::unique_lock<std::mutex> lock(mutex);
                go.wait(lock, [&] { return released; });
            }
            outcomes[i] = m_gate->request("shared", Job{"shared"});
        });
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
    }
    go.notify_all();
    for (auto& caller : callers) {
        caller.join();
    }

    int created = 0;
    Manager::TransferPtr transfer;
    for (const auto& outcome : outcomes) {
        if (std::holds_alternative<Gate::Created>(outcome)) ++created;
        ASSERT_FALSE(std::holds_alternative<Gate::Cached>(outcome));
        auto current = Gate::transferOf(outcome);
        if (!transfer) transfer = current;
        EXPECT_EQ(current, transfer);
    }
    EXPECT_EQ(created, 1);

    m_executor.complete("shared");
    ASSERT_TRUE(ready(transfer->completion()));
    EXPECT_EQ(m_executor.invocations("shared"), 1);
    EXPECT_EQ(m_gate->keyLocks().size(), 0u);
}

TEST_F(TransferGateTest, FailedTransferIsRetriedOnRequest) {
    auto outcome = m_gate->request("k", Job{"k"});
    auto transfer = Gate::transferOf(outcome);

    m_executor.fail("k", "unreachable");
    ASSERT_TRUE(ready(transfer->completion()));
    EXPECT_EQ(transfer->status(), QueuedTransferStatus::Failed);

    auto second = m_gate->request("k", Job{"k"});
    ASSERT_TRUE(std::holds_alternative<Gate::Attached>(second));
    EXPECT_EQ(Gate::transferOf(second), transfer);
    EXPECT_EQ(transfer->retryCount(), 1);

    m_executor.complete("k");
    ASSERT_TRUE(ready(transfer->completion()));
    EXPECT_TRUE(transfer->completion().get().isCompleted());
    EXPECT_EQ(m_executor.invocations("k"), 2);
}

TEST_F(TransferGateTest, CompletedTransferRefillsCache) {
    auto outcome = m_gate->request("k", Job{"k"});
    auto transfer = Gate::transferOf(outcome);
    m_executor.complete("k");
    ASSERT_TRUE(ready(transfer->completion()));

    m_cache.erase("k");
    auto again = m_gate->request("k", Job{"k"});

    ASSERT_TRUE(std::holds_alternative<Gate::Cached>(again));
    EXPECT_EQ(std::get<Gate::Cached>(again).result, "result:k");
    EXPECT_EQ(m_cache.size(), 1u);
    EXPECT_EQ(m_executor.invocations("k"), 1);
}

TEST_F(TransferGateTest, CancelledTransferIsReplaced) {
    auto outcome = m_gate->request("k", Job{"k"});
    auto transfer = Gate::transferOf(outcome);
    ASSERT_TRUE(m_executor.waitForStart("k"));

    m_manager->cancel("k");
    ASSERT_TRUE(ready(transfer->completion()));

    auto again = m_gate->request("k", Job{"k"});
    ASSERT_TRUE(std::holds_alternative<Gate::Created>(again));
    EXPECT_NE(Gate::transferOf(again), transfer);
}
