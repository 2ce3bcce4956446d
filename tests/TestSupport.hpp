#pragma once

/**
 * TestSupport.hpp
 *
 * Helpers shared by the unit tests: a controllable executor, a scratch
 * directory and a polling wait.
 */

#include "core/transfer/TransferQueueManager.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace courier::test {

/**
 * Payload used by scheduler tests
 */
struct Job {
    std::string name;
    int64_t size{100};
};

/**
 * Executor whose invocations block until the test decides how they end.
 *
 * Outcomes are queued per job name; an invocation consumes the next one,
 * or blocks until one is queued or its token is cancelled (it then reports
 * cancelled). No outcome is consumed while the pause latch is closed.
 */
class ScriptedExecutor {
public:
    using Manager = core::transfer::TransferQueueManager<Job>;

    enum class Action {
        Complete,
        Fail,
        EndWithoutTerminal,
        Throw
    };

    ScriptedExecutor();

    /**
     * Callable to hand to a TransferQueueManager
     */
    Manager::Executor executor();

    void complete(const std::string& name);
    void fail(const std::string& name, const std::string& message = "boom");
    void endWithoutTerminal(const std::string& name);
    void throwError(const std::string& name, const std::string& message);

    /**
     * Report progress through the emitter of the latest invocation of name
     */
    void emit(const std::string& name, const core::transfer::TransferProgress& progress);

    int invocations(const std::string& name) const;
    size_t totalInvocations() const;
    std::vector<std::string> startOrder() const;

    /**
     * Highest number of invocations blocked at the same time
     */
    size_t maxActive() const;

    bool waitForInvocations(size_t count,
                            std::chrono::milliseconds timeout = std::chrono::seconds(5)) const;
    bool waitForStart(const std::string& name, int count = 1,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) const;

private:
    struct Step {
        Action action;
        std::string message;
    };

    struct State {
        mutable std::mutex mutex;
        mutable std::condition_variable changed;
        std::map<std::string, std::deque<Step>> script;
        std::map<std::string, int> invocations;
        std::map<std::string, Manager::ProgressEmitter> emitters;
        std::vector<std::string> order;
        size_t active{0};
        size_t maxActive{0};
    };

    void push(const std::string& name, Step step);

    std::shared_ptr<State> m_state;
};

/**
 * Scratch directory removed on destruction
 */
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    /**
     * Create a file below the directory
     * @return Its path
     */
    std::filesystem::path write(const std::string& name, const std::string& content) const;

private:
    std::filesystem::path m_path;
};

std::string readFile(const std::filesystem::path& path);

/**
 * Poll until predicate holds
 * @return false on timeout
 */
bool waitUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds timeout = std::chrono::seconds(5));

/**
 * Wait for a transfer's completion handle
 */
template<typename Future>
bool ready(const Future& future, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    return future.wait_for(timeout) == std::future_status::ready;
}

} // namespace courier::test
