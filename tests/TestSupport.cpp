#include "TestSupport.hpp"

#include "utils/StringUtils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace courier::test {

using core::transfer::CancellationToken;
using core::transfer::PauseLatch;
using core::transfer::TransferProgress;

ScriptedExecutor::ScriptedExecutor()
    : m_state(std::make_shared<State>()) {}

ScriptedExecutor::Manager::Executor ScriptedExecutor::executor() {
    auto state = m_state;

    return [state](const Job& job, const CancellationToken& token, const PauseLatch& pause,
                   const Manager::ProgressEmitter& emit) {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            ++state->invocations[job.name];
            state->order.push_back(job.name);
            state->emitters[job.name] = emit;
            ++state->active;
            state->maxActive = std::max(state->maxActive, state->active);
        }
        state->changed.notify_all();

        emit(TransferProgress::running(0, job.size));

        bool cancelled = false;
        Step step{Action::Complete, {}};
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            auto& steps = state->script[job.name];
            // The token and latch are polled; neither notifies this condition
            while ((steps.empty() || pause.isPaused()) && !token.isCancelled()) {
                state->changed.wait_for(lock, std::chrono::milliseconds(2));
            }
            if (!steps.empty()) {
                step = steps.front();
                steps.pop_front();
            } else {
                cancelled = true;
            }
            --state->active;
        }
        state->changed.notify_all();

        if (cancelled) {
            emit(TransferProgress::cancelled(0, job.size));
            return;
        }

        switch (step.action) {
            case Action::Complete:
                emit(TransferProgress::completed(job.size));
                break;
            case Action::Fail:
                emit(TransferProgress::failed(step.message, 0, job.size));
                break;
            case Action::EndWithoutTerminal:
                break;
            case Action::Throw:
                throw std::runtime_error(step.message);
        }
    };
}

void ScriptedExecutor::push(const std::string& name, Step step) {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->script[name].push_back(std::move(step));
    }
    m_state->changed.notify_all();
}

void ScriptedExecutor::complete(const std::string& name) {
    push(name, {Action::Complete, {}});
}

void ScriptedExecutor::fail(const std::string& name, const std::string& message) {
    push(name, {Action::Fail, message});
}

void ScriptedExecutor::endWithoutTerminal(const std::string& name) {
    push(name, {Action::EndWithoutTerminal, {}});
}

void ScriptedExecutor::throwError(const std::string& name, const std::string& message) {
    push(name, {Action::Throw, message});
}

void ScriptedExecutor::emit(const std::string& name, const TransferProgress& progress) {
    Manager::ProgressEmitter emitter;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        auto it = m_state->emitters.find(name);
        if (it == m_state->emitters.end()) {
            throw std::logic_error("No invocation of " + name + " has started");
        }
        emitter = it->second;
    }
    emitter(progress);
}

int ScriptedExecutor::invocations(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    auto it = m_state->invocations.find(name);
    return it != m_state->invocations.end() ? it->second : 0;
}

size_t ScriptedExecutor::totalInvocations() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->order.size();
}

std::vector<std::string> ScriptedExecutor::startOrder() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->order;
}

size_t ScriptedExecutor::maxActive() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->maxActive;
}

bool ScriptedExecutor::waitForInvocations(size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    return m_state->changed.wait_for(lock, timeout, [&] {
        return m_state->order.size() >= count;
    });
}

bool ScriptedExecutor::waitForStart(const std::string& name, int count,
                                    std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    return m_state->changed.wait_for(lock, timeout, [&] {
        auto it = m_state->invocations.find(name);
        return it != m_state->invocations.end() && it->second >= count;
    });
}

// -- TempDir --

TempDir::TempDir()
    : m_path(std::filesystem::temp_directory_path() /
             ("courier-test-" + utils::StringUtils::generateUUID())) {
    std::filesystem::create_directories(m_path);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
}

std::filesystem::path TempDir::write(const std::string& name, const std::string& content) const {
    auto file = m_path / name;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path());
    }
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << content;
    return file;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

} // namespace courier::test
