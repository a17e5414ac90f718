/**
 * @file sandbox_engine.hpp
 * @brief Isolated snippet execution with process-level isolation
 *
 * Runs each snippet in a freshly forked worker process with resource limits,
 * collects exactly one outcome message over a pipe and enforces a wall-clock
 * deadline by terminating the worker's process group.
 *
 * @date 2025
 */

#pragma once

#include "snipbox/core/execution_types.hpp"
#include "snipbox/store/readonly_store.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <future>
#include <optional>
#include <string>

namespace snipbox {

namespace ipc {
class OutcomeChannel;
}

namespace core {

/**
 * @struct ResourceLimits
 * @brief Kernel limits applied to every worker
 */
struct ResourceLimits {
    std::size_t max_memory_mb{1024};     ///< RLIMIT_AS in megabytes (0 = unlimited)
    int cpu_slack_seconds{1};            ///< RLIMIT_CPU = ceil(timeout) + slack
};

/**
 * @struct SandboxConfig
 * @brief Sandbox configuration
 */
struct SandboxConfig {
    // Execution Settings
    std::chrono::milliseconds timeout{8000};      ///< Default wall-clock budget
    std::chrono::milliseconds kill_grace{1000};   ///< SIGTERM → SIGKILL delay
    std::size_t max_stdout_chars{10000};          ///< print() budget in code points
    ResourceLimits resource_limits;               ///< Kernel limits

    // Store
    std::filesystem::path default_db_path{"za.sqlite3"};   ///< Used when a request names none
    store::StoreFactory store_factory{store::OpenReadOnly}; ///< Opens the read-only handle

    // Interpreter
    std::string python_home;                      ///< Standard library prefix (empty = built-in)
};

/**
 * @brief Code run inside the forked worker
 *
 * Receives the request, the engine's configuration and the channel's write
 * end; must call Send() at most once. The return value becomes the worker's
 * exit status.
 */
using WorkerEntry = std::function<int(const ExecutionRequest&,
                                      const SandboxConfig&,
                                      ipc::OutcomeChannel&)>;

/**
 * @class SandboxEngine
 * @brief Isolated execution supervisor
 *
 * One invocation:
 *
 * ```
 * Execute()
 *   ├─ OutcomeChannel (pipe, close-on-exec)
 *   ├─ fork
 *   │    worker: own process group, PDEATHSIG, stdio → /dev/null,
 *   │            inherited fds closed, rlimits, WorkerEntry, _exit
 *   └─ Receive(deadline)
 *        ├─ MESSAGE  → reap worker, decode outcome
 *        ├─ CLOSED   → reap worker, "no result (crash or empty output)"
 *        └─ DEADLINE → SIGTERM group, grace, SIGKILL, reap, "timeout after Ns"
 * ```
 *
 * Nothing is pooled: every call gets a new process, interpreter, environment
 * and store handle.
 *
 * **Thread Safety**: Execute() is const and keeps no per-call state, so
 * concurrent calls from different threads are independent.
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxBuilder()
 *     .WithTimeout(std::chrono::seconds(2))
 *     .WithDefaultDatabase("za.sqlite3")
 *     .Build();
 *
 * SandboxEngine engine(config);
 *
 * ExecutionRequest request;
 * request.code = "print('hi')\nresult = scalarQuery('SELECT 1')";
 *
 * auto outcome = engine.Execute(request);
 * if (outcome.Succeeded()) {
 *     // outcome.result == 1, outcome.stdout_output == "hi\n"
 * }
 * @endcode
 */
class SandboxEngine {
public:
    /**
     * @brief Construct sandbox engine
     * @param config Sandbox configuration
     * @param worker_entry Worker body (default: RunSnippetWorker)
     */
    explicit SandboxEngine(const SandboxConfig& config = SandboxConfig{},
                           WorkerEntry worker_entry = nullptr);

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    /**
     * @brief Execute a snippet with the configured default timeout
     */
    ExecutionOutcome Execute(const ExecutionRequest& request) const;

    /**
     * @brief Execute a snippet in a fresh worker process
     *
     * Never throws: spawn failures, crashes, malformed messages and
     * timeouts all come back as outcomes with `error` set.
     *
     * @param request Snippet, store override and arguments
     * @param timeout Wall-clock budget, measured from the call
     * @return Outcome of the invocation
     */
    ExecutionOutcome Execute(const ExecutionRequest& request,
                             std::chrono::milliseconds timeout) const;

    /**
     * @brief Execute a snippet on a background thread
     *
     * The engine must outlive the returned future.
     *
     * @param request Snippet to run (copied)
     * @param timeout Wall-clock budget (default: configured timeout)
     * @return Future resolving to the outcome
     */
    std::future<ExecutionOutcome> ExecuteAsync(
        ExecutionRequest request,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    /**
     * @brief Get current configuration
     */
    const SandboxConfig& GetConfig() const { return config_; }

private:
    SandboxConfig config_;          ///< Configuration
    WorkerEntry worker_entry_;      ///< Worker body

    ExecutionOutcome RunInWorker(const ExecutionRequest& request,
                                 std::chrono::milliseconds timeout,
                                 std::chrono::steady_clock::time_point deadline) const;
    [[noreturn]] void RunWorkerProcess(const ExecutionRequest& request,
                                       std::chrono::milliseconds timeout,
                                       ipc::OutcomeChannel& channel,
                                       int parent_pid) const;
    void ReapWorker(int pid) const;
    void TerminateWorker(int pid) const;
};

/**
 * @class SandboxBuilder
 * @brief Fluent API for constructing sandbox configurations
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxBuilder()
 *     .WithTimeout(std::chrono::milliseconds(500))
 *     .WithMemoryLimit(512)
 *     .WithMaxStdoutChars(2000)
 *     .Build();
 * @endcode
 */
class SandboxBuilder {
public:
    SandboxBuilder& WithTimeout(std::chrono::milliseconds timeout) {
        config_.timeout = timeout;
        return *this;
    }

    SandboxBuilder& WithKillGrace(std::chrono::milliseconds grace) {
        config_.kill_grace = grace;
        return *this;
    }

    /**
     * @brief Set memory limit
     * @param mb Address space limit in megabytes (0 = unlimited)
     * @return Reference to builder for chaining
     */
    SandboxBuilder& WithMemoryLimit(std::size_t mb) {
        config_.resource_limits.max_memory_mb = mb;
        return *this;
    }

    SandboxBuilder& WithCpuSlack(int seconds) {
        config_.resource_limits.cpu_slack_seconds = seconds;
        return *this;
    }

    SandboxBuilder& WithMaxStdoutChars(std::size_t chars) {
        config_.max_stdout_chars = chars;
        return *this;
    }

    SandboxBuilder& WithDefaultDatabase(const std::filesystem::path& path) {
        config_.default_db_path = path;
        return *this;
    }

    /**
     * @brief Replace the store factory (tests, alternative stores)
     */
    SandboxBuilder& WithStoreFactory(store::StoreFactory factory) {
        config_.store_factory = std::move(factory);
        return *this;
    }

    SandboxBuilder& WithPythonHome(const std::string& home) {
        config_.python_home = home;
        return *this;
    }

    /**
     * @brief Build final configuration
     * @return Constructed SandboxConfig
     */
    SandboxConfig Build() const {
        return config_;
    }

private:
    SandboxConfig config_;  ///< Configuration being built
};

} // namespace core
} // namespace snipbox
