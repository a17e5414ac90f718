/**
 * @file sandbox_engine.cpp
 * @brief Implementation of the isolated execution supervisor
 *
 * **Worker Hardening** (applied in the child, before any snippet code):
 * - **Process group**: setpgid(0, 0) so that termination reaches every
 *   descendant with a single kill(-pid)
 * - **Parent death**: PR_SET_PDEATHSIG(SIGKILL); exits at once if the
 *   supervisor is already gone
 * - **Standard streams**: stdin, stdout and stderr point at /dev/null
 * - **Descriptors**: everything except the channel's write end is closed,
 *   including pipes of concurrent invocations inherited through fork
 * - **Resource Limits**: RLIMIT_AS (memory), RLIMIT_CPU (backstop for the
 *   wall-clock deadline), RLIMIT_FSIZE = 0, RLIMIT_CORE = 0
 *
 * **Timeout Management**:
 * - Single wall-clock deadline measured from the Execute() call
 * - Graceful termination (SIGTERM → grace period → SIGKILL)
 * - A message arriving after the deadline is never read
 *
 * @date 2025
 */

#include "snipbox/core/sandbox_engine.hpp"
#include "snipbox/core/worker.hpp"
#include "snipbox/ipc/outcome_channel.hpp"
#include "snipbox/utils/hash_utils.hpp"
#include "snipbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace snipbox {
namespace core {

using utils::HashUtils;
using utils::StringUtils;

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

constexpr const char* kNoResultMessage = "no result (crash or empty output)";

void RedirectStandardStreams() {
    const int null_fd = ::open("/dev/null", O_RDWR);
    if (null_fd < 0) {
        return;
    }
    for (int fd = STDIN_FILENO; fd <= STDERR_FILENO; ++fd) {
        if (null_fd != fd) {
            ::dup2(null_fd, fd);
        }
    }
    if (null_fd > STDERR_FILENO) {
        ::close(null_fd);
    }
}

// Close every descriptor above stderr except keep_fd
void CloseInheritedDescriptors(int keep_fd) {
    const unsigned int first = STDERR_FILENO + 1;
    const auto keep = static_cast<unsigned int>(keep_fd);

    bool closed = true;
    if (keep > first) {
        closed = ::close_range(first, keep - 1, 0) == 0;
    }
    closed = closed && ::close_range(keep + 1, ~0U, 0) == 0;
    if (closed) {
        return;
    }

    const long max_fd = ::sysconf(_SC_OPEN_MAX);
    for (long fd = first; fd < (max_fd > 0 ? max_fd : 1024); ++fd) {
        if (fd != keep_fd) {
            ::close(static_cast<int>(fd));
        }
    }
}

bool SetLimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit limit{};
    limit.rlim_cur = soft;
    limit.rlim_max = hard;
    return ::setrlimit(resource, &limit) == 0;
}

// Empty string on success, otherwise the limit that could not be applied
std::string ApplyResourceLimits(const ResourceLimits& limits, std::chrono::milliseconds timeout) {
    if (limits.max_memory_mb > 0) {
        const auto bytes = static_cast<rlim_t>(limits.max_memory_mb) * 1024 * 1024;
        if (!SetLimit(RLIMIT_AS, bytes, bytes)) {
            return "RLIMIT_AS";
        }
    }

    const auto timeout_ms = std::max<std::int64_t>(timeout.count(), 0);
    const auto cpu_seconds = static_cast<rlim_t>((timeout_ms + 999) / 1000 +
                                                 std::max(limits.cpu_slack_seconds, 0));
    if (!SetLimit(RLIMIT_CPU, std::max<rlim_t>(cpu_seconds, 1), std::max<rlim_t>(cpu_seconds, 1) + 1)) {
        return "RLIMIT_CPU";
    }
    if (!SetLimit(RLIMIT_FSIZE, 0, 0)) {
        return "RLIMIT_FSIZE";
    }
    if (!SetLimit(RLIMIT_CORE, 0, 0)) {
        return "RLIMIT_CORE";
    }
    return {};
}

// Has pid exited? Leaves the zombie in place so its pid cannot be reused yet.
bool HasExited(pid_t pid) {
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno != EINTR) {
            return true;
        }
    }
    return info.si_pid == pid;
}

bool WaitForExit(pid_t pid, std::chrono::milliseconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (!HasExited(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
    return true;
}

int Reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::warn("waitpid({}) failed: {}", pid, std::strerror(errno));
            return -1;
        }
    }
    return status;
}

std::string DescribeExit(int status) {
    if (status < 0) {
        return "unknown";
    }
    if (WIFSIGNALED(status)) {
        return "signal " + std::to_string(WTERMSIG(status));
    }
    if (WIFEXITED(status)) {
        return "exit code " + std::to_string(WEXITSTATUS(status));
    }
    return "status " + std::to_string(status);
}

} // anonymous namespace

// Constructor
SandboxEngine::SandboxEngine(const SandboxConfig& config, WorkerEntry worker_entry)
    : config_(config)
    , worker_entry_(worker_entry ? std::move(worker_entry) : WorkerEntry(RunSnippetWorker)) {

    spdlog::debug("Sandbox Engine initialized");
    spdlog::debug("Default store: {}", config_.default_db_path.string());
    spdlog::debug("Timeout: {}", StringUtils::FormatSeconds(config_.timeout));
    spdlog::debug("Memory limit: {} MB", config_.resource_limits.max_memory_mb);
}

ExecutionOutcome SandboxEngine::Execute(const ExecutionRequest& request) const {
    return Execute(request, config_.timeout);
}

ExecutionOutcome SandboxEngine::Execute(const ExecutionRequest& request,
                                        std::chrono::milliseconds timeout) const {
    if (!IsValidTimeout(timeout)) {
        spdlog::warn("Timeout of {} ms is out of range; clamping", timeout.count());
        timeout = std::clamp(timeout, kMinTimeout, kMaxTimeout);
    }

    const auto start_time = std::chrono::steady_clock::now();
    const auto deadline = start_time + timeout;

    spdlog::info("Executing snippet {} ({} bytes, timeout {})",
                 HashUtils::Fingerprint(request.code), request.code.size(),
                 StringUtils::FormatSeconds(timeout));

    ExecutionOutcome outcome;
    try {
        outcome = RunInWorker(request, timeout, deadline);
    } catch (const std::exception& e) {
        spdlog::error("Failed to spawn worker: {}", e.what());
        outcome = ExecutionOutcome::Failure(OutcomeStatus::WORKER_CRASH,
                                            std::string("failed to spawn worker: ") + e.what());
    }

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (outcome.Succeeded()) {
        spdlog::info("Snippet completed in {} ms ({} stdout bytes)",
                     outcome.duration.count(), outcome.stdout_output.size());
    } else {
        spdlog::info("Snippet finished with status {} in {} ms: {}",
                     OutcomeStatusToString(outcome.status), outcome.duration.count(),
                     StringUtils::Truncate(*outcome.error, 200));
    }

    return outcome;
}

std::future<ExecutionOutcome> SandboxEngine::ExecuteAsync(
    ExecutionRequest request,
    std::optional<std::chrono::milliseconds> timeout) const {

    return std::async(std::launch::async, [this, request = std::move(request), timeout]() {
        return Execute(request, timeout.value_or(config_.timeout));
    });
}

ExecutionOutcome SandboxEngine::RunInWorker(const ExecutionRequest& request,
                                            std::chrono::milliseconds timeout,
                                            std::chrono::steady_clock::time_point deadline) const {
    ipc::OutcomeChannel channel;

    const pid_t parent_pid = ::getpid();
    const pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0) {
        RunWorkerProcess(request, timeout, channel, parent_pid);
    }

    // Mirror the child's setpgid so kill(-pid) works even if it has not run yet
    if (::setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        spdlog::debug("setpgid({}) failed: {}", pid, std::strerror(errno));
    }
    channel.CloseWriteEnd();

    spdlog::debug("Worker {} started", pid);

    const auto received = channel.Receive(deadline);

    switch (received.status) {
        case ipc::ReceiveStatus::MESSAGE: {
            ReapWorker(pid);
            try {
                return DecodeWorkerMessage(received.payload);
            } catch (const std::exception& e) {
                spdlog::warn("Worker {} sent a malformed message: {}", pid, e.what());
                return ExecutionOutcome::Failure(OutcomeStatus::WORKER_CRASH,
                                                 std::string("malformed worker message: ") + e.what());
            }
        }

        case ipc::ReceiveStatus::CLOSED:
            if (!received.error.empty()) {
                spdlog::warn("Worker {} channel error: {}", pid, received.error);
            }
            ReapWorker(pid);
            return ExecutionOutcome::Failure(OutcomeStatus::WORKER_CRASH, kNoResultMessage);

        case ipc::ReceiveStatus::DEADLINE:
        default:
            spdlog::warn("Worker {} exceeded {}; terminating", pid, StringUtils::FormatSeconds(timeout));
            TerminateWorker(pid);
            return ExecutionOutcome::Failure(OutcomeStatus::TIMEOUT,
                                             "timeout after " + StringUtils::FormatSeconds(timeout));
    }
}

void SandboxEngine::RunWorkerProcess(const ExecutionRequest& request,
                                     std::chrono::milliseconds timeout,
                                     ipc::OutcomeChannel& channel,
                                     int parent_pid) const {
    ::setpgid(0, 0);
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);
    if (::getppid() != parent_pid) {
        ::_exit(kWorkerExitOrphaned);
    }

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGXFSZ, SIG_IGN);

    channel.CloseReadEnd();
    RedirectStandardStreams();
    CloseInheritedDescriptors(channel.GetWriteFd());

    int exit_code = kWorkerExitFailed;
    try {
        const std::string failed_limit = ApplyResourceLimits(config_.resource_limits, timeout);
        if (!failed_limit.empty()) {
            const bool sent = channel.Send(EncodeFailure(OutcomeStatus::WORKER_CRASH,
                                                         "failed to apply resource limit " + failed_limit));
            ::_exit(sent ? kWorkerExitFailed : kWorkerExitSendFailed);
        }
        exit_code = worker_entry_(request, config_, channel);
    } catch (const std::exception&) {
        exit_code = kWorkerExitFailed;
    }

    ::_exit(exit_code);
}

void SandboxEngine::ReapWorker(int pid) const {
    if (!WaitForExit(pid, config_.kill_grace)) {
        spdlog::warn("Worker {} still running after its message; killing", pid);
    }
    // Takes down the worker and anything left in its group
    ::kill(-pid, SIGKILL);

    const int status = Reap(pid);
    spdlog::debug("Worker {} reaped ({})", pid, DescribeExit(status));
}

void SandboxEngine::TerminateWorker(int pid) const {
    ::kill(-pid, SIGTERM);

    if (!WaitForExit(pid, config_.kill_grace)) {
        spdlog::warn("Worker {} ignored SIGTERM; sending SIGKILL", pid);
    }
    ::kill(-pid, SIGKILL);

    const int status = Reap(pid);
    spdlog::debug("Worker {} terminated ({})", pid, DescribeExit(status));
}

} // namespace core
} // namespace snipbox
