/**
 * @file execution_types.hpp
 * @brief Request and outcome payloads of the sandbox
 *
 * ExecutionRequest is what the tool layer hands to SandboxEngine::Execute;
 * ExecutionOutcome is what it always gets back, whether the snippet
 * succeeded, raised, ran out of time or took its worker down.
 *
 * JSON mapping (nlohmann::ordered_json ADL hooks, so key order survives):
 * ```
 * request: {"code": "...", "db_path": "..."|null, "args": {...}|null}
 * outcome: {"result": <any>, "stdout": "...", "error": "..."}   // error omitted when absent
 * ```
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace snipbox {
namespace core {

/**
 * @enum OutcomeStatus
 * @brief How an invocation ended
 */
enum class OutcomeStatus {
    COMPLETED,           ///< Snippet ran to the end; result/stdout are valid
    SNIPPET_ERROR,       ///< Snippet raised, failed validation, or produced an unserializable result
    STORE_UNAVAILABLE,   ///< The read-only store could not be opened
    TIMEOUT,             ///< Wall-clock budget exceeded; worker was terminated
    WORKER_CRASH         ///< Worker ended (or never started) without a usable message
};

/**
 * @struct ExecutionRequest
 * @brief One snippet to run
 */
struct ExecutionRequest {
    std::string code;                                    ///< Snippet source (required)
    std::optional<std::filesystem::path> db_path;        ///< Store override (default: configured path)
    nlohmann::ordered_json args = nlohmann::ordered_json::object();  ///< Caller parameters, visible as `args`
};

/**
 * @struct ExecutionOutcome
 * @brief Structured result of one invocation
 *
 * On hard failure `result` is null and `stdout_output` is empty.
 */
struct ExecutionOutcome {
    nlohmann::ordered_json result;               ///< Value assigned to `result`, or null
    std::string stdout_output;                   ///< Captured print output (bounded)
    std::optional<std::string> error;            ///< Failure description
    OutcomeStatus status{OutcomeStatus::COMPLETED};
    std::chrono::milliseconds duration{0};       ///< Wall-clock time spent in Execute

    bool Succeeded() const { return !error.has_value(); }

    /**
     * @brief Build a hard-failure outcome
     */
    static ExecutionOutcome Failure(OutcomeStatus status, std::string message) {
        ExecutionOutcome outcome;
        outcome.status = status;
        outcome.error = std::move(message);
        return outcome;
    }
};

/// Accepted range for a wall-clock budget
constexpr std::chrono::milliseconds kMinTimeout{1};
constexpr std::chrono::milliseconds kMaxTimeout{24 * 60 * 60 * 1000};

inline bool IsValidTimeout(std::chrono::milliseconds timeout) {
    return timeout >= kMinTimeout && timeout <= kMaxTimeout;
}

/**
 * @brief Convert a caller-supplied budget in seconds to milliseconds
 *
 * Rounds to the nearest millisecond.
 *
 * @throws std::invalid_argument if the value is not finite or falls outside
 *         [kMinTimeout, kMaxTimeout] after rounding
 */
std::chrono::milliseconds TimeoutFromSeconds(double seconds);

/**
 * @brief Stable lowercase name of a status ("completed", "timeout", ...)
 */
const char* OutcomeStatusToString(OutcomeStatus status);

/**
 * @brief Parse a status name produced by OutcomeStatusToString
 * @return Parsed status, or std::nullopt for unknown names
 */
std::optional<OutcomeStatus> OutcomeStatusFromString(const std::string& name);

void to_json(nlohmann::ordered_json& j, const ExecutionRequest& request);

/**
 * @throws nlohmann::json::exception if `code` is missing or a field has the wrong type
 * @throws std::invalid_argument if `args` is present but not an object
 */
void from_json(const nlohmann::ordered_json& j, ExecutionRequest& request);

void to_json(nlohmann::ordered_json& j, const ExecutionOutcome& outcome);

} // namespace core
} // namespace snipbox
