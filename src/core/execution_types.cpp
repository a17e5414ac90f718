/**
 * @file execution_types.cpp
 * @brief JSON mapping of requests and outcomes
 *
 * @date 2025
 */

#include "snipbox/core/execution_types.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace snipbox {
namespace core {

using json = nlohmann::ordered_json;

const char* OutcomeStatusToString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::COMPLETED: return "completed";
        case OutcomeStatus::SNIPPET_ERROR: return "snippet_error";
        case OutcomeStatus::STORE_UNAVAILABLE: return "store_unavailable";
        case OutcomeStatus::TIMEOUT: return "timeout";
        case OutcomeStatus::WORKER_CRASH: return "worker_crash";
        default: return "worker_crash";
    }
}

std::optional<OutcomeStatus> OutcomeStatusFromString(const std::string& name) {
    static const std::pair<const char*, OutcomeStatus> kStatuses[] = {
        {"completed", OutcomeStatus::COMPLETED},
        {"snippet_error", OutcomeStatus::SNIPPET_ERROR},
        {"store_unavailable", OutcomeStatus::STORE_UNAVAILABLE},
        {"timeout", OutcomeStatus::TIMEOUT},
        {"worker_crash", OutcomeStatus::WORKER_CRASH}
    };
    for (const auto& [text, status] : kStatuses) {
        if (name == text) {
            return status;
        }
    }
    return std::nullopt;
}

std::chrono::milliseconds TimeoutFromSeconds(double seconds) {
    const double millis = std::round(seconds * 1000.0);
    if (!std::isfinite(millis) ||
        millis < static_cast<double>(kMinTimeout.count()) ||
        millis > static_cast<double>(kMaxTimeout.count())) {
        throw std::invalid_argument("timeout must be between 0.001 and " +
                                    std::to_string(kMaxTimeout.count() / 1000) + " seconds");
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(millis));
}

void to_json(json& j, const ExecutionRequest& request) {
    j = json{
        {"code", request.code},
        {"db_path", request.db_path ? json(request.db_path->string()) : json(nullptr)},
        {"args", request.args}
    };
}

void from_json(const json& j, ExecutionRequest& request) {
    j.at("code").get_to(request.code);

    request.db_path.reset();
    if (j.contains("db_path") && !j["db_path"].is_null()) {
        const auto path = j["db_path"].get<std::string>();
        if (!path.empty()) {
            request.db_path = path;
        }
    }

    request.args = json::object();
    if (j.contains("args") && !j["args"].is_null()) {
        if (!j["args"].is_object()) {
            throw std::invalid_argument("args must be an object");
        }
        request.args = j["args"];
    }
}

void to_json(json& j, const ExecutionOutcome& outcome) {
    j = json{
        {"result", outcome.result},
        {"stdout", outcome.stdout_output}
    };
    if (outcome.error) {
        j["error"] = *outcome.error;
    }
}

} // namespace core
} // namespace snipbox
