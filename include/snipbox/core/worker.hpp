/**
 * @file worker.hpp
 * @brief Worker-side body and the worker → supervisor message format
 *
 * One JSON message per invocation:
 *
 * ```
 * {"ok": true,  "data": {"result": <any>, "stdout": "..."}}
 * {"ok": false, "error": "...", "status": "snippet_error" | "store_unavailable" | "worker_crash"}
 * ```
 *
 * @date 2025
 */

#pragma once

#include "snipbox/core/execution_types.hpp"
#include "snipbox/core/sandbox_engine.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace snipbox {
namespace core {

/// Worker exit statuses (informational; the message is authoritative)
constexpr int kWorkerExitOk = 0;
constexpr int kWorkerExitFailed = 70;
constexpr int kWorkerExitOrphaned = 71;
constexpr int kWorkerExitSendFailed = 72;

/**
 * @brief Default WorkerEntry: run one snippet and report it
 *
 * Starts the interpreter, builds the restricted environment on the
 * requested (or default) store, runs the snippet and sends the encoded
 * outcome. Every failure is turned into a failure message.
 *
 * @return kWorkerExitOk, or kWorkerExitSendFailed if the message could not be written
 */
int RunSnippetWorker(const ExecutionRequest& request,
                     const SandboxConfig& config,
                     ipc::OutcomeChannel& channel);

std::string EncodeSuccess(const nlohmann::ordered_json& result, const std::string& stdout_output);

std::string EncodeFailure(OutcomeStatus status, const std::string& error);

/**
 * @brief Decode a worker message into an outcome
 *
 * @param payload Message bytes
 * @return Outcome (duration not set)
 *
 * @throws nlohmann::json::exception if the payload is not valid JSON
 * @throws std::runtime_error if required fields are missing or unknown
 */
ExecutionOutcome DecodeWorkerMessage(const std::string& payload);

} // namespace core
} // namespace snipbox
