/**
 * @file worker.cpp
 * @brief Worker body and message codec
 *
 * @date 2025
 */

#include "snipbox/core/worker.hpp"
#include "snipbox/env/errors.hpp"
#include "snipbox/env/interpreter.hpp"
#include "snipbox/env/restricted_environment.hpp"
#include "snipbox/ipc/outcome_channel.hpp"

#include <new>
#include <stdexcept>

namespace snipbox {
namespace core {

using json = nlohmann::ordered_json;

namespace {

std::string Dump(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // anonymous namespace

std::string EncodeSuccess(const json& result, const std::string& stdout_output) {
    return Dump(json{
        {"ok", true},
        {"data", {
            {"result", result},
            {"stdout", stdout_output}
        }}
    });
}

std::string EncodeFailure(OutcomeStatus status, const std::string& error) {
    return Dump(json{
        {"ok", false},
        {"error", error},
        {"status", OutcomeStatusToString(status)}
    });
}

ExecutionOutcome DecodeWorkerMessage(const std::string& payload) {
    const auto message = json::parse(payload);

    if (!message.is_object() || !message.contains("ok") || !message["ok"].is_boolean()) {
        throw std::runtime_error("missing 'ok' flag");
    }

    if (message["ok"].get<bool>()) {
        const auto& data = message.at("data");
        ExecutionOutcome outcome;
        outcome.status = OutcomeStatus::COMPLETED;
        outcome.result = data.contains("result") ? data["result"] : json(nullptr);
        outcome.stdout_output = data.at("stdout").get<std::string>();
        return outcome;
    }

    const auto error = message.at("error").get<std::string>();
    const auto status_name = message.contains("status")
        ? message["status"].get<std::string>()
        : std::string("snippet_error");
    const auto status = OutcomeStatusFromString(status_name);
    if (!status || *status == OutcomeStatus::COMPLETED) {
        throw std::runtime_error("unknown status '" + status_name + "'");
    }
    return ExecutionOutcome::Failure(*status, error);
}

int RunSnippetWorker(const ExecutionRequest& request,
                     const SandboxConfig& config,
                     ipc::OutcomeChannel& channel) {
    std::string message;

    try {
        // The process exits right after sending; finalization would only cost time
        env::ScopedInterpreter interpreter(config.python_home, false);

        env::EnvironmentBuilder builder(config.store_factory, config.max_stdout_chars);
        auto environment = builder.Build(request.db_path.value_or(config.default_db_path),
                                         request.args);

        environment->Run(request.code);
        message = EncodeSuccess(environment->GetResult(), environment->GetStdout());

    } catch (const store::StoreUnavailable& e) {
        message = EncodeFailure(OutcomeStatus::STORE_UNAVAILABLE,
                                std::string("store unavailable: ") + e.what());
    } catch (const env::SnippetError& e) {
        message = EncodeFailure(OutcomeStatus::SNIPPET_ERROR, e.what());
    } catch (const std::bad_alloc&) {
        message = EncodeFailure(OutcomeStatus::WORKER_CRASH, "worker ran out of memory");
    } catch (const std::exception& e) {
        message = EncodeFailure(OutcomeStatus::WORKER_CRASH, e.what());
    }

    return channel.Send(message) ? kWorkerExitOk : kWorkerExitSendFailed;
}

} // namespace core
} // namespace snipbox
