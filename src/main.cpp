/**
 * @file main.cpp
 * @brief snipbox - Command-line interface
 *
 * Runs snippets against a read-only SQLite store through the sandbox engine
 * and prints each outcome as JSON on stdout. Logs go to stderr.
 *
 * **Modes**:
 * - single run: `snipbox -c "result = 1 + 1"` or `snipbox -f snippet.py`
 * - line protocol: `snipbox --stdio`, one JSON request per input line, one
 *   JSON outcome per output line
 *
 * **Exit codes**: 0 success, 2 the outcome carries an error, 1 usage or
 * configuration error.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "snipbox/config/config_loader.hpp"
#include "snipbox/core/execution_types.hpp"
#include "snipbox/core/sandbox_engine.hpp"
#include "snipbox/utils/string_utils.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

using json = nlohmann::ordered_json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitOutcomeError = 2;

/*******************************************************************************
 * Helpers
 ******************************************************************************/

std::string ReadSource(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot read snippet file: " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

std::string Serialize(const snipbox::core::ExecutionOutcome& outcome, bool pretty) {
    const json j = outcome;
    return j.dump(pretty ? 2 : -1, ' ', false, json::error_handler_t::replace);
}

/*******************************************************************************
 * Line protocol
 ******************************************************************************/

snipbox::core::ExecutionOutcome HandleRequestLine(const snipbox::core::SandboxEngine& engine,
                                                  const std::string& line) {
    using snipbox::core::ExecutionOutcome;
    using snipbox::core::OutcomeStatus;

    snipbox::core::ExecutionRequest request;
    auto timeout = engine.GetConfig().timeout;

    try {
        const auto message = json::parse(line);
        request = message.get<snipbox::core::ExecutionRequest>();

        if (message.contains("timeout") && !message["timeout"].is_null()) {
            if (!message["timeout"].is_number()) {
                throw std::invalid_argument("timeout must be a number of seconds");
            }
            timeout = snipbox::core::TimeoutFromSeconds(message["timeout"].get<double>());
        }
    } catch (const std::exception& e) {
        spdlog::warn("Rejected request: {}", e.what());
        return ExecutionOutcome::Failure(OutcomeStatus::SNIPPET_ERROR,
                                         std::string("invalid request: ") + e.what());
    }

    return engine.Execute(request, timeout);
}

int RunLineProtocol(const snipbox::core::SandboxEngine& engine, bool pretty) {
    spdlog::info("Reading requests from stdin");

    std::size_t handled = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (snipbox::utils::StringUtils::Trim(line).empty()) {
            continue;
        }
        const auto outcome = HandleRequestLine(engine, line);
        std::cout << Serialize(outcome, pretty) << std::endl;
        ++handled;
    }

    spdlog::info("Handled {} request(s)", handled);
    return kExitOk;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    // Configure CLI parser
    CLI::App app{"snipbox - sandboxed snippets over a read-only SQLite store"};

    std::string code;
    std::string file;
    std::string db_path;
    std::string args_text;
    std::string config_file;
    double timeout_seconds = 0.0;
    bool verbose = false;
    bool pretty = false;
    bool stdio = false;

    auto* code_option = app.add_option("-c,--code", code, "Snippet source");
    auto* file_option = app.add_option("-f,--file", file, "Snippet file ('-' reads stdin)");
    auto* stdio_option = app.add_flag("--stdio", stdio,
                                      "Read JSON requests from stdin, one per line");
    code_option->excludes(file_option)->excludes(stdio_option);
    file_option->excludes(stdio_option);

    app.add_option("--db", db_path, "Read-only SQLite database");
    app.add_option("--args", args_text, "JSON object visible to the snippet as 'args'");
    auto* timeout_option = app.add_option("--timeout", timeout_seconds, "Execution timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--config", config_file, "JSON configuration file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--pretty", pretty, "Indent JSON output");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format; stdout carries the outcomes
    spdlog::set_default_logger(spdlog::stderr_color_mt("snipbox"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (code_option->count() == 0 && file_option->count() == 0 && !stdio) {
        std::cerr << "One of --code, --file or --stdio is required\n" << app.help();
        return kExitUsage;
    }

    try {
        snipbox::config::CommandLineOverrides overrides;
        if (!config_file.empty()) {
            overrides.config_file = config_file;
        }
        if (!db_path.empty()) {
            overrides.db_path = db_path;
        }
        if (timeout_option->count() > 0) {
            overrides.timeout = snipbox::core::TimeoutFromSeconds(timeout_seconds);
        }

        const auto config = snipbox::config::LoadSandboxConfig(overrides);
        snipbox::core::SandboxEngine engine(config);

        if (stdio) {
            return RunLineProtocol(engine, pretty);
        }

        snipbox::core::ExecutionRequest request;
        request.code = file_option->count() > 0 ? ReadSource(file) : code;
        if (!args_text.empty()) {
            const auto args = json::parse(args_text);
            if (!args.is_object()) {
                spdlog::error("--args must be a JSON object");
                return kExitUsage;
            }
            request.args = args;
        }

        const auto outcome = engine.Execute(request);
        std::cout << Serialize(outcome, pretty) << std::endl;

        return outcome.Succeeded() ? kExitOk : kExitOutcomeError;

    } catch (const json::parse_error& e) {
        spdlog::error("Invalid JSON: {}", e.what());
        return kExitUsage;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitUsage;
    }
}
