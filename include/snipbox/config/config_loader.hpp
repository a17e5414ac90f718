/**
 * @file config_loader.hpp
 * @brief Layered sandbox configuration
 *
 * Later layers override earlier ones:
 *
 * 1. built-in SandboxConfig defaults
 * 2. JSON file (`--config FILE`, else `$SNIPBOX_CONFIG`)
 * 3. environment (`SNIPBOX_DB` or `ZA_DB`, `SNIPBOX_TIMEOUT_MS`,
 *    `SNIPBOX_MAX_MEMORY_MB`, `SNIPBOX_PYTHON_HOME`)
 * 4. command-line flags
 *
 * JSON file keys:
 * ```
 * {
 *   "dbPath": "za.sqlite3",
 *   "timeoutMs": 8000,
 *   "killGraceMs": 1000,
 *   "maxStdoutChars": 10000,
 *   "maxMemoryMb": 1024,
 *   "cpuSlackSeconds": 1,
 *   "pythonHome": "/usr"
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "snipbox/core/sandbox_engine.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace snipbox {
namespace config {

/**
 * @struct CommandLineOverrides
 * @brief Values given on the command line (highest precedence)
 */
struct CommandLineOverrides {
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> db_path;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::size_t> max_memory_mb;
};

/**
 * @brief Read an environment variable
 * @return Value, or std::nullopt when unset or empty
 */
std::optional<std::string> GetEnv(const char* name);

/**
 * @brief Apply recognised keys of a parsed configuration object
 *
 * Unknown keys are ignored; keys with the wrong type or an out-of-range
 * value are ignored with a warning.
 */
void ApplyConfigFromJson(core::SandboxConfig& config, const nlohmann::json& data);

/**
 * @brief Read and apply a JSON configuration file
 * @throws std::runtime_error if the file cannot be read or is not a JSON object
 */
void ApplyConfigFile(core::SandboxConfig& config, const std::filesystem::path& path);

/**
 * @brief Apply SNIPBOX_* environment variables
 *
 * Malformed numbers are ignored with a warning.
 */
void ApplyConfigFromEnv(core::SandboxConfig& config);

/**
 * @brief Build the effective configuration from all layers
 * @throws std::runtime_error if a configuration file is unusable
 */
core::SandboxConfig LoadSandboxConfig(const CommandLineOverrides& overrides = {});

} // namespace config
} // namespace snipbox
