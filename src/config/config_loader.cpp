/**
 * @file config_loader.cpp
 * @brief Defaults → file → environment → command line
 *
 * @date 2025
 */

#include "snipbox/config/config_loader.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace snipbox {
namespace config {

using json = nlohmann::json;

namespace {

std::optional<std::string> GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (value) {
        return value;
    }
    return GetEnv(secondary);
}

// Non-negative integer from JSON, or nullopt (with a warning) when unusable
std::optional<std::int64_t> ReadCount(const json& data, const char* key) {
    if (!data.contains(key)) {
        return std::nullopt;
    }
    const auto& value = data[key];
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0) {
        spdlog::warn("Ignoring config key '{}': expected a non-negative integer", key);
        return std::nullopt;
    }
    return value.get<std::int64_t>();
}

std::optional<std::int64_t> ParseCount(const char* name, const std::string& text) {
    std::size_t consumed = 0;
    long long value = -1;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring {}='{}': {}", name, text, e.what());
        return std::nullopt;
    }
    if (consumed != text.size() || value < 0) {
        spdlog::warn("Ignoring {}='{}': expected a non-negative integer", name, text);
        return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

} // anonymous namespace

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

void ApplyConfigFromJson(core::SandboxConfig& config, const json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("dbPath")) {
        if (data["dbPath"].is_string() && !data["dbPath"].get<std::string>().empty()) {
            config.default_db_path = data["dbPath"].get<std::string>();
        } else {
            spdlog::warn("Ignoring config key 'dbPath': expected a non-empty string");
        }
    }
    if (auto value = ReadCount(data, "timeoutMs")) {
        if (core::IsValidTimeout(std::chrono::milliseconds(*value))) {
            config.timeout = std::chrono::milliseconds(*value);
        } else {
            spdlog::warn("Ignoring config key 'timeoutMs': must be between {} and {}",
                         core::kMinTimeout.count(), core::kMaxTimeout.count());
        }
    }
    if (auto value = ReadCount(data, "killGraceMs")) {
        config.kill_grace = std::chrono::milliseconds(*value);
    }
    if (auto value = ReadCount(data, "maxStdoutChars")) {
        config.max_stdout_chars = static_cast<std::size_t>(*value);
    }
    if (auto value = ReadCount(data, "maxMemoryMb")) {
        config.resource_limits.max_memory_mb = static_cast<std::size_t>(*value);
    }
    if (auto value = ReadCount(data, "cpuSlackSeconds")) {
        config.resource_limits.cpu_slack_seconds = static_cast<int>(*value);
    }
    if (data.contains("pythonHome")) {
        if (data["pythonHome"].is_string()) {
            config.python_home = data["pythonHome"].get<std::string>();
        } else {
            spdlog::warn("Ignoring config key 'pythonHome': expected a string");
        }
    }
}

void ApplyConfigFile(core::SandboxConfig& config, const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open config file: " + path.string());
    }

    json data;
    try {
        data = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("invalid config file " + path.string() + ": " + e.what());
    }
    if (!data.is_object()) {
        throw std::runtime_error("invalid config file " + path.string() + ": expected an object");
    }

    spdlog::debug("Loaded config file: {}", path.string());
    ApplyConfigFromJson(config, data);
}

void ApplyConfigFromEnv(core::SandboxConfig& config) {
    if (auto db = GetEnvFallback("SNIPBOX_DB", "ZA_DB")) {
        config.default_db_path = *db;
    }
    if (auto text = GetEnv("SNIPBOX_TIMEOUT_MS")) {
        auto value = ParseCount("SNIPBOX_TIMEOUT_MS", *text);
        if (value && core::IsValidTimeout(std::chrono::milliseconds(*value))) {
            config.timeout = std::chrono::milliseconds(*value);
        } else if (value) {
            spdlog::warn("Ignoring SNIPBOX_TIMEOUT_MS='{}': out of range", *text);
        }
    }
    if (auto text = GetEnv("SNIPBOX_MAX_MEMORY_MB")) {
        if (auto value = ParseCount("SNIPBOX_MAX_MEMORY_MB", *text)) {
            config.resource_limits.max_memory_mb = static_cast<std::size_t>(*value);
        }
    }
    if (auto home = GetEnv("SNIPBOX_PYTHON_HOME")) {
        config.python_home = *home;
    }
}

core::SandboxConfig LoadSandboxConfig(const CommandLineOverrides& overrides) {
    core::SandboxConfig config;

    std::optional<std::filesystem::path> config_file = overrides.config_file;
    if (!config_file) {
        if (auto from_env = GetEnv("SNIPBOX_CONFIG")) {
            config_file = *from_env;
        }
    }
    if (config_file) {
        ApplyConfigFile(config, *config_file);
    }

    ApplyConfigFromEnv(config);

    if (overrides.db_path) {
        config.default_db_path = *overrides.db_path;
    }
    if (overrides.timeout) {
        config.timeout = *overrides.timeout;
    }
    if (overrides.max_memory_mb) {
        config.resource_limits.max_memory_mb = *overrides.max_memory_mb;
    }

    return config;
}

} // namespace config
} // namespace snipbox
