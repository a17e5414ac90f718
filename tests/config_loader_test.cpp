#include <gtest/gtest.h>

#include "snipbox/config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include <unistd.h>

using namespace snipbox;
using json = nlohmann::json;

namespace {

const char* kVariables[] = {
    "SNIPBOX_CONFIG", "SNIPBOX_DB", "ZA_DB", "SNIPBOX_TIMEOUT_MS",
    "SNIPBOX_MAX_MEMORY_MB", "SNIPBOX_PYTHON_HOME"
};

} // anonymous namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kVariables) {
            ::unsetenv(name);
        }
        config_path_ = std::filesystem::temp_directory_path() /
                       ("snipbox-config-" + std::to_string(::getpid()) + ".json");
    }

    void TearDown() override {
        for (const char* name : kVariables) {
            ::unsetenv(name);
        }
        std::error_code ec;
        std::filesystem::remove(config_path_, ec);
    }

    void WriteConfig(const std::string& text) {
        std::ofstream out(config_path_);
        out << text;
    }

    std::filesystem::path config_path_;
};

TEST_F(ConfigLoaderTest, Defaults) {
    const auto config = config::LoadSandboxConfig();

    EXPECT_EQ(std::chrono::milliseconds(8000), config.timeout);
    EXPECT_EQ(std::chrono::milliseconds(1000), config.kill_grace);
    EXPECT_EQ(10000u, config.max_stdout_chars);
    EXPECT_EQ("za.sqlite3", config.default_db_path.string());
    EXPECT_EQ(1024u, config.resource_limits.max_memory_mb);
    EXPECT_EQ(1, config.resource_limits.cpu_slack_seconds);
    EXPECT_TRUE(config.python_home.empty());
    EXPECT_TRUE(static_cast<bool>(config.store_factory));
}

TEST_F(ConfigLoaderTest, JsonKeys) {
    core::SandboxConfig config;
    config::ApplyConfigFromJson(config, json::parse(R"({
        "dbPath": "/data/pokemons.sqlite3",
        "timeoutMs": 2500,
        "killGraceMs": 200,
        "maxStdoutChars": 64,
        "maxMemoryMb": 256,
        "cpuSlackSeconds": 3,
        "pythonHome": "/opt/python",
        "unknownKey": true
    })"));

    EXPECT_EQ("/data/pokemons.sqlite3", config.default_db_path.string());
    EXPECT_EQ(std::chrono::milliseconds(2500), config.timeout);
    EXPECT_EQ(std::chrono::milliseconds(200), config.kill_grace);
    EXPECT_EQ(64u, config.max_stdout_chars);
    EXPECT_EQ(256u, config.resource_limits.max_memory_mb);
    EXPECT_EQ(3, config.resource_limits.cpu_slack_seconds);
    EXPECT_EQ("/opt/python", config.python_home);
}

TEST_F(ConfigLoaderTest, WrongTypesAreIgnored) {
    core::SandboxConfig config;
    config::ApplyConfigFromJson(config, json::parse(R"({
        "dbPath": 7,
        "timeoutMs": 0,
        "killGraceMs": "fast",
        "maxStdoutChars": -1,
        "maxMemoryMb": 1.5
    })"));

    EXPECT_EQ("za.sqlite3", config.default_db_path.string());
    EXPECT_EQ(std::chrono::milliseconds(8000), config.timeout);
    EXPECT_EQ(std::chrono::milliseconds(1000), config.kill_grace);
    EXPECT_EQ(10000u, config.max_stdout_chars);
    EXPECT_EQ(1024u, config.resource_limits.max_memory_mb);
}

TEST_F(ConfigLoaderTest, FileThenEnvironmentThenCommandLine) {
    WriteConfig(R"({"dbPath": "from-file.sqlite3", "timeoutMs": 3000, "maxMemoryMb": 512})");
    ::setenv("SNIPBOX_CONFIG", config_path_.c_str(), 1);
    ::setenv("SNIPBOX_TIMEOUT_MS", "4000", 1);

    auto config = config::LoadSandboxConfig();
    EXPECT_EQ("from-file.sqlite3", config.default_db_path.string());
    EXPECT_EQ(std::chrono::milliseconds(4000), config.timeout);
    EXPECT_EQ(512u, config.resource_limits.max_memory_mb);

    config::CommandLineOverrides overrides;
    overrides.db_path = "from-flag.sqlite3";
    overrides.timeout = std::chrono::milliseconds(500);
    config = config::LoadSandboxConfig(overrides);
    EXPECT_EQ("from-flag.sqlite3", config.default_db_path.string());
    EXPECT_EQ(std::chrono::milliseconds(500), config.timeout);
    EXPECT_EQ(512u, config.resource_limits.max_memory_mb);
}

TEST_F(ConfigLoaderTest, DatabaseVariableFallback) {
    ::setenv("ZA_DB", "legacy.sqlite3", 1);
    EXPECT_EQ("legacy.sqlite3", config::LoadSandboxConfig().default_db_path.string());

    ::setenv("SNIPBOX_DB", "primary.sqlite3", 1);
    EXPECT_EQ("primary.sqlite3", config::LoadSandboxConfig().default_db_path.string());
}

TEST_F(ConfigLoaderTest, MalformedEnvironmentNumbersAreIgnored) {
    ::setenv("SNIPBOX_TIMEOUT_MS", "soon", 1);
    ::setenv("SNIPBOX_MAX_MEMORY_MB", "12abc", 1);

    const auto config = config::LoadSandboxConfig();
    EXPECT_EQ(std::chrono::milliseconds(8000), config.timeout);
    EXPECT_EQ(1024u, config.resource_limits.max_memory_mb);
}

TEST_F(ConfigLoaderTest, TimeoutOutsideBoundsIsIgnored) {
    core::SandboxConfig config;
    config::ApplyConfigFromJson(config, json::parse(R"({"timeoutMs": 86400001})"));
    EXPECT_EQ(std::chrono::milliseconds(8000), config.timeout);

    config::ApplyConfigFromJson(config, json::parse(R"({"timeoutMs": 86400000})"));
    EXPECT_EQ(std::chrono::hours(24), config.timeout);

    config::ApplyConfigFromJson(config, json::parse(R"({"timeoutMs": 1})"));
    EXPECT_EQ(std::chrono::milliseconds(1), config.timeout);

    ::setenv("SNIPBOX_TIMEOUT_MS", "0", 1);
    EXPECT_EQ(std::chrono::milliseconds(8000), config::LoadSandboxConfig().timeout);

    ::setenv("SNIPBOX_TIMEOUT_MS", "9223372036854775807", 1);
    EXPECT_EQ(std::chrono::milliseconds(8000), config::LoadSandboxConfig().timeout);
}

TEST_F(ConfigLoaderTest, UnreadableOrInvalidFileThrows) {
    config::CommandLineOverrides overrides;
    overrides.config_file = config_path_;
    EXPECT_THROW(config::LoadSandboxConfig(overrides), std::runtime_error);

    WriteConfig("{ not json");
    EXPECT_THROW(config::LoadSandboxConfig(overrides), std::runtime_error);

    WriteConfig("[1, 2, 3]");
    EXPECT_THROW(config::LoadSandboxConfig(overrides), std::runtime_error);
}

TEST(ConfigGetEnv, EmptyCountsAsUnset) {
    ::setenv("SNIPBOX_TEST_EMPTY", "", 1);
    EXPECT_FALSE(config::GetEnv("SNIPBOX_TEST_EMPTY").has_value());
    ::setenv("SNIPBOX_TEST_EMPTY", "x", 1);
    EXPECT_EQ("x", config::GetEnv("SNIPBOX_TEST_EMPTY").value());
    ::unsetenv("SNIPBOX_TEST_EMPTY");
}
