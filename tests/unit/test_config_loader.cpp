#include <cstdlib>
#include <map>
#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "config/config_loader.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace {

using rlm::config::BackendKind;
using rlm::config::Config;
using rlm::config::LoadConfig;
using rlm::config::ValidateConfig;
using rlm::testing::TempDir;

const char* const kManagedVariables[] = {
    "RLM_CONFIG",
    "RLM_PROVIDERS__OPENROUTER__API_KEY",
    "OPENROUTER_API_KEY",
    "RLM_PROVIDERS__OPENROUTER__API_BASE",
    "OPENROUTER_API_BASE",
    "RLM_AGENTS__DEFAULTS__MODEL",
    "RLM_AGENTS__DEFAULTS__MAX_TURNS",
    "RLM_SANDBOX__BACKEND",
    "RLM_SANDBOX__API_KEY",
    "RLM_API_KEY",
    "RLM_SANDBOX__MAX_RECURSION_DEPTH",
    "RLM_MAX_RECURSION_DEPTH",
    "RLM_LOGGING__LEVEL",
    "RLM_LOG_LEVEL",
};

// Clears the variables the loader reads and restores them afterwards.
class ConfigLoaderTest : public ::testing::Test {
protected:
    ConfigLoaderTest()
        : dir_("rlm_config") {}

    void SetUp() override {
        for (const char* name : kManagedVariables) {
            if (const char* value = std::getenv(name)) {
                saved_[name] = value;
            }
            ::unsetenv(name);
        }
    }

    void TearDown() override {
        for (const char* name : kManagedVariables) {
            const auto it = saved_.find(name);
            if (it == saved_.end()) {
                ::unsetenv(name);
            } else {
                ::setenv(name, it->second.c_str(), 1);
            }
        }
    }

    std::filesystem::path WriteConfig(const std::string& json) {
        return dir_.Write("config.json", json);
    }

    TempDir dir_;
    std::map<std::string, std::string> saved_;
};

TEST_F(ConfigLoaderTest, DefaultsWhenFileIsMissing) {
    const auto config = LoadConfig(dir_.Path() / "absent.json");
    EXPECT_EQ(config.agents.defaults.model, "xiaomi/mimo-v2-flash:free");
    EXPECT_EQ(config.agents.defaults.max_turns, 15);
    EXPECT_EQ(config.agents.defaults.truncation_limit, 2000);
    EXPECT_EQ(config.sandbox.backend, BackendKind::kLocal);
    EXPECT_EQ(config.sandbox.max_recursion_depth, 3);
    EXPECT_EQ(config.sandbox.exec_timeout_s, 120);
    EXPECT_TRUE(config.providers.openrouter.api_key.empty());
}

TEST_F(ConfigLoaderTest, ReadsFileValues) {
    const auto path = WriteConfig(R"({
        "agents": {"defaults": {"model": "file/model", "maxTurns": 7, "temperature": 0.2}},
        "providers": {"openrouter": {"apiKey": "sk-file"}},
        "sandbox": {"backend": "docker", "dockerImage": "custom", "maxRecursionDepth": 1},
        "logging": {"level": "debug"}
    })");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.agents.defaults.model, "file/model");
    EXPECT_EQ(config.agents.defaults.max_turns, 7);
    EXPECT_DOUBLE_EQ(config.agents.defaults.temperature, 0.2);
    EXPECT_EQ(config.providers.openrouter.api_key, "sk-file");
    EXPECT_EQ(config.sandbox.backend, BackendKind::kDocker);
    EXPECT_EQ(config.sandbox.docker_image, "custom");
    EXPECT_EQ(config.sandbox.max_recursion_depth, 1);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = WriteConfig(R"({"agents": {"defaults": {"model": "file/model", "maxTurns": 7}}})");
    ::setenv("OPENROUTER_API_KEY", "sk-env", 1);
    ::setenv("RLM_AGENTS__DEFAULTS__MODEL", "env/model", 1);
    ::setenv("RLM_MAX_RECURSION_DEPTH", "5", 1);
    ::setenv("RLM_SANDBOX__BACKEND", "http", 1);
    ::setenv("RLM_LOG_LEVEL", "warn", 1);

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.providers.openrouter.api_key, "sk-env");
    EXPECT_EQ(config.agents.defaults.model, "env/model");
    EXPECT_EQ(config.agents.defaults.max_turns, 7);
    EXPECT_EQ(config.sandbox.max_recursion_depth, 5);
    EXPECT_EQ(config.sandbox.backend, BackendKind::kHttp);
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigLoaderTest, PrefixedVariableWinsOverPlainOne) {
    ::setenv("OPENROUTER_API_KEY", "plain", 1);
    ::setenv("RLM_PROVIDERS__OPENROUTER__API_KEY", "prefixed", 1);
    EXPECT_EQ(LoadConfig(dir_.Path() / "absent.json").providers.openrouter.api_key, "prefixed");
}

TEST_F(ConfigLoaderTest, MalformedValuesKeepDefaults) {
    const auto path = WriteConfig("{ not json");
    ::setenv("RLM_AGENTS__DEFAULTS__MAX_TURNS", "many", 1);
    ::setenv("RLM_SANDBOX__BACKEND", "kubernetes", 1);
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.agents.defaults.max_turns, 15);
    EXPECT_EQ(config.sandbox.backend, BackendKind::kLocal);
}

TEST_F(ConfigLoaderTest, ConfigPathHonoursOverride) {
    ::setenv("RLM_CONFIG", "/tmp/custom-rlm.json", 1);
    EXPECT_EQ(rlm::config::GetConfigPath(), std::filesystem::path("/tmp/custom-rlm.json"));
}

TEST_F(ConfigLoaderTest, RunConfigTakesResolvedValues) {
    Config config{};
    config.agents.defaults.model = "root";
    config.sandbox.exec_timeout_s = 45;
    config.sandbox.max_recursion_depth = 2;
    rlm::config::ContextSource context{};
    context.path = "book.txt";

    const auto run = rlm::config::MakeRunConfig(config, "q", context);
    EXPECT_EQ(run.query, "q");
    EXPECT_EQ(run.context.path, "book.txt");
    EXPECT_EQ(run.model, "root");
    EXPECT_EQ(run.per_exec_timeout_s, 45);
    EXPECT_EQ(run.max_recursion_depth, 2);
}

TEST(ValidateConfigTest, RequiresCredentials) {
    Config config{};
    EXPECT_THROW(ValidateConfig(config), rlm::utils::ConfigurationError);
    config.providers.openrouter.api_key = "sk";
    EXPECT_NO_THROW(ValidateConfig(config));
    config.providers.openrouter.api_key.clear();
    config.providers.openrouter.api_base = "http://localhost:4000/v1";
    EXPECT_NO_THROW(ValidateConfig(config));
}

TEST(ValidateConfigTest, RejectsBadLimits) {
    Config config{};
    config.providers.openrouter.api_key = "sk";

    auto bad = config;
    bad.agents.defaults.max_turns = 0;
    EXPECT_THROW(ValidateConfig(bad), rlm::utils::ConfigurationError);

    bad = config;
    bad.sandbox.max_recursion_depth = -1;
    EXPECT_THROW(ValidateConfig(bad), rlm::utils::ConfigurationError);

    bad = config;
    bad.sandbox.backend = BackendKind::kHttp;
    bad.sandbox.server_url.clear();
    EXPECT_THROW(ValidateConfig(bad), rlm::utils::ConfigurationError);
}

TEST(ParseLogLevelTest, IgnoresCaseAndFallsBack) {
    using rlm::utils::LogLevel;
    using rlm::utils::ParseLogLevel;
    EXPECT_EQ(ParseLogLevel("DEBUG", LogLevel::kInfo), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("Warning", LogLevel::kInfo), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error", LogLevel::kInfo), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("verbose", LogLevel::kWarn), LogLevel::kWarn);
}

}  // namespace
