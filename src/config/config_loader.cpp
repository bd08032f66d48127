#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace rlm::config {
namespace {

using rlm::utils::GetEnv;

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ApplyString(target.api_key, source, "apiKey");
    ApplyString(target.api_base, source, "apiBase");
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("agents") && data["agents"].is_object()) {
        const auto& agents = data["agents"];
        if (agents.contains("defaults") && agents["defaults"].is_object()) {
            const auto& defaults = agents["defaults"];
            ApplyString(config.agents.defaults.model, defaults, "model");
            ApplyString(config.agents.defaults.sub_query_model, defaults, "subQueryModel");
            ApplyInt(config.agents.defaults.max_turns, defaults, "maxTurns");
            ApplyInt(config.agents.defaults.truncation_limit, defaults, "truncationLimit");
            ApplyInt(config.agents.defaults.max_tokens, defaults, "maxTokens");
            if (defaults.contains("temperature") && defaults["temperature"].is_number()) {
                config.agents.defaults.temperature = defaults["temperature"].get<double>();
            }
        }
    }

    if (data.contains("providers") && data["providers"].is_object()) {
        const auto& providers = data["providers"];
        if (providers.contains("useProxyForLLM") && providers["useProxyForLLM"].is_boolean()) {
            config.providers.use_proxy_for_llm = providers["useProxyForLLM"].get<bool>();
        }
        if (providers.contains("openrouter")) {
            ApplyProviderConfig(config.providers.openrouter, providers["openrouter"]);
        }
        ApplyString(config.providers.referer, providers, "referer");
        ApplyString(config.providers.title, providers, "title");
        ApplyInt(config.providers.timeout_s, providers, "timeoutS");
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("backend") && sandbox["backend"].is_string()) {
            BackendKind kind{};
            if (ParseBackendKind(sandbox["backend"].get<std::string>(), kind)) {
                config.sandbox.backend = kind;
            }
        }
        ApplyString(config.sandbox.server_command, sandbox, "serverCommand");
        ApplyString(config.sandbox.docker_image, sandbox, "dockerImage");
        ApplyString(config.sandbox.container_name, sandbox, "containerName");
        ApplyString(config.sandbox.server_url, sandbox, "serverUrl");
        ApplyString(config.sandbox.api_key, sandbox, "apiKey");
        ApplyInt(config.sandbox.max_recursion_depth, sandbox, "maxRecursionDepth");
        ApplyInt(config.sandbox.ready_timeout_s, sandbox, "readyTimeoutS");
        ApplyInt(config.sandbox.exec_timeout_s, sandbox, "execTimeoutS");
        ApplyInt(config.sandbox.ping_timeout_s, sandbox, "pingTimeoutS");
        ApplyInt(config.sandbox.get_var_timeout_s, sandbox, "getVarTimeoutS");
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

bool ParseBool(const std::string& value) {
    const auto lowered = rlm::utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyEnvInt(int& target, const char* name) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void ApplyEnvString(std::string& target, const char* name) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = value;
    }
}

void ApplyEnvironment(Config& config) {
    const auto openrouter_key = GetEnvFallback(
        "RLM_PROVIDERS__OPENROUTER__API_KEY",
        "OPENROUTER_API_KEY");
    if (!openrouter_key.empty()) {
        config.providers.openrouter.api_key = openrouter_key;
    }

    const auto openrouter_base = GetEnvFallback(
        "RLM_PROVIDERS__OPENROUTER__API_BASE",
        "OPENROUTER_API_BASE");
    if (!openrouter_base.empty()) {
        config.providers.openrouter.api_base = openrouter_base;
    }

    const auto use_proxy_for_llm = GetEnv("RLM_PROVIDERS__USE_PROXY_FOR_LLM");
    if (!use_proxy_for_llm.empty()) {
        config.providers.use_proxy_for_llm = ParseBool(use_proxy_for_llm);
    }

    ApplyEnvString(config.agents.defaults.model, "RLM_AGENTS__DEFAULTS__MODEL");
    ApplyEnvString(config.agents.defaults.sub_query_model, "RLM_AGENTS__DEFAULTS__SUB_QUERY_MODEL");
    ApplyEnvInt(config.agents.defaults.max_turns, "RLM_AGENTS__DEFAULTS__MAX_TURNS");
    ApplyEnvInt(config.agents.defaults.truncation_limit, "RLM_AGENTS__DEFAULTS__TRUNCATION_LIMIT");
    ApplyEnvInt(config.agents.defaults.max_tokens, "RLM_AGENTS__DEFAULTS__MAX_TOKENS");

    const auto temperature = GetEnv("RLM_AGENTS__DEFAULTS__TEMPERATURE");
    if (!temperature.empty()) {
        config.agents.defaults.temperature = ParseDouble(temperature, config.agents.defaults.temperature);
    }

    const auto backend = GetEnv("RLM_SANDBOX__BACKEND");
    if (!backend.empty()) {
        BackendKind kind{};
        if (ParseBackendKind(backend, kind)) {
            config.sandbox.backend = kind;
        } else {
            rlm::utils::LogWarn("config", "ignoring unknown RLM_SANDBOX__BACKEND=" + backend);
        }
    }

    ApplyEnvString(config.sandbox.server_command, "RLM_SANDBOX__SERVER_COMMAND");
    ApplyEnvString(config.sandbox.docker_image, "RLM_SANDBOX__DOCKER_IMAGE");
    ApplyEnvString(config.sandbox.server_url, "RLM_SANDBOX__SERVER_URL");

    const auto sandbox_key = GetEnvFallback("RLM_SANDBOX__API_KEY", "RLM_API_KEY");
    if (!sandbox_key.empty()) {
        config.sandbox.api_key = sandbox_key;
    }

    const auto max_depth = GetEnvFallback(
        "RLM_SANDBOX__MAX_RECURSION_DEPTH",
        "RLM_MAX_RECURSION_DEPTH");
    if (!max_depth.empty()) {
        config.sandbox.max_recursion_depth = ParseInt(max_depth, config.sandbox.max_recursion_depth);
    }

    ApplyEnvInt(config.sandbox.ready_timeout_s, "RLM_SANDBOX__READY_TIMEOUT_S");
    ApplyEnvInt(config.sandbox.exec_timeout_s, "RLM_SANDBOX__EXEC_TIMEOUT_S");

    const auto log_level = GetEnvFallback("RLM_LOGGING__LEVEL", "RLM_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

}  // namespace

bool ParseBackendKind(const std::string& value, BackendKind& kind) {
    const auto lowered = rlm::utils::ToLower(value);
    if (lowered == "local" || lowered == "process") {
        kind = BackendKind::kLocal;
        return true;
    }
    if (lowered == "docker") {
        kind = BackendKind::kDocker;
        return true;
    }
    if (lowered == "http" || lowered == "remote") {
        kind = BackendKind::kHttp;
        return true;
    }
    if (lowered == "inprocess" || lowered == "self") {
        kind = BackendKind::kInProcess;
        return true;
    }
    return false;
}

RunConfig MakeRunConfig(const Config& config, std::string query, ContextSource context) {
    RunConfig run{};
    run.query = std::move(query);
    run.context = std::move(context);
    run.model = config.agents.defaults.model;
    run.max_turns = config.agents.defaults.max_turns;
    run.truncation_limit = config.agents.defaults.truncation_limit;
    run.max_recursion_depth = config.sandbox.max_recursion_depth;
    run.per_exec_timeout_s = config.sandbox.exec_timeout_s;
    run.max_tokens = config.agents.defaults.max_tokens;
    run.temperature = config.agents.defaults.temperature;
    return run;
}

std::filesystem::path GetConfigPath() {
    const auto overridden = GetEnv("RLM_CONFIG");
    if (!overridden.empty()) {
        return std::filesystem::path(overridden);
    }
    return GetHomePath() / ".rlm" / "config.json";
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            rlm::utils::LogWarn(
                "config",
                "keeping defaults, cannot parse " + config_path.string() + ": " + ex.what());
        }
    }

    ApplyEnvironment(config);
    return config;
}

void ValidateConfig(const Config& config) {
    if (config.providers.openrouter.api_key.empty() && config.providers.openrouter.api_base.empty()) {
        throw rlm::utils::ConfigurationError(
            "OPENROUTER_API_KEY environment variable not set "
            "(or providers.openrouter.apiKey in " + GetConfigPath().string() + ")");
    }
    if (config.agents.defaults.max_turns < 1) {
        throw rlm::utils::ConfigurationError("maxTurns must be at least 1");
    }
    if (config.agents.defaults.truncation_limit < 1) {
        throw rlm::utils::ConfigurationError("truncationLimit must be positive");
    }
    if (config.sandbox.max_recursion_depth < 0) {
        throw rlm::utils::ConfigurationError("maxRecursionDepth cannot be negative");
    }
    if (config.sandbox.exec_timeout_s < 1 || config.sandbox.ready_timeout_s < 1) {
        throw rlm::utils::ConfigurationError("sandbox timeouts must be positive");
    }
    if (config.sandbox.backend == BackendKind::kHttp && config.sandbox.server_url.empty()) {
        throw rlm::utils::ConfigurationError("sandbox.serverUrl is required for the http backend");
    }
}

}  // namespace rlm::config
