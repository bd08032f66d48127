#pragma once

#include <string>

namespace rlm::config {

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
};

struct ProvidersConfig {
    ProviderConfig openrouter;
    bool use_proxy_for_llm = false;
    std::string referer = "https://github.com/rlm-engine";
    std::string title = "RLM Engine";
    int timeout_s = 180;
};

struct AgentDefaults {
    std::string model = "xiaomi/mimo-v2-flash:free";
    std::string sub_query_model;
    int max_turns = 15;
    int truncation_limit = 2000;
    int max_tokens = 0;
    double temperature = 0.7;
};

struct AgentsConfig {
    AgentDefaults defaults;
};

enum class BackendKind {
    kLocal,
    kDocker,
    kHttp,
    kInProcess
};

inline const char* ToString(BackendKind kind) {
    switch (kind) {
        case BackendKind::kLocal: return "local";
        case BackendKind::kDocker: return "docker";
        case BackendKind::kHttp: return "http";
        case BackendKind::kInProcess: return "inprocess";
    }
    return "unknown";
}

bool ParseBackendKind(const std::string& value, BackendKind& kind);

struct SandboxConfig {
    BackendKind backend = BackendKind::kLocal;
    std::string server_command = "rlm_repl_server";
    std::string docker_image = "rlm-sandbox";
    std::string container_name = "rlm-sandbox-instance";
    std::string server_url = "http://localhost:8080";
    std::string api_key;
    int max_recursion_depth = 3;
    int ready_timeout_s = 30;
    int exec_timeout_s = 120;
    int ping_timeout_s = 5;
    int get_var_timeout_s = 10;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    AgentsConfig agents;
    ProvidersConfig providers;
    SandboxConfig sandbox;
    LoggingConfig logging;
};

enum class ContextKind {
    kFile,
    kDirectory
};

struct ContextSource {
    ContextKind kind = ContextKind::kFile;
    std::string path;
    std::string description = "text document";
};

// Settings of one agent run, resolved from Config plus command-line flags.
struct RunConfig {
    std::string query;
    ContextSource context;
    std::string model = "xiaomi/mimo-v2-flash:free";
    int max_turns = 15;
    int truncation_limit = 2000;
    int max_recursion_depth = 3;
    int per_exec_timeout_s = 120;
    int max_tokens = 0;
    double temperature = 0.7;
};

RunConfig MakeRunConfig(const Config& config, std::string query, ContextSource context);

}  // namespace rlm::config
