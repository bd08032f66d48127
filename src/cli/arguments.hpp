#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace rlm::cli {

struct RunArguments {
    std::string query;
    std::string path;
    std::string type = "text document";
    std::optional<std::string> model;
    std::optional<int> max_turns;
    std::optional<int> truncation_limit;
    std::optional<int> max_depth;
    std::optional<int> timeout_s;
    std::optional<rlm::config::BackendKind> backend;
    std::optional<std::string> server_url;
    bool quiet = false;
    bool build_only = false;
    bool help = false;
};

struct ServerArguments {
    std::string context_file;
    std::string directory;
    int depth = 0;
    int max_depth = 3;
    std::string model = "xiaomi/mimo-v2-flash:free";
    bool http = false;
    std::string host = "0.0.0.0";
    int port = 8080;
    bool help = false;
};

// Both throw std::invalid_argument with a user-facing message on bad input.
RunArguments ParseRunArguments(const std::vector<std::string>& args);
ServerArguments ParseServerArguments(const std::vector<std::string>& args);

// Flags override the file/environment configuration.
void ApplyRunArguments(const RunArguments& args, rlm::config::Config& config);

std::string RunUsage();
std::string ServerUsage();

}  // namespace rlm::cli
