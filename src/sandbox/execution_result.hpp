#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "nlohmann/json.hpp"

namespace rlm::sandbox {

struct ExecutionResult {
    bool success = false;
    std::string output;
    std::optional<std::string> error;

    static ExecutionResult Failure(std::string message) {
        ExecutionResult result{};
        result.error = std::move(message);
        return result;
    }
};

nlohmann::json ToJson(const ExecutionResult& result);
ExecutionResult ExecutionResultFromJson(const nlohmann::json& json);

struct FileIndexEntry {
    std::string path;
    std::uintmax_t size = 0;
    std::string type;
};

}  // namespace rlm::sandbox
