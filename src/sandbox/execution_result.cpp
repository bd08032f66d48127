#include "sandbox/execution_result.hpp"

namespace rlm::sandbox {

nlohmann::json ToJson(const ExecutionResult& result) {
    return {
        {"success", result.success},
        {"output", result.output},
        {"error", result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr)}
    };
}

ExecutionResult ExecutionResultFromJson(const nlohmann::json& json) {
    ExecutionResult result{};
    if (!json.is_object()) {
        result.error = "Malformed execution response: " + json.dump();
        return result;
    }
    result.success = json.contains("success") && json["success"].is_boolean() &&
        json["success"].get<bool>();
    if (json.contains("output") && json["output"].is_string()) {
        result.output = json["output"].get<std::string>();
    }
    if (json.contains("error") && !json["error"].is_null()) {
        result.error = json["error"].is_string()
            ? json["error"].get<std::string>()
            : json["error"].dump();
    }
    return result;
}

}  // namespace rlm::sandbox
