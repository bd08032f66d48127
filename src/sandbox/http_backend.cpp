#include "sandbox/http_backend.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace rlm::sandbox {

HttpBackend::HttpBackend(HttpBackendOptions options)
    : options_(std::move(options)) {}

nlohmann::json HttpBackend::Call(const std::string& method,
                                 const std::string& path,
                                 const nlohmann::json& body,
                                 std::chrono::seconds timeout,
                                 int* status,
                                 const httplib::Params& params) {
    rlm::utils::ParsedUrl parsed;
    try {
        parsed = rlm::utils::ParseUrl(options_.server_url);
    } catch (const std::invalid_argument& ex) {
        throw rlm::utils::TransportError(ex.what());
    }

    httplib::Client client(parsed.Origin());
    client.set_connection_timeout(static_cast<time_t>(std::min<long long>(timeout.count(), 10)));
    client.set_read_timeout(static_cast<time_t>(timeout.count()));
    client.set_write_timeout(static_cast<time_t>(timeout.count()));

    httplib::Headers headers;
    if (!options_.api_key.empty()) {
        headers.emplace("X-API-Key", options_.api_key);
    }

    const auto target = parsed.base_path + path;
    httplib::Result response = method == "GET"
        ? client.Get(target, params, headers)
        : client.Post(target, headers, body.dump(), "application/json");
    if (!response) {
        std::ostringstream message;
        message << method << " " << target << " failed (" << httplib::to_string(response.error()) << ")";
        throw rlm::utils::TransportError(message.str());
    }
    if (status) {
        *status = response->status;
    }
    const bool allowed = status != nullptr && response->status == 404;
    if ((response->status < 200 || response->status >= 300) && !allowed) {
        throw rlm::utils::TransportError(
            method + " " + target + " returned HTTP " + std::to_string(response->status));
    }
    auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded()) {
        throw rlm::utils::TransportError(method + " " + target + " returned a non-JSON body");
    }
    return json;
}

bool HttpBackend::Start() {
    const auto deadline = std::chrono::steady_clock::now() + options_.ready_timeout;
    rlm::utils::LogInfo("remote", "waiting for " + options_.server_url);
    while (std::chrono::steady_clock::now() < deadline) {
        const auto status = Status();
        if (status && status->contains("status") && (*status)["status"] == "ready") {
            rlm::utils::LogInfo("remote", "connected, " + status->dump());
            return true;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }
    rlm::utils::LogError(
        "remote",
        options_.server_url + " not ready after " + std::to_string(options_.ready_timeout.count()) + "s");
    return false;
}

void HttpBackend::Stop() {
    rlm::utils::LogDebug("remote", "leaving remote sandbox running");
}

bool HttpBackend::Ping() {
    try {
        const auto status = Call("GET", "/status", nullptr, options_.ping_timeout);
        return status.contains("status") && status["status"] == "ready";
    } catch (const rlm::utils::TransportError& ex) {
        rlm::utils::LogDebug("remote", ex.what());
        return false;
    }
}

std::optional<nlohmann::json> HttpBackend::Status() {
    try {
        return Call("GET", "/status", nullptr, options_.ping_timeout);
    } catch (const rlm::utils::TransportError& ex) {
        rlm::utils::LogDebug("remote", ex.what());
        return std::nullopt;
    }
}

ExecutionResult HttpBackend::ExecCode(const std::string& code, std::chrono::seconds timeout) {
    try {
        return ExecutionResultFromJson(Call("POST", "/execute", {{"code", code}}, timeout));
    } catch (const rlm::utils::TransportError& ex) {
        rlm::utils::LogError("remote", ex.what());
        return ExecutionResult::Failure(std::string("Error communicating with sandbox: ") + ex.what());
    }
}

std::optional<nlohmann::json> HttpBackend::GetVariable(const std::string& name) {
    try {
        auto reply = Call("POST", "/get_var", {{"name", name}}, options_.request_timeout);
        if (!reply.contains("success") || reply["success"] != true || !reply.contains("value")) {
            return std::nullopt;
        }
        return reply["value"];
    } catch (const rlm::utils::TransportError& ex) {
        rlm::utils::LogError("remote", ex.what());
        return std::nullopt;
    }
}

int HttpBackend::Reindex() {
    try {
        const auto reply = Call("POST", "/reindex", nlohmann::json::object(), options_.request_timeout);
        return reply.contains("files_indexed") && reply["files_indexed"].is_number_integer()
            ? reply["files_indexed"].get<int>()
            : 0;
    } catch (const rlm::utils::TransportError& ex) {
        rlm::utils::LogError("remote", ex.what());
        return 0;
    }
}

std::map<std::string, std::string> HttpBackend::ListVariables() {
    std::map<std::string, std::string> variables;
    try {
        const auto reply = Call("GET", "/vars", nullptr, options_.request_timeout);
        if (reply.contains("variables") && reply["variables"].is_object()) {
            for (const auto& [name, type] : reply["variables"].items()) {
                variables[name] = type.is_string() ? type.get<std::string>() : type.dump();
            }
        }
    } catch (const rlm::utils::TransportError& ex) {
        rlm::utils::LogError("remote", ex.what());
    }
    return variables;
}

bool HttpBackend::Reset() {
    try {
        const auto reply = Call("POST", "/reset", nlohmann::json::object(), options_.request_timeout);
        return reply.contains("status") && reply["status"] == "reset";
    } catch (const rlm::utils::TransportError& ex) {
        rlm::utils::LogError("remote", ex.what());
        return false;
    }
}

std::vector<std::string> HttpBackend::ListFiles(const std::string& pattern) {
    std::vector<std::string> files;
    try {
        const auto reply = Call("GET", "/files", nullptr, options_.request_timeout, nullptr, {{"pattern", pattern}});
        if (reply.contains("files") && reply["files"].is_array()) {
            for (const auto& file : reply["files"]) {
                if (file.is_string()) {
                    files.push_back(file.get<std::string>());
                }
            }
        }
    } catch (const rlm::utils::TransportError& ex) {
        rlm::utils::LogError("remote", ex.what());
    }
    return files;
}

std::optional<std::string> HttpBackend::ReadFile(const std::string& path) {
    try {
        int status = 0;
        const auto reply = Call("GET", "/file/" + rlm::utils::EncodePath(path), nullptr, options_.request_timeout, &status);
        if (status == 404 || !reply.contains("content") || !reply["content"].is_string()) {
            return std::nullopt;
        }
        return reply["content"].get<std::string>();
    } catch (const rlm::utils::TransportError& ex) {
        rlm::utils::LogError("remote", ex.what());
        return std::nullopt;
    }
}

}  // namespace rlm::sandbox
