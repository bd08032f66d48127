#include "providers/openrouter_provider.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace rlm::providers {
namespace {

using rlm::utils::GetEnv;

void ConfigureProxy(httplib::Client& client) {
    const char* kProxyVars[] = {
        "HTTPS_PROXY",
        "HTTP_PROXY",
        "https_proxy",
        "http_proxy"
    };
    for (const auto* key : kProxyVars) {
        std::string proxy_host;
        int proxy_port = 0;
        if (rlm::utils::ParseProxyHostPort(GetEnv(key), proxy_host, proxy_port)) {
            client.set_proxy(proxy_host, proxy_port);
            return;
        }
    }
    if (!GetEnv("ALL_PROXY").empty() || !GetEnv("all_proxy").empty()) {
        rlm::utils::LogWarn("llm", "ALL_PROXY is set but cpp-httplib only supports HTTP proxy");
    }
}

nlohmann::json BuildPayload(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();
    for (const auto& msg : messages) {
        payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
    }
    if (max_tokens > 0) {
        payload["max_tokens"] = max_tokens;
    }
    return payload;
}

std::string ExtractContent(const nlohmann::json& json) {
    if (json.contains("error") && !json["error"].is_null()) {
        const auto& error = json["error"];
        const auto detail = error.is_object() && error.contains("message") && error["message"].is_string()
            ? error["message"].get<std::string>()
            : error.dump();
        throw rlm::utils::TransportError("OpenRouter API error: " + detail);
    }
    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        throw rlm::utils::TransportError("invalid response: missing choices");
    }
    const auto& choice = json["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        throw rlm::utils::TransportError("invalid response: missing message");
    }
    const auto& message = choice["message"];
    if (!message.contains("content") || message["content"].is_null()) {
        return std::string();
    }
    if (!message["content"].is_string()) {
        throw rlm::utils::TransportError("invalid response: content is not text");
    }
    return message["content"].get<std::string>();
}

}  // namespace

OpenRouterProvider::OpenRouterProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {}

std::string OpenRouterProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    const auto chosen_model = model.empty() ? settings_.model : model;
    const auto payload = BuildPayload(messages, chosen_model, max_tokens, temperature);

    rlm::utils::ParsedUrl parsed;
    try {
        parsed = rlm::utils::ParseUrl(settings_.api_base);
    } catch (const std::invalid_argument& ex) {
        throw rlm::utils::TransportError(ex.what());
    }
    const std::string endpoint = parsed.base_path + "/chat/completions";

    httplib::Client client(parsed.Origin());
    client.set_connection_timeout(30);
    client.set_read_timeout(settings_.timeout_s);
    client.set_write_timeout(30);
    if (settings_.use_proxy_for_llm) {
        ConfigureProxy(client);
    }

    rlm::utils::Log(rlm::utils::LogMessage{
        rlm::utils::LogLevel::kDebug,
        "llm",
        "POST " + parsed.Origin() + endpoint,
        {{"model", chosen_model},
         {"api_key", rlm::utils::MaskKey(settings_.api_key)},
         {"messages", std::to_string(messages.size())}}});

    httplib::Headers headers{{"Content-Type", "application/json"}};
    if (!settings_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + settings_.api_key);
    }
    if (!settings_.referer.empty()) {
        headers.emplace("HTTP-Referer", settings_.referer);
    }
    if (!settings_.title.empty()) {
        headers.emplace("X-Title", settings_.title);
    }

    auto response = client.Post(endpoint, headers, payload.dump(), "application/json");
    if (!response) {
        const auto err = response.error();
        std::ostringstream message;
        message << "request failed (httplib error=" << static_cast<int>(err)
                << ", " << httplib::to_string(err) << ")";
        rlm::utils::LogError("llm", message.str());
        throw rlm::utils::TransportError(message.str());
    }
    if (response->status < 200 || response->status >= 300) {
        rlm::utils::LogError(
            "llm",
            "HTTP " + std::to_string(response->status) + " body=" + response->body.substr(0, 500));
        throw rlm::utils::TransportError("HTTP " + std::to_string(response->status));
    }

    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded()) {
        throw rlm::utils::TransportError("invalid response: body is not JSON");
    }
    return ExtractContent(json);
}

}  // namespace rlm::providers
