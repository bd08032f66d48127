#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace rlm::providers {

struct Message {
    std::string role;
    std::string content;
};

struct ProviderSettings {
    std::string api_key;
    std::string api_base;
    std::string model;
    std::string referer;
    std::string title;
    int timeout_s = 180;
    bool use_proxy_for_llm = false;
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    // Returns the assistant text. Throws utils::TransportError when the
    // endpoint fails, answers non-2xx, or sends a body without a choice.
    // max_tokens <= 0 leaves the limit to the endpoint.
    virtual std::string Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) = 0;
    virtual std::string GetDefaultModel() const = 0;
};

ProviderSettings ResolveProviderSettings(const rlm::config::Config& config);
std::unique_ptr<LLMProvider> CreateProvider(const rlm::config::Config& config);
std::unique_ptr<LLMProvider> CreateProvider(const ProviderSettings& settings);

}  // namespace rlm::providers
