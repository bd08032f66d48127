#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace rlm::providers {

// OpenAI-compatible chat completions client (OpenRouter by default).
class OpenRouterProvider : public LLMProvider {
public:
    explicit OpenRouterProvider(ProviderSettings settings);

    std::string Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return settings_.model; }

private:
    ProviderSettings settings_;
};

}  // namespace rlm::providers
