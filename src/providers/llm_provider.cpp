#include "providers/llm_provider.hpp"

#include "providers/openrouter_provider.hpp"

namespace rlm::providers {

ProviderSettings ResolveProviderSettings(const rlm::config::Config& config) {
    ProviderSettings settings{};
    settings.model = config.agents.defaults.model.empty()
        ? "xiaomi/mimo-v2-flash:free"
        : config.agents.defaults.model;
    settings.api_key = config.providers.openrouter.api_key;
    settings.api_base = config.providers.openrouter.api_base.empty()
        ? "https://openrouter.ai/api/v1"
        : config.providers.openrouter.api_base;
    settings.referer = config.providers.referer;
    settings.title = config.providers.title;
    settings.timeout_s = config.providers.timeout_s;
    settings.use_proxy_for_llm = config.providers.use_proxy_for_llm;
    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(const rlm::config::Config& config) {
    return CreateProvider(ResolveProviderSettings(config));
}

std::unique_ptr<LLMProvider> CreateProvider(const ProviderSettings& settings) {
    return std::make_unique<OpenRouterProvider>(settings);
}

}  // namespace rlm::providers
