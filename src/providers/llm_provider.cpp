#include "providers/llm_provider.hpp"

#include "providers/litellm_provider.hpp"

namespace codeact::providers {

ProviderSettings ResolveProviderSettings(const codeact::config::Config& config) {
    ProviderSettings settings{};
    settings.model = config.agent.model.empty()
        ? "anthropic/claude-sonnet-4-20250514"
        : config.agent.model;
    settings.use_proxy_for_llm = config.providers.use_proxy_for_llm;
    settings.timeout_s = config.providers.request_timeout_s;

    if (!config.providers.openrouter.api_key.empty()) {
        settings.api_key = config.providers.openrouter.api_key;
        settings.api_base = config.providers.openrouter.api_base.empty()
            ? "https://openrouter.ai/api/v1"
            : config.providers.openrouter.api_base;
        return settings;
    }

    if (!config.providers.anthropic.api_key.empty()) {
        settings.api_key = config.providers.anthropic.api_key;
        settings.api_base = config.providers.anthropic.api_base;
        return settings;
    }

    if (!config.providers.openai.api_key.empty()) {
        settings.api_key = config.providers.openai.api_key;
        settings.api_base = config.providers.openai.api_base;
        return settings;
    }

    if (!config.providers.vllm.api_key.empty() || !config.providers.vllm.api_base.empty()) {
        settings.api_key = config.providers.vllm.api_key;
        settings.api_base = config.providers.vllm.api_base;
        return settings;
    }

    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(const codeact::config::Config& config) {
    return std::make_unique<LiteLLMProvider>(ResolveProviderSettings(config));
}

}  // namespace codeact::providers
