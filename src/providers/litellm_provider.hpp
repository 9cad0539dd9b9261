#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "providers/llm_provider.hpp"

namespace codeact::providers {

// Chat client for OpenAI-compatible /chat/completions endpoints, switching to
// the Anthropic /messages API when the model or base URL names anthropic.
class LiteLLMProvider : public LLMProvider {
public:
    explicit LiteLLMProvider(ProviderSettings settings);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return settings_.model; }

    static bool UsesAnthropicMessages(const std::string& model, const std::string& api_base);
    static nlohmann::json BuildPayload(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature,
        bool anthropic);
    // Throws ProviderError when the body is not a usable completion.
    static LLMResponse ParseBody(const std::string& body, bool anthropic);

private:
    ProviderSettings settings_;
    bool is_openrouter_ = false;

    static std::string NormalizeModel(const std::string& model, bool is_openrouter);
};

}  // namespace codeact::providers
