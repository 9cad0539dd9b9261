#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"

namespace codeact::providers {

struct Message {
    std::string role;
    std::string content;
};

struct LLMResponse {
    std::string content;
    std::string finish_reason = "stop";
    std::unordered_map<std::string, int> usage;
};

// Transport failures, HTTP errors and unusable response bodies.
class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ProviderSettings {
    std::string api_key;
    std::string api_base;
    std::string model;
    bool use_proxy_for_llm = false;
    int timeout_s = 120;
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    virtual LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) = 0;
    virtual std::string GetDefaultModel() const = 0;
};

ProviderSettings ResolveProviderSettings(const codeact::config::Config& config);
std::unique_ptr<LLMProvider> CreateProvider(const codeact::config::Config& config);

}  // namespace codeact::providers
