#include "providers/litellm_provider.hpp"

#include <cstdlib>
#include <memory>
#include <string>

#include "httplib.h"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeact::providers {
namespace {

using codeact::utils::LogLevel;

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = std::stoi(host_port.substr(colon_pos + 1));
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::logic_error&) {
        return false;
    }
    return !host.empty() && port > 0;
}

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

void ApplyProxy(httplib::Client& client) {
    for (const char* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
        std::string host;
        int port = 0;
        if (ParseProxyHostPort(GetEnv(name), host, port)) {
            client.set_proxy(host, port);
            return;
        }
    }
    if (!GetEnv("ALL_PROXY").empty() || !GetEnv("all_proxy").empty()) {
        codeact::utils::Log(LogLevel::kWarn, "llm",
                            "ALL_PROXY is set but cpp-httplib only supports HTTP proxy");
    }
}

int ReadTokenCount(const nlohmann::json& usage, const char* key) {
    if (!usage.contains(key) || !usage[key].is_number_integer()) {
        return -1;
    }
    return usage[key].get<int>();
}

}  // namespace

LiteLLMProvider::LiteLLMProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {
    is_openrouter_ = (!settings_.api_key.empty() && settings_.api_key.rfind("sk-or-", 0) == 0) ||
        (settings_.api_base.find("openrouter") != std::string::npos);
}

bool LiteLLMProvider::UsesAnthropicMessages(const std::string& model, const std::string& api_base) {
    const auto combined = codeact::utils::ToLower(model + " " + api_base);
    return combined.find("anthropic") != std::string::npos;
}

std::string LiteLLMProvider::NormalizeModel(const std::string& model, bool is_openrouter) {
    if (is_openrouter) {
        return model;
    }
    for (const char* prefix : {"anthropic/", "openai/", "hosted_vllm/"}) {
        const std::string p(prefix);
        if (model.rfind(p, 0) == 0) {
            return model.substr(p.size());
        }
    }
    return model;
}

nlohmann::json LiteLLMProvider::BuildPayload(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature,
    bool anthropic) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();

    std::string system_prompt;
    for (const auto& msg : messages) {
        if (anthropic && msg.role == "system") {
            if (!system_prompt.empty()) {
                system_prompt.append("\n");
            }
            system_prompt.append(msg.content);
            continue;
        }
        if (anthropic) {
            payload["messages"].push_back({
                {"role", msg.role},
                {"content", nlohmann::json::array({{{"type", "text"}, {"text", msg.content}}})}
            });
        } else {
            payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
        }
    }
    if (!system_prompt.empty()) {
        payload["system"] = system_prompt;
    }
    return payload;
}

LLMResponse LiteLLMProvider::ParseBody(const std::string& body, bool anthropic) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw ProviderError("Error calling LLM: invalid response");
    }

    LLMResponse parsed{};
    if (anthropic) {
        if (!json.contains("content") || !json["content"].is_array()) {
            throw ProviderError("Error calling LLM: response has no content");
        }
        for (const auto& block : json["content"]) {
            if (block.value("type", "") == "text") {
                parsed.content += block.value("text", "");
            }
        }
        if (json.contains("stop_reason") && json["stop_reason"].is_string()) {
            parsed.finish_reason = json["stop_reason"].get<std::string>();
        }
        if (json.contains("usage") && json["usage"].is_object()) {
            const auto input = ReadTokenCount(json["usage"], "input_tokens");
            const auto output = ReadTokenCount(json["usage"], "output_tokens");
            if (input >= 0) {
                parsed.usage["prompt_tokens"] = input;
            }
            if (output >= 0) {
                parsed.usage["completion_tokens"] = output;
            }
            if (input >= 0 && output >= 0) {
                parsed.usage["total_tokens"] = input + output;
            }
        }
        return parsed;
    }

    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        throw ProviderError("Error calling LLM: response has no choices");
    }
    const auto& choice = json["choices"][0];
    if (choice.contains("message") && choice["message"].contains("content") &&
        choice["message"]["content"].is_string()) {
        parsed.content = choice["message"]["content"].get<std::string>();
    }
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        parsed.finish_reason = choice["finish_reason"].get<std::string>();
    }
    if (json.contains("usage") && json["usage"].is_object()) {
        for (const char* key : {"prompt_tokens", "completion_tokens", "total_tokens"}) {
            const auto count = ReadTokenCount(json["usage"], key);
            if (count >= 0) {
                parsed.usage[key] = count;
            }
        }
    }
    return parsed;
}

LLMResponse LiteLLMProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    const auto chosen_model = NormalizeModel(model.empty() ? settings_.model : model, is_openrouter_);
    const bool use_anthropic = !is_openrouter_ &&
        UsesAnthropicMessages(model.empty() ? settings_.model : model, settings_.api_base);
    const auto payload = BuildPayload(messages, chosen_model, max_tokens, temperature, use_anthropic);

    std::string base_url = settings_.api_base;
    if (base_url.empty()) {
        if (use_anthropic) {
            base_url = "https://api.anthropic.com/v1";
        } else {
            base_url = is_openrouter_ ? "https://openrouter.ai/api/v1" : "https://api.openai.com/v1";
        }
    }

    ParsedUrl parsed;
    try {
        parsed = ParseUrl(base_url);
    } catch (const std::logic_error&) {
        throw ProviderError("Error calling LLM: invalid base URL " + base_url);
    }
    const std::string endpoint = parsed.base_path + (use_anthropic ? "/messages" : "/chat/completions");

    std::string scheme_host_port = parsed.https ? "https://" : "http://";
    scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);
    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    client->set_connection_timeout(settings_.timeout_s);
    client->set_read_timeout(settings_.timeout_s);
    if (settings_.use_proxy_for_llm) {
        ApplyProxy(*client);
    }

    codeact::utils::Log(LogLevel::kInfo, "llm", "POST " + scheme_host_port + endpoint,
                        {{"model", chosen_model},
                         {"api_key", MaskKey(settings_.api_key)},
                         {"style", use_anthropic ? "anthropic" : "openai"},
                         {"messages", std::to_string(messages.size())}});

    httplib::Headers headers{{"Content-Type", "application/json"}};
    if (!settings_.api_key.empty()) {
        if (use_anthropic) {
            headers.emplace("x-api-key", settings_.api_key);
            headers.emplace("anthropic-version", "2023-06-01");
        } else {
            headers.emplace("Authorization", "Bearer " + settings_.api_key);
        }
    }

    auto response = client->Post(endpoint.c_str(), headers, payload.dump(), "application/json");
    if (!response) {
        const auto err = response.error();
        const auto err_text = httplib::to_string(err);
        codeact::utils::Log(LogLevel::kError, "llm", "request failed",
                            {{"httplib_error", std::to_string(static_cast<int>(err))},
                             {"detail", err_text}});
        throw ProviderError("Error calling LLM: request failed (httplib error=" +
                            std::to_string(static_cast<int>(err)) + ", " + err_text + ")");
    }
    if (response->status >= 400) {
        codeact::utils::Log(LogLevel::kError, "llm", "HTTP " + std::to_string(response->status),
                            {{"body", response->body}});
        throw ProviderError("Error calling LLM: HTTP " + std::to_string(response->status));
    }

    auto result = ParseBody(response->body, use_anthropic);
    codeact::utils::Log(LogLevel::kDebug, "llm", "response",
                        {{"finish_reason", result.finish_reason},
                         {"chars", std::to_string(result.content.size())}});
    return result;
}

}  // namespace codeact::providers
