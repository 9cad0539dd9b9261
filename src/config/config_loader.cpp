#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "utils/logging.hpp"

namespace codeact::config {
namespace {

using codeact::utils::LogLevel;

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("apiKey") && source["apiKey"].is_string()) {
        target.api_key = source["apiKey"].get<std::string>();
    }
    if (source.contains("apiBase") && source["apiBase"].is_string()) {
        target.api_base = source["apiBase"].get<std::string>();
    }
}

// null resets the list to unset, an array replaces it (possibly with an empty list).
void ApplyOptionalList(std::optional<std::vector<std::string>>& target,
                       const nlohmann::json& section,
                       const char* key) {
    if (!section.contains(key)) {
        return;
    }
    const auto& value = section[key];
    if (value.is_null()) {
        target.reset();
        return;
    }
    if (!value.is_array()) {
        return;
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    target = std::move(items);
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        codeact::utils::Log(LogLevel::kWarn, "config", "ignoring non-integer value", {{"value", value}});
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        codeact::utils::Log(LogLevel::kWarn, "config", "ignoring non-numeric value", {{"value", value}});
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// "[]" stands for an explicit empty list, "null" for unset.
void ApplyListEnv(std::optional<std::vector<std::string>>& target,
                  const char* primary,
                  const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (value.empty()) {
        return;
    }
    if (value == "null") {
        target.reset();
    } else if (value == "[]") {
        target = std::vector<std::string>{};
    } else {
        target = SplitCsv(value);
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto override_path = GetEnv("CODEACT_CONFIG");
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    return GetHomePath() / ".codeact" / "config.json";
}

std::string ExpandHome(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        return (GetHomePath() / path.substr(path.size() > 1 ? 2 : 1)).string();
    }
    return path;
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("agent") && data["agent"].is_object()) {
        const auto& agent = data["agent"];
        if (agent.contains("workspace") && agent["workspace"].is_string()) {
            config.agent.workspace = agent["workspace"].get<std::string>();
        }
        if (agent.contains("model") && agent["model"].is_string()) {
            config.agent.model = agent["model"].get<std::string>();
        }
        if (agent.contains("systemPromptPath") && agent["systemPromptPath"].is_string()) {
            config.agent.system_prompt_path = agent["systemPromptPath"].get<std::string>();
        }
        if (agent.contains("maxTurns") && agent["maxTurns"].is_number_integer()) {
            config.agent.max_turns = agent["maxTurns"].get<int>();
        }
        if (agent.contains("maxTokens") && agent["maxTokens"].is_number_integer()) {
            config.agent.max_tokens = agent["maxTokens"].get<int>();
        }
        if (agent.contains("temperature") && agent["temperature"].is_number()) {
            config.agent.temperature = agent["temperature"].get<double>();
        }
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ApplyOptionalList(config.sandbox.allowed_imports, sandbox, "allowedImports");
        ApplyOptionalList(config.sandbox.allowed_paths, sandbox, "allowedPaths");
        ApplyOptionalList(config.sandbox.allowed_modes, sandbox, "allowedModes");
        if (sandbox.contains("timeoutS") && sandbox["timeoutS"].is_number_integer()) {
            config.sandbox.timeout_s = sandbox["timeoutS"].get<int>();
        }
        if (sandbox.contains("maxOutputChars") && sandbox["maxOutputChars"].is_number_integer()) {
            config.sandbox.max_output_chars = sandbox["maxOutputChars"].get<int>();
        }
        if (sandbox.contains("isolate") && sandbox["isolate"].is_boolean()) {
            config.sandbox.isolate = sandbox["isolate"].get<bool>();
        }
        if (sandbox.contains("maxTransferBytes") && sandbox["maxTransferBytes"].is_number_unsigned()) {
            config.sandbox.max_transfer_bytes = sandbox["maxTransferBytes"].get<std::size_t>();
        }
    }

    if (data.contains("providers") && data["providers"].is_object()) {
        const auto& providers = data["providers"];
        if (providers.contains("useProxyForLLM") && providers["useProxyForLLM"].is_boolean()) {
            config.providers.use_proxy_for_llm = providers["useProxyForLLM"].get<bool>();
        }
        if (providers.contains("requestTimeoutS") && providers["requestTimeoutS"].is_number_integer()) {
            config.providers.request_timeout_s = providers["requestTimeoutS"].get<int>();
        }
        if (providers.contains("anthropic")) {
            ApplyProviderConfig(config.providers.anthropic, providers["anthropic"]);
        }
        if (providers.contains("openai")) {
            ApplyProviderConfig(config.providers.openai, providers["openai"]);
        }
        if (providers.contains("openrouter")) {
            ApplyProviderConfig(config.providers.openrouter, providers["openrouter"]);
        }
        if (providers.contains("vllm")) {
            ApplyProviderConfig(config.providers.vllm, providers["vllm"]);
        }
    }

    if (data.contains("persistence") && data["persistence"].is_object()) {
        const auto& persistence = data["persistence"];
        if (persistence.contains("enabled") && persistence["enabled"].is_boolean()) {
            config.persistence.enabled = persistence["enabled"].get<bool>();
        }
        if (persistence.contains("dbFile") && persistence["dbFile"].is_string()) {
            config.persistence.db_file = persistence["dbFile"].get<std::string>();
        }
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            config.log.level = log["level"].get<std::string>();
        }
    }
}

Config LoadConfigFromJson(const nlohmann::json& data) {
    Config config{};
    ApplyConfigFromJson(config, data);
    return config;
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        try {
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            codeact::utils::Log(LogLevel::kWarn, "config", "keeping defaults, failed to parse config",
                                {{"path", config_path.string()}, {"error", ex.what()}});
        }
    }

    const auto anthropic_key = GetEnvFallback(
        "CODEACT_PROVIDERS__ANTHROPIC__API_KEY",
        "ANTHROPIC_API_KEY");
    if (!anthropic_key.empty()) {
        config.providers.anthropic.api_key = anthropic_key;
    }

    const auto anthropic_base = GetEnvFallback(
        "CODEACT_PROVIDERS__ANTHROPIC__API_BASE",
        "ANTHROPIC_BASE_URL");
    if (!anthropic_base.empty()) {
        config.providers.anthropic.api_base = anthropic_base;
    }

    const auto openai_key = GetEnvFallback(
        "CODEACT_PROVIDERS__OPENAI__API_KEY",
        "OPENAI_API_KEY");
    if (!openai_key.empty()) {
        config.providers.openai.api_key = openai_key;
    }

    const auto openai_base = GetEnvFallback(
        "CODEACT_PROVIDERS__OPENAI__API_BASE",
        "OPENAI_BASE_URL");
    if (!openai_base.empty()) {
        config.providers.openai.api_base = openai_base;
    }

    const auto openrouter_key = GetEnvFallback(
        "CODEACT_PROVIDERS__OPENROUTER__API_KEY",
        "CODEACT_PROVIDERS_OPENROUTER_API_KEY");
    if (!openrouter_key.empty()) {
        config.providers.openrouter.api_key = openrouter_key;
    }

    const auto vllm_base = GetEnvFallback(
        "CODEACT_PROVIDERS__VLLM__API_BASE",
        "CODEACT_PROVIDERS_VLLM_API_BASE");
    if (!vllm_base.empty()) {
        config.providers.vllm.api_base = vllm_base;
    }

    const auto use_proxy_for_llm = GetEnvFallback(
        "CODEACT_PROVIDERS__USE_PROXY_FOR_LLM",
        "CODEACT_PROVIDERS_USE_PROXY_FOR_LLM");
    if (!use_proxy_for_llm.empty()) {
        config.providers.use_proxy_for_llm = ParseBool(use_proxy_for_llm);
    }

    const auto workspace = GetEnvFallback(
        "CODEACT_AGENT__WORKSPACE",
        "CODEACT_AGENT_WORKSPACE");
    if (!workspace.empty()) {
        config.agent.workspace = workspace;
    }

    const auto model = GetEnvFallback(
        "CODEACT_AGENT__MODEL",
        "CODEACT_AGENT_MODEL");
    if (!model.empty()) {
        config.agent.model = model;
    }

    const auto system_prompt_path = GetEnvFallback(
        "CODEACT_AGENT__SYSTEM_PROMPT_PATH",
        "CODEACT_AGENT_SYSTEM_PROMPT_PATH");
    if (!system_prompt_path.empty()) {
        config.agent.system_prompt_path = system_prompt_path;
    }

    const auto max_turns = GetEnvFallback(
        "CODEACT_AGENT__MAX_TURNS",
        "CODEACT_AGENT_MAX_TURNS");
    if (!max_turns.empty()) {
        config.agent.max_turns = ParseInt(max_turns, config.agent.max_turns);
    }

    const auto max_tokens = GetEnvFallback(
        "CODEACT_AGENT__MAX_TOKENS",
        "CODEACT_AGENT_MAX_TOKENS");
    if (!max_tokens.empty()) {
        config.agent.max_tokens = ParseInt(max_tokens, config.agent.max_tokens);
    }

    const auto temperature = GetEnvFallback(
        "CODEACT_AGENT__TEMPERATURE",
        "CODEACT_AGENT_TEMPERATURE");
    if (!temperature.empty()) {
        config.agent.temperature = ParseDouble(temperature, config.agent.temperature);
    }

    ApplyListEnv(config.sandbox.allowed_imports,
                 "CODEACT_SANDBOX__ALLOWED_IMPORTS", "CODEACT_SANDBOX_ALLOWED_IMPORTS");
    ApplyListEnv(config.sandbox.allowed_paths,
                 "CODEACT_SANDBOX__ALLOWED_PATHS", "CODEACT_SANDBOX_ALLOWED_PATHS");
    ApplyListEnv(config.sandbox.allowed_modes,
                 "CODEACT_SANDBOX__ALLOWED_MODES", "CODEACT_SANDBOX_ALLOWED_MODES");

    const auto timeout = GetEnvFallback(
        "CODEACT_SANDBOX__TIMEOUT_S",
        "CODEACT_SANDBOX_TIMEOUT_S");
    if (!timeout.empty()) {
        config.sandbox.timeout_s = ParseInt(timeout, config.sandbox.timeout_s);
    }

    const auto max_output = GetEnvFallback(
        "CODEACT_SANDBOX__MAX_OUTPUT_CHARS",
        "CODEACT_SANDBOX_MAX_OUTPUT_CHARS");
    if (!max_output.empty()) {
        config.sandbox.max_output_chars = ParseInt(max_output, config.sandbox.max_output_chars);
    }

    const auto isolate = GetEnvFallback(
        "CODEACT_SANDBOX__ISOLATE",
        "CODEACT_SANDBOX_ISOLATE");
    if (!isolate.empty()) {
        config.sandbox.isolate = ParseBool(isolate);
    }

    const auto persistence = GetEnvFallback(
        "CODEACT_PERSISTENCE__ENABLED",
        "CODEACT_PERSISTENCE_ENABLED");
    if (!persistence.empty()) {
        config.persistence.enabled = ParseBool(persistence);
    }

    const auto log_level = GetEnvFallback(
        "CODEACT_LOG__LEVEL",
        "CODEACT_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.level = log_level;
    }

    config.agent.workspace = ExpandHome(config.agent.workspace);
    return config;
}

}  // namespace codeact::config
