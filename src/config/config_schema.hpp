#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace codeact::config {

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
};

struct ProvidersConfig {
    ProviderConfig anthropic;
    ProviderConfig openai;
    ProviderConfig openrouter;
    ProviderConfig vllm;
    bool use_proxy_for_llm = false;
    int request_timeout_s = 120;
};

struct AgentDefaults {
    std::string workspace = "~/.codeact/workspace";
    std::string model = "anthropic/claude-sonnet-4-20250514";
    std::string system_prompt_path;
    int max_turns = 10;
    int max_tokens = 8192;
    double temperature = 0.7;
};

// An unset list means "unrestricted" for imports and modes and "nothing"
// for paths; an empty list always means "nothing permitted".
struct SandboxConfig {
    std::optional<std::vector<std::string>> allowed_imports;
    std::optional<std::vector<std::string>> allowed_paths;
    std::optional<std::vector<std::string>> allowed_modes;
    int timeout_s = 30;
    int max_output_chars = 10000;
    bool isolate = false;
    std::size_t max_transfer_bytes = 16 * 1024 * 1024;
};

struct PersistenceConfig {
    bool enabled = true;
    std::string db_file = "conversations.db";
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    AgentDefaults agent;
    SandboxConfig sandbox;
    ProvidersConfig providers;
    PersistenceConfig persistence;
    LogSettings log;
};

}  // namespace codeact::config
