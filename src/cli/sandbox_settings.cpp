#include "cli/sandbox_settings.hpp"

#include <string>
#include <vector>

namespace codeact::cli {

codeact::sandbox::SandboxSettings BuildSandboxSettings(const codeact::config::SandboxConfig& config,
                                                       const std::filesystem::path& workspace_dir,
                                                       bool isolate) {
    codeact::sandbox::SandboxSettings settings{};
    settings.policy.allowed_imports = config.allowed_imports;
    settings.policy.allowed_modes = config.allowed_modes;
    settings.policy.allowed_roots = config.allowed_paths;
    if (!settings.policy.allowed_roots) {
        settings.policy.allowed_roots = std::vector<std::string>{
            std::filesystem::absolute(workspace_dir).lexically_normal().string()};
    }
    settings.timeout_seconds = config.timeout_s;
    settings.max_output_chars = config.max_output_chars;
    settings.isolate_in_subprocess = config.isolate || isolate;
    settings.max_transfer_bytes = config.max_transfer_bytes;
    return settings;
}

}  // namespace codeact::cli
