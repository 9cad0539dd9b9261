#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace codeact::cli {

// Sandbox settings for one conversation. When no file roots are configured,
// only that conversation's workspace directory is opened to executed code;
// the conversation database and sibling workspaces stay out of reach.
codeact::sandbox::SandboxSettings BuildSandboxSettings(const codeact::config::SandboxConfig& config,
                                                       const std::filesystem::path& workspace_dir,
                                                       bool isolate);

}  // namespace codeact::cli
