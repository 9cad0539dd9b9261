#include "sandbox/capability_policy.hpp"

#include <algorithm>
#include <system_error>

#include "utils/common.hpp"

namespace codeact::sandbox {
namespace {

std::filesystem::path NormalizeRoot(const std::filesystem::path& root) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        resolved = root.lexically_normal();
    }
    if (!resolved.has_filename() && resolved.has_relative_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

bool Contains(const std::optional<std::vector<std::string>>& items, const std::string& value) {
    return items && std::find(items->begin(), items->end(), value) != items->end();
}

std::vector<std::string> Listed(const std::optional<std::vector<std::string>>& items) {
    return items ? *items : std::vector<std::string>{};
}

}  // namespace

CapabilityDenied::CapabilityDenied(CapabilityKind kind,
                                   std::string target,
                                   std::vector<std::string> allowed,
                                   const std::string& reason)
    : std::runtime_error(reason)
    , kind_(kind)
    , target_(std::move(target))
    , allowed_(std::move(allowed)) {}

CapabilityPolicy::CapabilityPolicy(PolicyConfig config)
    : config_(std::move(config)) {
    if (!config_.allowed_roots) {
        return;
    }
    std::vector<std::string> relative;
    for (const auto& root : *config_.allowed_roots) {
        if (!std::filesystem::path(root).is_absolute()) {
            relative.push_back(root);
            continue;
        }
        roots_.push_back(NormalizeRoot(root));
    }
    if (!relative.empty()) {
        throw std::invalid_argument(
            "The following paths are not absolute: " + codeact::utils::Join(relative, ", "));
    }
}

PolicyDecision CapabilityPolicy::Evaluate(const CapabilityRequest& request) const {
    if (const auto* import = std::get_if<ImportRequest>(&request)) {
        return CheckImport(*import);
    }
    return CheckOpen(std::get<OpenFileRequest>(request));
}

void CapabilityPolicy::Enforce(const CapabilityRequest& request) const {
    const auto decision = Evaluate(request);
    if (decision.allowed) {
        return;
    }
    if (const auto* import = std::get_if<ImportRequest>(&request)) {
        throw CapabilityDenied(CapabilityKind::kImport, import->module,
                               Listed(config_.allowed_imports), decision.reason);
    }
    const auto& open = std::get<OpenFileRequest>(request);
    throw CapabilityDenied(CapabilityKind::kOpenFile, open.path,
                           Listed(config_.allowed_roots), decision.reason);
}

PolicyDecision CapabilityPolicy::CheckImport(const ImportRequest& request) const {
    if (!config_.allowed_imports) {
        return {true, {}};
    }
    if (request.level > 0) {
        return {false, "Relative import of '" + request.module + "' is not allowed"};
    }
    // "a.b.c" is allowed when "a.b.c", "a.b" or "a" is listed.
    std::string candidate = request.module;
    while (!candidate.empty()) {
        if (Contains(config_.allowed_imports, candidate)) {
            return {true, {}};
        }
        const auto dot = candidate.rfind('.');
        if (dot == std::string::npos) {
            break;
        }
        candidate.erase(dot);
    }
    return {false, "Import of '" + request.module + "' is not allowed"};
}

PolicyDecision CapabilityPolicy::CheckOpen(const OpenFileRequest& request) const {
    if (!config_.allowed_roots || config_.allowed_roots->empty()) {
        return {false, "File operations are not allowed in this environment"};
    }
    if (request.path.empty()) {
        return {false, "Invalid file path: " + request.path};
    }

    std::error_code ec;
    const auto absolute = std::filesystem::absolute(request.path, ec);
    if (ec) {
        return {false, "Invalid file path: " + request.path};
    }
    const auto resolved = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return {false, "Invalid file path: " + request.path};
    }

    auto mode_decision = CheckMode(request.mode);
    if (!mode_decision.allowed) {
        return mode_decision;
    }
    return CheckPath(resolved);
}

PolicyDecision CapabilityPolicy::CheckMode(const std::string& mode) const {
    if (!config_.allowed_modes) {
        return {true, {}};
    }
    const auto base = BaseMode(mode);
    const bool update = mode.find('+') != std::string::npos;
    if (Contains(config_.allowed_modes, mode) ||
        (!update && Contains(config_.allowed_modes, base)) ||
        (update && Contains(config_.allowed_modes, base + "+"))) {
        return {true, {}};
    }
    return {false,
            "File mode '" + mode + "' is not allowed. Allowed modes: " +
                codeact::utils::Join(*config_.allowed_modes, ", ")};
}

PolicyDecision CapabilityPolicy::CheckPath(const std::filesystem::path& path) const {
    for (const auto& root : roots_) {
        if (IsWithin(path, root)) {
            return {true, {}};
        }
    }
    return {false,
            "Access to '" + path.string() + "' is not allowed. Allowed directories: " +
                codeact::utils::Join(Listed(config_.allowed_roots), ", ")};
}

std::string CapabilityPolicy::BaseMode(const std::string& mode) {
    std::string base;
    for (const char ch : mode) {
        if (ch != '+' && ch != 'b' && ch != 't') {
            base.push_back(ch);
        }
    }
    return base;
}

bool CapabilityPolicy::IsWithin(const std::filesystem::path& path, const std::filesystem::path& root) {
    // Component-wise comparison; "/data2" is not inside "/data".
    auto path_it = path.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it, ++path_it) {
        if (path_it == path.end() || *path_it != *root_it) {
            return false;
        }
    }
    return true;
}

}  // namespace codeact::sandbox
