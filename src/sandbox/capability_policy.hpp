#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace codeact::sandbox {

struct ImportRequest {
    std::string module;
    int level = 0;
};

struct OpenFileRequest {
    std::string path;
    std::string mode = "r";
};

using CapabilityRequest = std::variant<ImportRequest, OpenFileRequest>;

struct PolicyDecision {
    bool allowed = false;
    std::string reason;
};

enum class CapabilityKind {
    kImport,
    kOpenFile
};

// Raised for every denied capability. Carries the offending target and the
// allowed set so the message can be surfaced to the executed code.
class CapabilityDenied : public std::runtime_error {
public:
    CapabilityDenied(CapabilityKind kind,
                     std::string target,
                     std::vector<std::string> allowed,
                     const std::string& reason);

    CapabilityKind Kind() const { return kind_; }
    const std::string& Target() const { return target_; }
    const std::vector<std::string>& Allowed() const { return allowed_; }

private:
    CapabilityKind kind_;
    std::string target_;
    std::vector<std::string> allowed_;
};

struct PolicyConfig {
    std::optional<std::vector<std::string>> allowed_imports;
    std::optional<std::vector<std::string>> allowed_roots;
    std::optional<std::vector<std::string>> allowed_modes;
};

class CapabilityPolicy {
public:
    // Throws std::invalid_argument when an allowed root is not absolute.
    explicit CapabilityPolicy(PolicyConfig config);

    PolicyDecision Evaluate(const CapabilityRequest& request) const;
    void Enforce(const CapabilityRequest& request) const;

    PolicyDecision CheckImport(const ImportRequest& request) const;
    PolicyDecision CheckOpen(const OpenFileRequest& request) const;
    PolicyDecision CheckMode(const std::string& mode) const;
    PolicyDecision CheckPath(const std::filesystem::path& path) const;

    const PolicyConfig& Config() const { return config_; }

    static std::string BaseMode(const std::string& mode);
    static bool IsWithin(const std::filesystem::path& path, const std::filesystem::path& root);

private:
    PolicyConfig config_;
    std::vector<std::filesystem::path> roots_;
};

}  // namespace codeact::sandbox
