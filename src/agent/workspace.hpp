#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace codeact::agent {

// Most recently modified non-hidden regular file directly under dir, as an
// absolute path. No recursion into subdirectories.
std::optional<std::filesystem::path> LastModifiedFile(const std::filesystem::path& dir);

// Throws std::invalid_argument unless the id names a single directory entry.
std::filesystem::path WorkspaceDirFor(const std::filesystem::path& root,
                                      const std::string& conversation_id);
std::filesystem::path EnsureWorkspace(const std::filesystem::path& root,
                                      const std::string& conversation_id);

}  // namespace codeact::agent
