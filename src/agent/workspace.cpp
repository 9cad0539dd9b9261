#include "agent/workspace.hpp"

#include <stdexcept>
#include <system_error>

#include "utils/logging.hpp"

namespace codeact::agent {

std::optional<std::filesystem::path> LastModifiedFile(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return std::nullopt;
    }

    std::optional<std::filesystem::path> latest;
    std::filesystem::file_time_type latest_time{};
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        const auto name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        const auto modified = entry.last_write_time(entry_ec);
        if (entry_ec) {
            continue;
        }
        if (!latest || modified > latest_time) {
            latest = entry.path();
            latest_time = modified;
        }
    }
    if (ec) {
        codeact::utils::Log(codeact::utils::LogLevel::kWarn, "agent", "workspace scan failed",
                            {{"dir", dir.string()}, {"error", ec.message()}});
    }
    if (!latest) {
        return std::nullopt;
    }
    auto resolved = std::filesystem::absolute(*latest, ec);
    if (ec) {
        return std::nullopt;
    }
    return resolved;
}

std::filesystem::path WorkspaceDirFor(const std::filesystem::path& root,
                                      const std::string& conversation_id) {
    if (conversation_id.empty() || conversation_id == "." || conversation_id == ".." ||
        conversation_id.find_first_of("/\\") != std::string::npos) {
        throw std::invalid_argument("invalid conversation id: " + conversation_id);
    }
    return root / conversation_id;
}

std::filesystem::path EnsureWorkspace(const std::filesystem::path& root,
                                      const std::string& conversation_id) {
    const auto dir = WorkspaceDirFor(root, conversation_id);
    std::filesystem::create_directories(dir);
    return dir;
}

}  // namespace codeact::agent
