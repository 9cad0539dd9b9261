#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace codeact::agent {

class ResponseFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ActionKind {
    kAnswer,
    kCodeBatch
};

struct ParsedAction {
    ActionKind kind = ActionKind::kAnswer;
    // Code blocks in message order, or answer fragments.
    std::vector<std::string> blocks;

    std::string AnswerText() const;
};

// Classifies one assistant message. Throws ResponseFormatError when the
// message carries both marker kinds or no complete marker at all.
ParsedAction ParseResponse(const std::string& text);

// Trimmed contents of every <tag>...</tag> span, matched case-insensitively.
std::vector<std::string> ExtractTagged(const std::string& text, const std::string& tag);

}  // namespace codeact::agent
