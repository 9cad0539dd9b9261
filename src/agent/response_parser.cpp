#include "agent/response_parser.hpp"

#include "utils/common.hpp"

namespace codeact::agent {
namespace {

constexpr const char* kAmbiguousMessage =
    "Invalid XML Response Format: <code> and <response> cannot both be present. Only one is allowed.";
constexpr const char* kMissingMessage =
    "Invalid XML Response Format: expected <code>...</code> or <response>...</response>";

}  // namespace

std::string ParsedAction::AnswerText() const {
    return codeact::utils::Join(blocks, "\n");
}

std::vector<std::string> ExtractTagged(const std::string& text, const std::string& tag) {
    // ASCII lowering keeps byte offsets aligned with the original text.
    const auto lowered = codeact::utils::ToLower(text);
    const auto open = "<" + codeact::utils::ToLower(tag) + ">";
    const auto close = "</" + codeact::utils::ToLower(tag) + ">";

    std::vector<std::string> spans;
    std::size_t pos = 0;
    while (true) {
        const auto start = lowered.find(open, pos);
        if (start == std::string::npos) {
            break;
        }
        const auto body = start + open.size();
        const auto end = lowered.find(close, body);
        if (end == std::string::npos) {
            break;
        }
        spans.push_back(codeact::utils::Trim(text.substr(body, end - body)));
        pos = end + close.size();
    }
    return spans;
}

ParsedAction ParseResponse(const std::string& text) {
    const auto lowered = codeact::utils::ToLower(text);
    const bool has_code = lowered.find("<code>") != std::string::npos;
    const bool has_answer = lowered.find("<response>") != std::string::npos;
    if (has_code && has_answer) {
        throw ResponseFormatError(kAmbiguousMessage);
    }

    auto code = ExtractTagged(text, "code");
    if (!code.empty()) {
        return ParsedAction{ActionKind::kCodeBatch, std::move(code)};
    }
    auto answer = ExtractTagged(text, "response");
    if (!answer.empty()) {
        return ParsedAction{ActionKind::kAnswer, std::move(answer)};
    }
    throw ResponseFormatError(kMissingMessage);
}

}  // namespace codeact::agent
