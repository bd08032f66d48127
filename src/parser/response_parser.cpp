#include "parser/response_parser.hpp"

#include <cctype>
#include <sstream>

#include "utils/common.hpp"

namespace rlm::parser {
namespace {

constexpr const char* kFence = "```";
constexpr const char* kNoticePrefix = "\n\n... [Output truncated. Total length: ";
constexpr const char* kNoticeSuffix = " chars]";
// Enough for any size_t length.
constexpr std::size_t kMaxNoticeDigits = 20;

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool StartsWithAt(const std::string& text, std::size_t pos, const std::string& token) {
    return text.compare(pos, token.size(), token) == 0;
}

// Length of a python/py tag at pos, 0 when there is none.
std::size_t MatchLanguageTag(const std::string& text, std::size_t pos) {
    for (const std::string tag : {"python", "py"}) {
        if (!StartsWithAt(text, pos, tag)) {
            continue;
        }
        const auto after = pos + tag.size();
        if (after < text.size() && IsSpace(text[after])) {
            return tag.size();
        }
    }
    return 0;
}

// Scans ```[tag]<spaces>\n ... ``` fences, skipping a candidate opening fence
// one character at a time like a left-to-right pattern search would.
std::vector<std::string> ScanFences(const std::string& text, bool tagged) {
    std::vector<std::string> blocks;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto start = text.find(kFence, pos);
        if (start == std::string::npos) {
            break;
        }
        auto cursor = start + 3;
        if (tagged) {
            const auto tag_length = MatchLanguageTag(text, cursor);
            if (tag_length == 0) {
                pos = start + 1;
                continue;
            }
            cursor += tag_length;
        }

        auto ws_end = cursor;
        while (ws_end < text.size() && IsSpace(text[ws_end])) {
            ++ws_end;
        }
        std::size_t newline = std::string::npos;
        for (auto i = ws_end; i > cursor; --i) {
            if (text[i - 1] == '\n') {
                newline = i - 1;
                break;
            }
        }
        if (newline == std::string::npos) {
            pos = start + 1;
            continue;
        }

        const auto content_start = newline + 1;
        const auto close = text.find(kFence, content_start);
        if (close == std::string::npos) {
            break;
        }
        blocks.push_back(rlm::utils::Trim(text.substr(content_start, close - content_start)));
        pos = close + 3;
    }
    return blocks;
}

bool IsAnchored(const std::string& text, std::size_t pos) {
    return pos == 0 || IsSpace(text[pos - 1]);
}

bool DetectFinalVar(const std::string& text, FinalAnswer& answer) {
    const std::string keyword = "FINAL_VAR(";
    for (auto pos = text.find(keyword); pos != std::string::npos; pos = text.find(keyword, pos + 1)) {
        if (!IsAnchored(text, pos)) {
            continue;
        }
        const auto begin = pos + keyword.size();
        auto end = begin;
        while (end < text.size() && IsIdentifierChar(text[end])) {
            ++end;
        }
        if (end == begin || end >= text.size() || text[end] != ')') {
            continue;
        }
        answer.is_final = true;
        answer.kind = FinalKind::kFinalVar;
        answer.content = text.substr(begin, end - begin);
        return true;
    }
    return false;
}

bool DetectFinalText(const std::string& text, FinalAnswer& answer) {
    const std::string keyword = "FINAL(";
    for (auto pos = text.find(keyword); pos != std::string::npos; pos = text.find(keyword, pos + 1)) {
        if (!IsAnchored(text, pos)) {
            continue;
        }
        std::string content;
        bool closed = false;
        for (auto i = pos + keyword.size(); i < text.size(); ++i) {
            if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == ')') {
                content.push_back(')');
                ++i;
                continue;
            }
            if (text[i] == ')') {
                closed = true;
                break;
            }
            content.push_back(text[i]);
        }
        if (!closed) {
            continue;
        }
        auto trimmed = rlm::utils::Trim(content);
        if (trimmed.empty()) {
            continue;
        }
        answer.is_final = true;
        answer.kind = FinalKind::kFinal;
        answer.content = std::move(trimmed);
        return true;
    }
    return false;
}

bool IsAlreadyTruncated(const std::string& text, std::size_t limit) {
    const std::string prefix = kNoticePrefix;
    const std::string suffix = kNoticeSuffix;
    if (text.size() < prefix.size() + suffix.size() + 1 ||
        text.compare(text.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    const auto notice = text.rfind(prefix);
    if (notice == std::string::npos) {
        return false;
    }
    const auto digits_begin = notice + prefix.size();
    const auto digits_end = text.size() - suffix.size();
    if (digits_begin >= digits_end || digits_end - digits_begin > kMaxNoticeDigits) {
        return false;
    }
    for (auto i = digits_begin; i < digits_end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return notice <= limit;
}

}  // namespace

std::vector<std::string> ExtractCodeBlocks(const std::string& response) {
    auto blocks = ScanFences(response, true);
    if (blocks.empty()) {
        blocks = ScanFences(response, false);
    }
    return blocks;
}

std::optional<std::string> ExtractCodeBlock(const std::string& response) {
    auto blocks = ExtractCodeBlocks(response);
    if (blocks.empty()) {
        return std::nullopt;
    }
    return blocks.front();
}

FinalAnswer DetectFinal(const std::string& response) {
    FinalAnswer answer{};
    if (DetectFinalVar(response, answer)) {
        return answer;
    }
    if (DetectFinalText(response, answer)) {
        return answer;
    }
    return FinalAnswer{};
}

std::string TruncationNotice(std::size_t total_length) {
    return std::string(kNoticePrefix) + std::to_string(total_length) + kNoticeSuffix;
}

std::string Truncate(const std::string& text, std::size_t limit) {
    if (text.size() <= limit || IsAlreadyTruncated(text, limit)) {
        return text;
    }

    auto truncated = text.substr(0, rlm::utils::Utf8SafeCut(text, limit));
    const auto last_newline = truncated.rfind('\n');
    if (last_newline != std::string::npos &&
        static_cast<double>(last_newline) > static_cast<double>(limit) * kNewlineBackoffRatio) {
        truncated.resize(last_newline);
    }
    return truncated + TruncationNotice(text.size());
}

std::string FormatResult(const rlm::sandbox::ExecutionResult& result) {
    std::vector<std::string> parts;
    if (!result.output.empty()) {
        parts.push_back("**Output:**\n```\n" + result.output + "\n```");
    }
    if (result.error && !result.error->empty()) {
        const char* heading = result.success ? "**Stderr:**" : "**Error:**";
        parts.push_back(std::string(heading) + "\n```\n" + *result.error + "\n```");
    }
    if (parts.empty()) {
        parts.push_back(result.success
            ? "*(Code executed successfully with no output)*"
            : "*(Execution failed with no output)*");
    }
    return rlm::utils::Join(parts, "\n\n");
}

std::string CleanForDisplay(const std::string& response, std::size_t max_length) {
    std::string collapsed;
    collapsed.reserve(response.size());
    std::size_t newlines = 0;
    for (const char c : response) {
        newlines = (c == '\n') ? newlines + 1 : 0;
        if (newlines <= 2) {
            collapsed.push_back(c);
        }
    }
    auto cleaned = rlm::utils::Trim(collapsed);
    if (cleaned.size() <= max_length) {
        return cleaned;
    }
    return cleaned.substr(0, rlm::utils::Utf8SafeCut(cleaned, max_length)) + "...";
}

}  // namespace rlm::parser
