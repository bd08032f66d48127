#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/execution_result.hpp"

namespace rlm::parser {

enum class FinalKind {
    kNone,
    kFinal,
    kFinalVar
};

inline const char* ToString(FinalKind kind) {
    switch (kind) {
        case FinalKind::kNone: return "NONE";
        case FinalKind::kFinal: return "FINAL";
        case FinalKind::kFinalVar: return "FINAL_VAR";
    }
    return "UNKNOWN";
}

struct FinalAnswer {
    bool is_final = false;
    FinalKind kind = FinalKind::kNone;
    // Answer text for FINAL, identifier for FINAL_VAR.
    std::string content;
};

// Fenced blocks tagged python/py when any exist, otherwise untagged ones.
std::vector<std::string> ExtractCodeBlocks(const std::string& response);
std::optional<std::string> ExtractCodeBlock(const std::string& response);

// Recognizes FINAL(text) and FINAL_VAR(identifier). The keyword must start the
// text or follow whitespace and the '(' must follow it directly. FINAL_VAR wins
// when both are present. FINAL content ends at the first unescaped ')'; "\)"
// stands for a literal parenthesis. Empty content does not count.
FinalAnswer DetectFinal(const std::string& response);

inline constexpr double kNewlineBackoffRatio = 0.7;

std::string TruncationNotice(std::size_t total_length);
std::string Truncate(const std::string& text, std::size_t limit);

std::string FormatResult(const rlm::sandbox::ExecutionResult& result);

std::string CleanForDisplay(const std::string& response, std::size_t max_length = 500);

}  // namespace rlm::parser
