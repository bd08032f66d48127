#include "agent/context_builder.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

#include "sandbox/file_index.hpp"
#include "utils/logging.hpp"

namespace rlm::agent {
namespace {

constexpr const char* kTermination = R"(## Finishing

Once the evidence supports an answer, end your reply with one of:
- `FINAL(your answer)` to answer with text. Write `\)` for a literal closing parenthesis.
- `FINAL_VAR(name)` to answer with the value of a variable you built in code.

Do not answer before you have looked at the data with code.)";

constexpr const char* kFileTemplate = R"(You analyze a document by writing Python code that runs in a persistent interpreter.

## The document is already loaded

The variable `context` holds the whole document as a string.
- Size: {length} characters, {words} words, {lines} lines
- Kind: {kind}

Never ask for the document. Explore `context` with code instead.

## Working method

1. Explore first: print the length and a short slice such as `context[:1500]`.
2. Search and extract with ordinary Python (`re`, `split`, counting, slicing).
3. Hand a focused excerpt to `llm_query(prompt)` when a piece needs reading
   comprehension, for example `llm_query("Summarize:\n" + context[2000:6000])`.

Put the code for a step in a single ```python fenced block. Variables survive
between steps. Output longer than a few thousand characters is cut, so print
slices, not the whole document.

)";

constexpr const char* kDirectoryTemplate = R"(You analyze a codebase by writing Python code that runs in a persistent interpreter.

## The files are already indexed

- Files: {files} ({bytes} bytes in total)
- Kind: {kind}

Helpers available in the interpreter:
- `file_index`: dict of relative path -> {"size": int, "type": "text" or "binary"}
- `list_files(pattern="*")`: paths matching a glob, checked against the path and the file name
- `read_file(path)`: the text of one file; raises FileNotFoundError for unknown paths
- `llm_query(prompt)`: asks a language model about an excerpt and returns its answer

## Working method

1. Orient yourself: print `len(file_index)` and `list_files("*.md")` or similar.
2. Read the files that matter and search them with ordinary Python.
3. Use `llm_query` on focused excerpts when a piece needs reading comprehension.

Put the code for a step in a single ```python fenced block. Variables survive
between steps. Output longer than a few thousand characters is cut, so print
slices of large files.

)";

void ReplaceAll(std::string& text, const std::string& token, const std::string& value) {
    for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + value.size())) {
        text.replace(pos, token.size(), value);
    }
}

}  // namespace

ContextBuilder::ContextBuilder(rlm::config::ContextSource source)
    : source_(std::move(source)) {}

ContextStats ContextBuilder::Inspect() const {
    ContextStats stats{};
    if (source_.kind == rlm::config::ContextKind::kDirectory) {
        rlm::sandbox::FileIndex index(source_.path);
        stats.files = static_cast<std::size_t>(index.Rebuild());
        stats.total_bytes = index.TotalBytes();
        return stats;
    }

    std::ifstream input(source_.path, std::ios::binary);
    if (!input.is_open()) {
        rlm::utils::LogWarn("agent", "cannot read context file " + source_.path);
        return stats;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    const auto content = buffer.str();

    bool in_word = false;
    for (const char c : content) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++stats.length;
        }
        const bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
        if (!space && !in_word) {
            ++stats.words;
        }
        in_word = !space;
        if (c == '\n') {
            ++stats.lines;
        }
    }
    if (!content.empty() && content.back() != '\n') {
        ++stats.lines;
    }
    return stats;
}

std::string ContextBuilder::BuildFilePrompt(const ContextStats& stats) const {
    std::string prompt = kFileTemplate;
    ReplaceAll(prompt, "{length}", std::to_string(stats.length));
    ReplaceAll(prompt, "{words}", std::to_string(stats.words));
    ReplaceAll(prompt, "{lines}", std::to_string(stats.lines));
    ReplaceAll(prompt, "{kind}", source_.description);
    return prompt + kTermination;
}

std::string ContextBuilder::BuildDirectoryPrompt(const ContextStats& stats) const {
    std::string prompt = kDirectoryTemplate;
    ReplaceAll(prompt, "{files}", std::to_string(stats.files));
    ReplaceAll(prompt, "{bytes}", std::to_string(stats.total_bytes));
    ReplaceAll(prompt, "{kind}", source_.description);
    return prompt + kTermination;
}

std::string ContextBuilder::BuildSystemPrompt(const ContextStats& stats) const {
    return source_.kind == rlm::config::ContextKind::kDirectory
        ? BuildDirectoryPrompt(stats)
        : BuildFilePrompt(stats);
}

std::vector<rlm::providers::Message> ContextBuilder::BuildInitialMessages(
    const std::string& query,
    const ContextStats& stats) const {
    return {
        {"system", BuildSystemPrompt(stats)},
        {"user", "Query: " + query}
    };
}

}  // namespace rlm::agent
