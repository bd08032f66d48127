#pragma once

#include <atomic>
#include <string>

#include "providers/llm_provider.hpp"
#include "sandbox/file_index.hpp"

namespace rlm::runtime {

struct RecursionContext {
    int current_depth = 0;
    int max_depth = 3;
};

// Bounds nested llm_query calls issued by executed code. One gate per
// session. Query() may run on several threads at once; each call holds one
// level of depth until it returns.
class QueryGate {
public:
    static constexpr std::size_t kSummaryMaxFiles = 50;
    static constexpr std::size_t kSummaryMaxChars = 4000;

    // provider may be null when no credential is configured; files is only
    // set in directory mode.
    QueryGate(rlm::providers::LLMProvider* provider,
              RecursionContext context,
              std::string default_model,
              const rlm::sandbox::FileIndex* files = nullptr);

    std::string Query(const std::string& prompt, const std::string& model = "");

    RecursionContext Context() const { return {depth_.load(), max_depth_}; }
    void SetFileIndex(const rlm::sandbox::FileIndex* files) { files_ = files; }

private:
    rlm::providers::LLMProvider* provider_ = nullptr;
    std::atomic<int> depth_;
    int max_depth_;
    std::string default_model_;
    const rlm::sandbox::FileIndex* files_ = nullptr;
};

std::string RecursionLimitMessage(int max_depth);

}  // namespace rlm::runtime
