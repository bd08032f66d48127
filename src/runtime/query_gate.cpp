#include "runtime/query_gate.hpp"

#include <exception>
#include <utility>
#include <vector>

#include "utils/logging.hpp"

namespace rlm::runtime {
namespace {

class DepthGuard {
public:
    explicit DepthGuard(std::atomic<int>& depth)
        : depth_(depth) {}
    ~DepthGuard() {
        depth_.fetch_sub(1);
    }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    std::atomic<int>& depth_;
};

// Takes one level unless the limit is reached; check and increment are a
// single step so concurrent callers cannot overshoot.
bool TryEnter(std::atomic<int>& depth, int max_depth, int& entered) {
    int current = depth.load();
    while (current < max_depth) {
        if (depth.compare_exchange_weak(current, current + 1)) {
            entered = current + 1;
            return true;
        }
    }
    return false;
}

}  // namespace

std::string RecursionLimitMessage(int max_depth) {
    return "Error: Maximum recursion depth (" + std::to_string(max_depth) +
        ") reached. Cannot make more llm_query calls.";
}

QueryGate::QueryGate(rlm::providers::LLMProvider* provider,
                     RecursionContext context,
                     std::string default_model,
                     const rlm::sandbox::FileIndex* files)
    : provider_(provider)
    , depth_(context.current_depth)
    , max_depth_(context.max_depth)
    , default_model_(std::move(default_model))
    , files_(files) {}

std::string QueryGate::Query(const std::string& prompt, const std::string& model) {
    if (!provider_) {
        if (depth_.load() >= max_depth_) {
            return RecursionLimitMessage(max_depth_);
        }
        return "Error: OPENROUTER_API_KEY not set in environment";
    }
    int entered = 0;
    if (!TryEnter(depth_, max_depth_, entered)) {
        rlm::utils::LogWarn("gate", "depth limit " + std::to_string(max_depth_) + " reached");
        return RecursionLimitMessage(max_depth_);
    }

    DepthGuard guard(depth_);
    rlm::utils::LogInfo(
        "gate",
        "sub-query at depth " + std::to_string(entered) + "/" + std::to_string(max_depth_));

    std::string content = prompt;
    if (files_ && !files_->Empty()) {
        content = files_->Summary(kSummaryMaxFiles, kSummaryMaxChars) + "\n" + prompt;
    }
    const std::vector<rlm::providers::Message> messages{{"user", content}};
    const auto chosen = model.empty() ? default_model_ : model;

    try {
        return provider_->Chat(messages, chosen, 0, 0.7);
    } catch (const std::exception& ex) {
        rlm::utils::LogError("gate", std::string("sub-query failed: ") + ex.what());
        return std::string("Error making LLM request: ") + ex.what();
    }
}

}  // namespace rlm::runtime
