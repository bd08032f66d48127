#include "agent/agent_loop.hpp"

#include <chrono>
#include <optional>
#include <utility>

#include "parser/response_parser.hpp"
#include "utils/logging.hpp"

namespace rlm::agent {
namespace {

constexpr const char* kNudge =
    "Continue with your analysis. Execute code or provide the final answer using FINAL() or FINAL_VAR().";

std::string Preview(const std::string& text, std::size_t limit) {
    return rlm::parser::CleanForDisplay(text, limit);
}

}  // namespace

AgentLoop::AgentLoop(
    rlm::providers::LLMProvider& provider,
    rlm::sandbox::ExecutionBackend& backend,
    rlm::config::RunConfig config)
    : provider_(provider)
    , backend_(backend)
    , config_(std::move(config))
    , context_(config_.context) {}

std::string AgentLoop::Run() {
    history_.clear();
    turn_count_ = 0;

    rlm::utils::LogInfo("agent", "query: " + config_.query);
    rlm::utils::LogInfo("agent", "context: " + config_.context.path);
    const auto stats = context_.Inspect();
    if (config_.context.kind == rlm::config::ContextKind::kDirectory) {
        rlm::utils::LogInfo(
            "agent",
            "context stats: " + std::to_string(stats.files) + " files, " +
                std::to_string(stats.total_bytes) + " bytes");
    } else {
        rlm::utils::LogInfo(
            "agent",
            "context stats: " + std::to_string(stats.length) + " chars, " +
                std::to_string(stats.words) + " words, " + std::to_string(stats.lines) + " lines");
    }

    rlm::sandbox::SessionGuard guard(backend_);
    rlm::utils::LogInfo("agent", "starting " + backend_.Name() + " sandbox");
    if (!backend_.Start()) {
        return "Error: Failed to start sandbox";
    }

    history_ = context_.BuildInitialMessages(config_.query, stats);
    const auto model = config_.model.empty() ? provider_.GetDefaultModel() : config_.model;
    const auto limit = static_cast<std::size_t>(config_.truncation_limit);
    std::string response;

    for (int turn = 0; turn < config_.max_turns; ++turn) {
        turn_count_ = turn + 1;
        rlm::utils::LogInfo(
            "agent",
            "--- turn " + std::to_string(turn_count_) + "/" + std::to_string(config_.max_turns) + " ---");

        response = provider_.Chat(history_, model, config_.max_tokens, config_.temperature);
        rlm::utils::LogDebug("agent", "model response:\n" + Preview(response, 500));

        const auto code = rlm::parser::ExtractCodeBlock(response);
        const auto final_answer = rlm::parser::DetectFinal(response);

        std::optional<std::string> truncated;
        if (code) {
            rlm::utils::LogInfo("agent", "executing code:\n" + Preview(*code, 300));
            const auto result = backend_.ExecCode(*code, std::chrono::seconds(config_.per_exec_timeout_s));
            const auto formatted = rlm::parser::FormatResult(result);
            truncated = rlm::parser::Truncate(formatted, limit);
            rlm::utils::LogDebug(
                "agent",
                "execution result (" + std::to_string(formatted.size()) + " chars):\n" + Preview(*truncated, 500));
        }

        if (final_answer.is_final) {
            rlm::utils::LogInfo(
                "agent",
                std::string("final answer detected (") + rlm::parser::ToString(final_answer.kind) + ")");
            if (final_answer.kind == rlm::parser::FinalKind::kFinalVar) {
                return ResolveVariable(final_answer.content, truncated ? &*truncated : nullptr);
            }
            return final_answer.content;
        }

        history_.push_back({"assistant", response});
        if (truncated) {
            history_.push_back({"user", "Execution Result:\n" + *truncated});
        } else {
            rlm::utils::LogInfo("agent", "no code block, treating as a reasoning step");
            history_.push_back({"user", kNudge});
        }
    }

    rlm::utils::LogWarn("agent", "max turns reached without final answer");
    return "Error: Maximum turns reached without final answer. Last response:\n" + response;
}

std::string AgentLoop::ResolveVariable(const std::string& name, const std::string* last_output) {
    const auto value = backend_.GetVariable(name);
    if (value) {
        return value->is_string() ? value->get<std::string>() : value->dump();
    }
    if (last_output) {
        return "Variable '" + name + "' not found. Last execution output:\n" + *last_output;
    }
    return "Error: Variable '" + name + "' not found";
}

}  // namespace rlm::agent
