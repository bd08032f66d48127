#pragma once

#include <string>
#include <vector>

#include "agent/context_builder.hpp"
#include "config/config_schema.hpp"
#include "providers/llm_provider.hpp"
#include "sandbox/execution_backend.hpp"

namespace rlm::agent {

// Alternates LLM turns with code execution in one sandbox session until the
// model answers with FINAL/FINAL_VAR or the turn budget runs out.
class AgentLoop {
public:
    AgentLoop(
        rlm::providers::LLMProvider& provider,
        rlm::sandbox::ExecutionBackend& backend,
        rlm::config::RunConfig config);

    // Starts and always stops the backend. Failures inside the run come
    // back as "Error: ..." answers; utils::TransportError from the LLM
    // propagates.
    std::string Run();

    std::vector<rlm::providers::Message> History() const { return history_; }
    int TurnCount() const { return turn_count_; }

private:
    rlm::providers::LLMProvider& provider_;
    rlm::sandbox::ExecutionBackend& backend_;
    rlm::config::RunConfig config_;
    ContextBuilder context_;
    std::vector<rlm::providers::Message> history_;
    int turn_count_ = 0;

    std::string ResolveVariable(const std::string& name, const std::string* last_output);
};

}  // namespace rlm::agent
