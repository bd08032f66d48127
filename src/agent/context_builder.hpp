#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "providers/llm_provider.hpp"

namespace rlm::agent {

struct ContextStats {
    std::size_t length = 0;
    std::size_t words = 0;
    std::size_t lines = 0;
    // Directory mode only.
    std::size_t files = 0;
    std::uintmax_t total_bytes = 0;
};

// Renders the opening of a run: the system prompt describing the loaded
// context and the helpers, followed by the user's query.
class ContextBuilder {
public:
    explicit ContextBuilder(rlm::config::ContextSource source);

    // A missing or unreadable path yields zeroed stats.
    ContextStats Inspect() const;
    std::string BuildSystemPrompt(const ContextStats& stats) const;
    std::vector<rlm::providers::Message> BuildInitialMessages(
        const std::string& query,
        const ContextStats& stats) const;

private:
    rlm::config::ContextSource source_;

    std::string BuildFilePrompt(const ContextStats& stats) const;
    std::string BuildDirectoryPrompt(const ContextStats& stats) const;
};

}  // namespace rlm::agent
