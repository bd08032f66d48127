#include <map>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "agent/agent_loop.hpp"
#include "parser/response_parser.hpp"
#include "test_support.hpp"

namespace {

using rlm::agent::AgentLoop;
using rlm::sandbox::ExecutionResult;
using rlm::testing::ScriptedProvider;
using rlm::testing::TempDir;

class FakeBackend : public rlm::sandbox::ExecutionBackend {
public:
    bool Start() override {
        events.push_back("start");
        return start_ok;
    }
    void Stop() override {
        events.push_back("stop");
    }
    bool Ping() override {
        return true;
    }
    ExecutionResult ExecCode(const std::string& code, std::chrono::seconds timeout) override {
        events.push_back("exec");
        executed.push_back(code);
        last_timeout = timeout;
        return next_result;
    }
    std::optional<nlohmann::json> GetVariable(const std::string& name) override {
        events.push_back("get_var:" + name);
        const auto it = variables.find(name);
        if (it == variables.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    int Reindex() override {
        return 0;
    }
    std::map<std::string, std::string> ListVariables() override {
        return {};
    }
    bool Reset() override {
        return true;
    }
    std::string Name() const override {
        return "fake";
    }

    bool start_ok = true;
    ExecutionResult next_result{true, "", std::nullopt};
    std::map<std::string, nlohmann::json> variables;
    std::vector<std::string> events;
    std::vector<std::string> executed;
    std::chrono::seconds last_timeout{0};
};

class AgentLoopTest : public ::testing::Test {
protected:
    AgentLoopTest()
        : dir_("rlm_agent") {
        context_path_ = dir_.Write("input.txt", "the quick brown fox").string();
    }

    rlm::config::RunConfig MakeRun(int max_turns = 15) const {
        rlm::config::RunConfig run{};
        run.query = "How many words are in the document?";
        run.context.kind = rlm::config::ContextKind::kFile;
        run.context.path = context_path_;
        run.model = "root/model";
        run.max_turns = max_turns;
        return run;
    }

    TempDir dir_;
    std::string context_path_;
};

TEST_F(AgentLoopTest, AnswersWithFinalAfterCountingWords) {
    ScriptedProvider provider({
        "Let me count.\n```python\nprint(len(context.split()))\n```",
        "The document has four words.\nFINAL(4)"
    });
    FakeBackend backend;
    backend.next_result = ExecutionResult{true, "4", std::nullopt};

    AgentLoop agent(provider, backend, MakeRun());
    EXPECT_EQ(agent.Run(), "4");
    EXPECT_EQ(agent.TurnCount(), 2);

    const auto history = agent.History();
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[0].role, "system");
    EXPECT_NE(history[0].content.find("4 words"), std::string::npos);
    EXPECT_EQ(history[1].content, "Query: How many words are in the document?");
    EXPECT_EQ(history[2].role, "assistant");
    EXPECT_EQ(history[3].role, "user");
    EXPECT_EQ(history[3].content, "Execution Result:\n**Output:**\n```\n4\n```");

    ASSERT_EQ(backend.executed.size(), 1u);
    EXPECT_EQ(backend.executed[0], "print(len(context.split()))");
    EXPECT_EQ(backend.last_timeout, std::chrono::seconds(120));
    EXPECT_EQ(provider.models[0], "root/model");
    EXPECT_EQ(backend.events.back(), "stop");
}

TEST_F(AgentLoopTest, ExhaustsTurnBudget) {
    ScriptedProvider provider({"I am still thinking about it."});
    FakeBackend backend;

    AgentLoop agent(provider, backend, MakeRun(1));
    EXPECT_EQ(
        agent.Run(),
        "Error: Maximum turns reached without final answer. Last response:\nI am still thinking about it.");
    EXPECT_EQ(agent.TurnCount(), 1);
    EXPECT_EQ(provider.calls.size(), 1u);
}

TEST_F(AgentLoopTest, ReasoningTurnGetsNudge) {
    ScriptedProvider provider({"Thinking out loud.", "FINAL(done)"});
    FakeBackend backend;

    AgentLoop agent(provider, backend, MakeRun());
    EXPECT_EQ(agent.Run(), "done");
    const auto history = agent.History();
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[2].content, "Thinking out loud.");
    EXPECT_EQ(
        history[3].content,
        "Continue with your analysis. Execute code or provide the final answer using FINAL() or FINAL_VAR().");
    EXPECT_TRUE(backend.executed.empty());
}

TEST_F(AgentLoopTest, FinalVarResolvedAfterCodeRunsInSameTurn) {
    ScriptedProvider provider({"```python\nanswer = 'done'\n```\nFINAL_VAR(answer)"});
    FakeBackend backend;
    backend.variables["answer"] = "done";

    AgentLoop agent(provider, backend, MakeRun());
    EXPECT_EQ(agent.Run(), "done");
    const std::vector<std::string> expected{"start", "exec", "get_var:answer", "stop"};
    EXPECT_EQ(backend.events, expected);
    EXPECT_EQ(agent.History().size(), 2u);
}

TEST_F(AgentLoopTest, CodeRunsBeforeFinalTextInSameResponse) {
    ScriptedProvider provider({"```python\nprint(len(context.split()))\n```\nFINAL(4)"});
    FakeBackend backend;
    backend.next_result = ExecutionResult{true, "4", std::nullopt};

    AgentLoop agent(provider, backend, MakeRun());
    EXPECT_EQ(agent.Run(), "4");
    EXPECT_EQ(agent.TurnCount(), 1);
    ASSERT_EQ(backend.executed.size(), 1u);
    EXPECT_EQ(backend.executed[0], "print(len(context.split()))");
    const std::vector<std::string> expected{"start", "exec", "stop"};
    EXPECT_EQ(backend.events, expected);
    EXPECT_EQ(agent.History().size(), 2u);
}

TEST_F(AgentLoopTest, FinalVarSerializesNonStringValues) {
    ScriptedProvider provider({"FINAL_VAR(counts)"});
    FakeBackend backend;
    backend.variables["counts"] = nlohmann::json::array({1, 2, 3});

    AgentLoop agent(provider, backend, MakeRun());
    EXPECT_EQ(agent.Run(), "[1,2,3]");
}

TEST_F(AgentLoopTest, MissingVariableAfterCodeReportsLastOutput) {
    ScriptedProvider provider({"```python\nprint('partial')\n```\nFINAL_VAR(result)"});
    FakeBackend backend;
    backend.next_result = ExecutionResult{true, "partial", std::nullopt};

    AgentLoop agent(provider, backend, MakeRun());
    EXPECT_EQ(
        agent.Run(),
        "Variable 'result' not found. Last execution output:\n**Output:**\n```\npartial\n```");
}

TEST_F(AgentLoopTest, MissingVariableWithoutCode) {
    ScriptedProvider provider({"FINAL_VAR(result)"});
    FakeBackend backend;

    AgentLoop agent(provider, backend, MakeRun());
    EXPECT_EQ(agent.Run(), "Error: Variable 'result' not found");
}

TEST_F(AgentLoopTest, StartFailureRunsNoTurns) {
    ScriptedProvider provider({"FINAL(never)"});
    FakeBackend backend;
    backend.start_ok = false;

    AgentLoop agent(provider, backend, MakeRun());
    EXPECT_EQ(agent.Run(), "Error: Failed to start sandbox");
    EXPECT_EQ(agent.TurnCount(), 0);
    EXPECT_TRUE(provider.calls.empty());
    EXPECT_EQ(backend.events.back(), "stop");
}

TEST_F(AgentLoopTest, TransportErrorPropagatesAndStopsSandbox) {
    ScriptedProvider provider;
    provider.fail_with_transport_error = true;
    FakeBackend backend;

    AgentLoop agent(provider, backend, MakeRun());
    EXPECT_THROW(agent.Run(), rlm::utils::TransportError);
    EXPECT_EQ(backend.events.back(), "stop");
}

TEST_F(AgentLoopTest, ExecutionOutputIsTruncatedBeforeFeedback) {
    ScriptedProvider provider({"```python\nprint('x' * 5000)\n```", "FINAL(ok)"});
    FakeBackend backend;
    backend.next_result = ExecutionResult{true, std::string(5000, 'x'), std::nullopt};

    auto run = MakeRun();
    run.truncation_limit = 100;
    AgentLoop agent(provider, backend, run);
    EXPECT_EQ(agent.Run(), "ok");

    const auto& feedback = agent.History()[3].content;
    const auto formatted = rlm::parser::FormatResult(backend.next_result);
    EXPECT_NE(feedback.find(rlm::parser::TruncationNotice(formatted.size())), std::string::npos);
    EXPECT_LT(feedback.size(), 300u);
}

TEST_F(AgentLoopTest, FailedExecutionIsFedBack) {
    ScriptedProvider provider({"```python\n1/0\n```", "FINAL(gave up)"});
    FakeBackend backend;
    backend.next_result = ExecutionResult::Failure("ZeroDivisionError: division by zero");

    AgentLoop agent(provider, backend, MakeRun());
    EXPECT_EQ(agent.Run(), "gave up");
    EXPECT_EQ(
        agent.History()[3].content,
        "Execution Result:\n**Error:**\n```\nZeroDivisionError: division by zero\n```");
}

TEST_F(AgentLoopTest, DirectoryModeUsesDirectoryPrompt) {
    TempDir data("rlm_agent_dir");
    data.Write("a.py", "print('a')\n");
    data.Write("docs/readme.md", "# readme\n");

    ScriptedProvider provider({"FINAL(two files)"});
    FakeBackend backend;
    auto run = MakeRun();
    run.context.kind = rlm::config::ContextKind::kDirectory;
    run.context.path = data.Path().string();
    run.context.description = "codebase";

    AgentLoop agent(provider, backend, run);
    EXPECT_EQ(agent.Run(), "two files");
    const auto& system = agent.History()[0].content;
    EXPECT_NE(system.find("Files: 2"), std::string::npos);
    EXPECT_NE(system.find("read_file(path)"), std::string::npos);
    EXPECT_NE(system.find("Kind: codebase"), std::string::npos);
}

}  // namespace
