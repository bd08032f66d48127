#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "runtime/python_session.hpp"
#include "runtime/repl_server.hpp"

namespace {

using nlohmann::json;
using rlm::runtime::PythonSession;
using rlm::runtime::ReplServer;
using rlm::runtime::SessionOptions;

std::vector<json> ReadReplies(const std::string& text) {
    std::vector<json> replies;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        replies.push_back(json::parse(line));
    }
    return replies;
}

class ReplServerTest : public ::testing::Test {
protected:
    ReplServerTest()
        : session_(MakeOptions(), nullptr) {}

    static SessionOptions MakeOptions() {
        SessionOptions options{};
        options.context_text = "one two three";
        options.recursion = {1, 3};
        return options;
    }

    std::vector<json> Serve(const std::string& requests) {
        std::istringstream input(requests);
        std::ostringstream output;
        ReplServer server(session_, input, output);
        EXPECT_EQ(server.Run(), 0);
        return ReadReplies(output.str());
    }

    PythonSession session_;
};

TEST_F(ReplServerTest, AnnouncesReadiness) {
    const auto replies = Serve("");
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0]["status"], "ready");
    EXPECT_EQ(replies[0]["message"], "RLM Sandbox initialized");
    EXPECT_EQ(replies[0]["context_info"], "Loaded context with 13 characters (3 words)");
    EXPECT_EQ(replies[0]["depth"], 1);
    EXPECT_EQ(replies[0]["max_depth"], 3);
}

TEST_F(ReplServerTest, ExecutesAndKeepsState) {
    const auto replies = Serve(
        R"j({"action":"execute","code":"n = len(context.split())","id":1})j" "\n"
        R"j({"code":"print(n)","id":2})j" "\n");
    ASSERT_EQ(replies.size(), 3u);
    EXPECT_EQ(replies[1]["success"], true);
    EXPECT_EQ(replies[1]["id"], 1);
    EXPECT_EQ(replies[2]["output"], "3\n");
    EXPECT_TRUE(replies[2]["error"].is_null());
    EXPECT_EQ(replies[2]["id"], 2);
}

TEST_F(ReplServerTest, VariableRequests) {
    const auto replies = Serve(
        R"({"action":"execute","code":"answer = [1, 2]"})" "\n"
        R"({"action":"get_var","name":"answer"})" "\n"
        R"({"action":"get_var","name":"nope"})" "\n"
        R"({"action":"list_vars"})" "\n");
    ASSERT_EQ(replies.size(), 5u);
    EXPECT_EQ(replies[2]["success"], true);
    EXPECT_EQ(replies[2]["value"], json::array({1, 2}));
    EXPECT_EQ(replies[3]["success"], false);
    EXPECT_EQ(replies[3]["error"], "Variable 'nope' not found");
    EXPECT_EQ(replies[4]["variables"], (json{{"answer", "list"}}));
}

TEST_F(ReplServerTest, ProtocolErrors) {
    const auto replies = Serve(
        "not json\n"
        "\n"
        R"({"action":"dance"})" "\n"
        "[1, 2]\n");
    ASSERT_EQ(replies.size(), 4u);
    EXPECT_EQ(replies[1]["success"], false);
    EXPECT_EQ(replies[1]["error"].get<std::string>().rfind("Invalid JSON: ", 0), 0u);
    EXPECT_EQ(replies[2]["error"], "Unknown action: dance");
    EXPECT_EQ(replies[3]["success"], false);
}

TEST_F(ReplServerTest, PingResetReindexAndShutdown) {
    const auto replies = Serve(
        R"({"action":"ping","id":"a"})" "\n"
        R"({"action":"execute","code":"x = 1"})" "\n"
        R"({"action":"reset"})" "\n"
        R"({"action":"get_var","name":"x"})" "\n"
        R"({"action":"reindex"})" "\n"
        R"({"action":"shutdown"})" "\n"
        R"({"action":"ping"})" "\n");
    ASSERT_EQ(replies.size(), 7u);
    EXPECT_EQ(replies[1]["message"], "pong");
    EXPECT_EQ(replies[1]["id"], "a");
    EXPECT_EQ(replies[3]["success"], true);
    EXPECT_EQ(replies[4]["success"], false);
    EXPECT_EQ(replies[5]["files_indexed"], 0);
    EXPECT_EQ(replies[6]["message"], "Shutting down");
}

}  // namespace
