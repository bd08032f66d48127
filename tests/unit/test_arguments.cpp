#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "cli/arguments.hpp"

namespace {

using rlm::cli::ApplyRunArguments;
using rlm::cli::ParseRunArguments;
using rlm::cli::ParseServerArguments;
using rlm::config::BackendKind;

TEST(RunArgumentsTest, QueryAndPathWithDefaults) {
    const auto args = ParseRunArguments({"How many words?", "book.txt"});
    EXPECT_EQ(args.query, "How many words?");
    EXPECT_EQ(args.path, "book.txt");
    EXPECT_EQ(args.type, "text document");
    EXPECT_FALSE(args.model.has_value());
    EXPECT_FALSE(args.backend.has_value());
    EXPECT_FALSE(args.quiet);
}

TEST(RunArgumentsTest, OptionsMayAppearAnywhere) {
    const auto args = ParseRunArguments({
        "--model", "root/model", "q", "--max-turns", "4", "data", "--type", "codebase",
        "--truncation-limit", "500", "--max-depth", "0", "--timeout", "30",
        "--backend", "docker", "-q"});
    EXPECT_EQ(args.query, "q");
    EXPECT_EQ(args.path, "data");
    EXPECT_EQ(args.type, "codebase");
    EXPECT_EQ(args.model, std::optional<std::string>("root/model"));
    EXPECT_EQ(args.max_turns, std::optional<int>(4));
    EXPECT_EQ(args.truncation_limit, std::optional<int>(500));
    EXPECT_EQ(args.max_depth, std::optional<int>(0));
    EXPECT_EQ(args.timeout_s, std::optional<int>(30));
    EXPECT_EQ(args.backend, std::optional<BackendKind>(BackendKind::kDocker));
    EXPECT_TRUE(args.quiet);
}

TEST(RunArgumentsTest, RejectsBadInput) {
    EXPECT_THROW(ParseRunArguments({"only-query"}), std::invalid_argument);
    EXPECT_THROW(ParseRunArguments({"q", "p", "extra"}), std::invalid_argument);
    EXPECT_THROW(ParseRunArguments({"q", "p", "--max-turns"}), std::invalid_argument);
    EXPECT_THROW(ParseRunArguments({"q", "p", "--max-turns", "0"}), std::invalid_argument);
    EXPECT_THROW(ParseRunArguments({"q", "p", "--max-turns", "3x"}), std::invalid_argument);
    EXPECT_THROW(ParseRunArguments({"q", "p", "--max-depth", "-1"}), std::invalid_argument);
    EXPECT_THROW(ParseRunArguments({"q", "p", "--backend", "kubernetes"}), std::invalid_argument);
    EXPECT_THROW(ParseRunArguments({"q", "p", "--verbose"}), std::invalid_argument);
}

TEST(RunArgumentsTest, HelpAndBuildOnlyNeedNoPositionals) {
    EXPECT_TRUE(ParseRunArguments({"--help"}).help);
    EXPECT_TRUE(ParseRunArguments({"--build-only"}).build_only);
}

TEST(RunArgumentsTest, FlagsOverrideConfig) {
    rlm::config::Config config{};
    const auto args = ParseRunArguments({
        "q", "p", "--model", "m", "--max-turns", "2", "--timeout", "9", "--quiet",
        "--server-url", "http://sandbox:8080"});
    ApplyRunArguments(args, config);
    EXPECT_EQ(config.agents.defaults.model, "m");
    EXPECT_EQ(config.agents.defaults.max_turns, 2);
    EXPECT_EQ(config.sandbox.exec_timeout_s, 9);
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_EQ(config.sandbox.server_url, "http://sandbox:8080");
    EXPECT_EQ(config.sandbox.backend, BackendKind::kHttp);
}

TEST(RunArgumentsTest, ExplicitBackendWinsOverServerUrl) {
    rlm::config::Config config{};
    ApplyRunArguments(
        ParseRunArguments({"q", "p", "--backend", "local", "--server-url", "http://x"}),
        config);
    EXPECT_EQ(config.sandbox.backend, BackendKind::kLocal);
}

TEST(ServerArgumentsTest, Defaults) {
    const auto args = ParseServerArguments({});
    EXPECT_TRUE(args.context_file.empty());
    EXPECT_TRUE(args.directory.empty());
    EXPECT_EQ(args.depth, 0);
    EXPECT_EQ(args.max_depth, 3);
    EXPECT_EQ(args.model, "xiaomi/mimo-v2-flash:free");
    EXPECT_FALSE(args.http);
    EXPECT_EQ(args.port, 8080);
}

TEST(ServerArgumentsTest, ParsesAllFlags) {
    const auto args = ParseServerArguments({
        "--directory", "/mnt/data", "--depth", "1", "--max-depth", "2",
        "--model", "sub", "--http", "--host", "127.0.0.1", "--port", "9000"});
    EXPECT_EQ(args.directory, "/mnt/data");
    EXPECT_EQ(args.depth, 1);
    EXPECT_EQ(args.max_depth, 2);
    EXPECT_EQ(args.model, "sub");
    EXPECT_TRUE(args.http);
    EXPECT_EQ(args.host, "127.0.0.1");
    EXPECT_EQ(args.port, 9000);
}

TEST(ServerArgumentsTest, RejectsConflictsAndRanges) {
    EXPECT_THROW(ParseServerArguments({"--context", "a", "--directory", "b"}), std::invalid_argument);
    EXPECT_THROW(ParseServerArguments({"--depth", "-1"}), std::invalid_argument);
    EXPECT_THROW(ParseServerArguments({"--port", "70000"}), std::invalid_argument);
    EXPECT_THROW(ParseServerArguments({"stray"}), std::invalid_argument);
}

}  // namespace
