#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "runtime/python_session.hpp"
#include "sandbox/backend_factory.hpp"
#include "sandbox/process_backend.hpp"
#include "utils/errors.hpp"

namespace {

using rlm::config::BackendKind;
using rlm::sandbox::CreateBackend;

rlm::config::RunConfig MakeRun() {
    rlm::config::RunConfig run{};
    run.query = "q";
    run.context.path = "/tmp/input.txt";
    run.model = "root/model";
    run.max_recursion_depth = 2;
    return run;
}

TEST(BackendFactoryTest, SelectsBackendByKind) {
    rlm::config::Config config{};
    const auto run = MakeRun();

    config.sandbox.backend = BackendKind::kLocal;
    EXPECT_EQ(CreateBackend(config, run)->Name(), "process");

    config.sandbox.backend = BackendKind::kDocker;
    EXPECT_EQ(CreateBackend(config, run)->Name(), "docker");

    config.sandbox.backend = BackendKind::kHttp;
    EXPECT_EQ(CreateBackend(config, run)->Name(), "http");
}

TEST(BackendFactoryTest, ProcessBackendGetsRunSettings) {
    rlm::config::Config config{};
    config.sandbox.server_command = "/opt/rlm/rlm_repl_server";
    config.agents.defaults.sub_query_model = "sub/model";
    const auto backend = CreateBackend(config, MakeRun());

    const auto* process = dynamic_cast<rlm::sandbox::ProcessBackend*>(backend.get());
    ASSERT_NE(process, nullptr);
    const std::vector<std::string> expected{
        "/opt/rlm/rlm_repl_server", "--context", "/tmp/input.txt",
        "--depth", "0", "--max-depth", "2", "--model", "sub/model"};
    EXPECT_EQ(process->BuildCommand(), expected);
}

TEST(BackendFactoryTest, InProcessNeedsSession) {
    rlm::config::Config config{};
    config.sandbox.backend = BackendKind::kInProcess;
    EXPECT_THROW(CreateBackend(config, MakeRun()), rlm::utils::ConfigurationError);

    rlm::runtime::SessionOptions options{};
    options.context_text = "x";
    rlm::runtime::PythonSession session(options, nullptr);
    EXPECT_EQ(CreateBackend(config, MakeRun(), &session)->Name(), "inprocess");
}

}  // namespace
