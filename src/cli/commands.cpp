#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "agent/agent_loop.hpp"
#include "cli/arguments.hpp"
#include "config/config_loader.hpp"
#include "providers/llm_provider.hpp"
#include "runtime/python_session.hpp"
#include "sandbox/backend_factory.hpp"
#include "sandbox/command_runner.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

#ifndef RLM_SOURCE_DIR
#define RLM_SOURCE_DIR "."
#endif

namespace {

volatile std::sig_atomic_t g_signal = 0;
std::atomic<bool> g_finished{false};

void HandleSignal(int signal) {
    g_signal = signal;
}

std::filesystem::path GetDockerContext() {
    const auto overridden = rlm::utils::GetEnv("RLM_DOCKER_CONTEXT");
    return std::filesystem::path(overridden.empty() ? RLM_SOURCE_DIR : overridden);
}

bool ImageExists(const std::string& image) {
    const auto result = rlm::sandbox::CommandRunner::Run(
        {"docker", "images", "-q", image}, "", std::chrono::seconds(30));
    return result.exit_code == 0 && !rlm::utils::Trim(result.output).empty();
}

bool BuildImage(const std::string& image) {
    const auto context = GetDockerContext();
    std::cout << "Building Docker image " << image << " from " << context.string() << "..." << std::endl;
    const auto result = rlm::sandbox::CommandRunner::Run(
        {"docker", "build", "-t", image, context.string()}, "", std::chrono::seconds(1800));
    if (result.exit_code != 0) {
        std::cerr << "Failed to build Docker image" << std::endl;
        if (!result.error.empty()) {
            std::cerr << result.error << std::endl;
        }
        return false;
    }
    std::cout << "Docker image built successfully!" << std::endl;
    return true;
}

// Prefers an rlm_repl_server installed beside this binary.
void ResolveServerCommand(const char* argv0, rlm::config::Config& config) {
    auto& command = config.sandbox.server_command;
    if (!argv0 || command.find('/') != std::string::npos) {
        return;
    }
    std::error_code ec;
    const auto sibling = std::filesystem::path(argv0).parent_path() / command;
    if (std::filesystem::is_regular_file(sibling, ec)) {
        command = std::filesystem::absolute(sibling, ec).string();
    }
}

// Ctrl+C stops the run at once; a docker sandbox would outlive us, so
// remove it first.
std::thread StartSignalWatcher(const rlm::config::Config& config) {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    const bool docker = config.sandbox.backend == rlm::config::BackendKind::kDocker;
    const auto container = config.sandbox.container_name;
    return std::thread([docker, container] {
        while (!g_finished.load()) {
            if (g_signal != 0) {
                std::cerr << "\nInterrupted by user" << std::endl;
                if (docker) {
                    rlm::sandbox::CommandRunner::Run(
                        {"docker", "rm", "-f", container}, "", std::chrono::seconds(10));
                }
                std::_Exit(130);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });
}

void PrintAnswer(const std::string& answer, int turns, bool quiet) {
    const std::string rule(60, '=');
    std::cout << "\n" << rule << "\n"
              << "FINAL ANSWER:\n"
              << rule << "\n"
              << answer << "\n"
              << rule << std::endl;
    if (!quiet) {
        std::cout << "\nCompleted in " << turns << " turns" << std::endl;
    }
}

int RunQuery(const rlm::cli::RunArguments& args, rlm::config::Config& config, const char* argv0) {
    std::error_code ec;
    rlm::config::ContextSource source{};
    source.path = args.path;
    source.description = args.type;
    if (std::filesystem::is_directory(args.path, ec)) {
        source.kind = rlm::config::ContextKind::kDirectory;
    } else if (std::filesystem::is_regular_file(args.path, ec)) {
        source.kind = rlm::config::ContextKind::kFile;
    } else if (std::filesystem::exists(args.path, ec)) {
        std::cerr << "Error: Not a file: " << args.path << std::endl;
        return 1;
    } else {
        std::cerr << "Error: File not found: " << args.path << std::endl;
        return 1;
    }

    rlm::config::ValidateConfig(config);
    ResolveServerCommand(argv0, config);

    if (config.sandbox.backend == rlm::config::BackendKind::kDocker &&
        !ImageExists(config.sandbox.docker_image)) {
        rlm::utils::LogInfo("cli", "building Docker image (first run)");
        if (!BuildImage(config.sandbox.docker_image)) {
            return 1;
        }
    }

    const auto run = rlm::config::MakeRunConfig(config, args.query, source);
    auto provider = rlm::providers::CreateProvider(config);

    std::unique_ptr<rlm::runtime::PythonSession> session;
    if (config.sandbox.backend == rlm::config::BackendKind::kInProcess) {
        rlm::runtime::SessionOptions options{};
        if (source.kind == rlm::config::ContextKind::kDirectory) {
            options.data_root = source.path;
        } else {
            options.context_file = source.path;
        }
        options.recursion = {0, run.max_recursion_depth};
        options.sub_query_model = config.agents.defaults.sub_query_model.empty()
            ? run.model
            : config.agents.defaults.sub_query_model;
        session = std::make_unique<rlm::runtime::PythonSession>(options, provider.get());
    }
    auto backend = rlm::sandbox::CreateBackend(config, run, session.get());

    auto watcher = StartSignalWatcher(config);
    std::string answer;
    int turns = 0;
    try {
        rlm::agent::AgentLoop agent(*provider, *backend, run);
        answer = agent.Run();
        turns = agent.TurnCount();
    } catch (...) {
        g_finished.store(true);
        watcher.join();
        throw;
    }
    g_finished.store(true);
    watcher.join();

    PrintAnswer(answer, turns, args.quiet);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);
    const std::vector<std::string> raw(argv + 1, argv + argc);

    rlm::cli::RunArguments args;
    try {
        args = rlm::cli::ParseRunArguments(raw);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n" << rlm::cli::RunUsage();
        return 1;
    }
    if (args.help) {
        std::cout << rlm::cli::RunUsage();
        return 0;
    }

    auto config = rlm::config::LoadConfig();
    rlm::cli::ApplyRunArguments(args, config);
    rlm::utils::SetLogConfig(rlm::utils::LogConfig{
        rlm::utils::ParseLogLevel(config.logging.level, rlm::utils::LogLevel::kInfo)});

    if (args.build_only) {
        return BuildImage(config.sandbox.docker_image) ? 0 : 1;
    }

    try {
        return RunQuery(args, config, argc > 0 ? argv[0] : nullptr);
    } catch (const rlm::utils::ConfigurationError& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        std::cerr << "Set it in your environment or in " << rlm::config::GetConfigPath().string() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
