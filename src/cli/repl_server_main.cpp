#include <atomic>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/stream.hpp>

#include "cli/arguments.hpp"
#include "config/config_loader.hpp"
#include "providers/llm_provider.hpp"
#include "runtime/http_server.hpp"
#include "runtime/python_session.hpp"
#include "runtime/repl_server.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

constexpr const char* kDefaultContextFile = "/mnt/data/input.txt";
constexpr int kSubQueryTimeoutS = 120;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

std::unique_ptr<rlm::providers::LLMProvider> CreateSubQueryProvider(
    const rlm::config::Config& config,
    const std::string& model) {
    if (config.providers.openrouter.api_key.empty() && config.providers.openrouter.api_base.empty()) {
        rlm::utils::LogWarn("server", "OPENROUTER_API_KEY not set, llm_query is disabled");
        return nullptr;
    }
    auto settings = rlm::providers::ResolveProviderSettings(config);
    settings.model = model;
    settings.timeout_s = kSubQueryTimeoutS;
    return rlm::providers::CreateProvider(settings);
}

int ServeStdio(rlm::runtime::PythonSession& session) {
    // Only the protocol may reach the real stdout; anything else the
    // process prints lands on stderr. Programs the executed code starts
    // must not inherit the protocol descriptor.
    const int protocol_fd = ::fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 0);
    if (protocol_fd < 0 || ::dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        rlm::utils::LogError("server", "cannot redirect stdout");
        return 1;
    }
    boost::iostreams::stream<boost::iostreams::file_descriptor_sink> protocol(
        protocol_fd, boost::iostreams::close_handle);

    rlm::runtime::ReplServer server(session, std::cin, protocol);
    return server.Run();
}

int ServeHttp(rlm::runtime::PythonSession& session,
              const rlm::cli::ServerArguments& args,
              const std::string& api_key) {
    rlm::runtime::SandboxHttpServer server(session, api_key);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> done{false};
    std::thread watcher([&server, &done] {
        while (!done.load()) {
            if (g_signal != 0) {
                rlm::utils::LogInfo("server", "signal received, stopping");
                server.Stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    if (api_key.empty()) {
        rlm::utils::LogWarn("server", "no RLM_API_KEY set, the HTTP API is open");
    }
    const bool ok = server.Listen(args.host, args.port);
    done.store(true);
    watcher.join();
    if (!ok && g_signal == 0) {
        rlm::utils::LogError(
            "server",
            "failed to listen on " + args.host + ":" + std::to_string(args.port));
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);
    const std::vector<std::string> raw(argv + 1, argv + argc);

    rlm::cli::ServerArguments args;
    try {
        args = rlm::cli::ParseServerArguments(raw);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << "\n" << rlm::cli::ServerUsage();
        return 1;
    }
    if (args.help) {
        std::cerr << rlm::cli::ServerUsage();
        return 0;
    }

    const auto config = rlm::config::LoadConfig();
    rlm::utils::SetLogConfig(rlm::utils::LogConfig{
        rlm::utils::ParseLogLevel(config.logging.level, rlm::utils::LogLevel::kInfo)});

    rlm::runtime::SessionOptions options{};
    if (!args.directory.empty()) {
        options.data_root = args.directory;
    } else if (!args.context_file.empty()) {
        options.context_file = args.context_file;
    } else {
        const auto from_env = rlm::utils::GetEnv("RLM_CONTEXT_FILE");
        options.context_file = from_env.empty() ? kDefaultContextFile : from_env;
    }
    options.recursion = {args.depth, args.max_depth};
    options.sub_query_model = args.model;

    try {
        auto provider = CreateSubQueryProvider(config, args.model);
        rlm::runtime::PythonSession session(options, provider.get());
        rlm::utils::LogInfo(
            "server",
            "depth " + std::to_string(args.depth) + "/" + std::to_string(args.max_depth) + ", " +
                session.ContextInfo());
        if (args.http) {
            return ServeHttp(session, args, config.sandbox.api_key);
        }
        return ServeStdio(session);
    } catch (const std::exception& ex) {
        rlm::utils::LogError("server", ex.what());
        return 1;
    }
}
