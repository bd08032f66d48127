#include "sandbox/process_backend.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <boost/process/extend.hpp>

#include "sandbox/command_runner.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace rlm::sandbox {
namespace bp = boost::process;

namespace {

constexpr const char* kContainerContextPath = "/mnt/data/input.txt";
constexpr const char* kContainerDataRoot = "/mnt/data";
constexpr const char* kContainerServer = "rlm_repl_server";
constexpr int kReaderPollMs = 100;
constexpr auto kReaderDrain = std::chrono::seconds(1);

boost::filesystem::path ResolveExecutable(const std::string& command) {
    if (command.find('/') != std::string::npos) {
        return boost::filesystem::path(command);
    }
    return bp::search_path(command);
}

std::string AbsolutePath(const std::string& path) {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    return ec ? path : absolute.string();
}

// Calls on_line for every line read from fd until EOF or until stop is set.
template <typename LineHandler>
void ReadLines(int fd, const std::atomic<bool>& stop, LineHandler on_line) {
    std::string pending;
    char buffer[4096];
    while (!stop.load()) {
        pollfd entry{fd, POLLIN, 0};
        const int ready = ::poll(&entry, 1, kReaderPollMs);
        if (ready < 0 && errno != EINTR) {
            break;
        }
        if (ready <= 0) {
            continue;
        }
        const ssize_t count = ::read(fd, buffer, sizeof(buffer));
        if (count < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        if (count <= 0) {
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(count));
        std::size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            on_line(pending.substr(0, newline));
            pending.erase(0, newline + 1);
        }
    }
    if (!pending.empty()) {
        on_line(std::move(pending));
    }
}

}  // namespace

ProcessBackend::ProcessBackend(ProcessBackendOptions options)
    : options_(std::move(options)) {}

ProcessBackend::~ProcessBackend() {
    Stop();
}

std::string ProcessBackend::Name() const {
    return options_.launcher == rlm::config::BackendKind::kDocker ? "docker" : "process";
}

std::vector<std::string> ProcessBackend::BuildCommand() const {
    const bool directory = options_.context.kind == rlm::config::ContextKind::kDirectory;
    std::vector<std::string> command;
    std::string context_flag = directory ? "--directory" : "--context";
    std::string context_path = options_.context.path;

    if (options_.launcher == rlm::config::BackendKind::kDocker) {
        const auto host_path = AbsolutePath(options_.context.path);
        const std::string mount_point = directory ? kContainerDataRoot : kContainerContextPath;
        command = {
            "docker", "run", "-i", "--rm",
            "--name", options_.container_name,
            "-v", host_path + ":" + mount_point + ":ro",
            "-e", "OPENROUTER_API_KEY",
            "-e", "RLM_LOG_LEVEL",
            options_.docker_image,
            kContainerServer
        };
        context_path = mount_point;
    } else {
        command = {options_.server_command};
    }

    if (!context_path.empty()) {
        command.push_back(context_flag);
        command.push_back(context_path);
    }
    command.push_back("--depth");
    command.push_back(std::to_string(options_.depth));
    command.push_back("--max-depth");
    command.push_back(std::to_string(options_.max_depth));
    if (!options_.model.empty()) {
        command.push_back("--model");
        command.push_back(options_.model);
    }
    return command;
}

bool ProcessBackend::Start() {
    if (child_) {
        return state_.load() != SessionState::kStopped;
    }
    // A dead server must surface as a failed write, not kill the caller.
    std::signal(SIGPIPE, SIG_IGN);

    state_ = SessionState::kStarting;
    queue_.Reopen();

    const auto command = BuildCommand();
    const auto executable = ResolveExecutable(command.front());
    if (executable.empty()) {
        rlm::utils::LogError("sandbox", "cannot find executable: " + command.front());
        state_ = SessionState::kStopped;
        return false;
    }
    const std::vector<std::string> args(command.begin() + 1, command.end());
    rlm::utils::LogInfo("sandbox", "starting " + rlm::utils::Join(command, " "));

    bp::environment env = boost::this_process::environment();
    if (!options_.api_key.empty()) {
        env["OPENROUTER_API_KEY"] = options_.api_key;
    }
    if (!options_.log_level.empty()) {
        env["RLM_LOG_LEVEL"] = options_.log_level;
    }

    stdin_ = std::make_unique<bp::opstream>();
    stdout_ = std::make_unique<bp::pipe>();
    stderr_ = std::make_unique<bp::pipe>();
    try {
        child_ = std::make_unique<bp::child>(
            executable,
            bp::args(args),
            bp::std_in < *stdin_,
            bp::std_out > *stdout_,
            bp::std_err > *stderr_,
            env,
            bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); });
    } catch (const bp::process_error& ex) {
        rlm::utils::LogError("sandbox", std::string("spawn failed: ") + ex.what());
        stdin_.reset();
        stdout_.reset();
        stderr_.reset();
        state_ = SessionState::kStopped;
        return false;
    }
    process_group_ = child_->id();
    cleanup_pending_ = options_.launcher == rlm::config::BackendKind::kDocker;
    StartReaders();

    if (!WaitForReady()) {
        Stop();
        return false;
    }
    state_ = SessionState::kReady;
    return true;
}

void ProcessBackend::StartReaders() {
    readers_stop_ = false;
    readers_running_ = 2;
    stdout_reader_ = std::thread([this, fd = stdout_->native_source()] {
        ReadLines(fd, readers_stop_, [this](std::string line) { queue_.Push(std::move(line)); });
        queue_.Close();
        --readers_running_;
    });
    stderr_reader_ = std::thread([this, fd = stderr_->native_source()] {
        ReadLines(fd, readers_stop_, [](const std::string& line) { rlm::utils::LogInfo("sandbox", line); });
        --readers_running_;
    });
}

bool ProcessBackend::WaitForReady() {
    const auto deadline = std::chrono::steady_clock::now() + options_.ready_timeout;
    std::string line;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            rlm::utils::LogError(
                "sandbox",
                "not ready after " + std::to_string(options_.ready_timeout.count()) + "s");
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (!queue_.TryPop(line, remaining)) {
            if (queue_.Closed()) {
                rlm::utils::LogError("sandbox", "server exited before it was ready");
                return false;
            }
            continue;
        }
        const auto message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            rlm::utils::LogDebug("sandbox", "ignoring startup line: " + line);
            continue;
        }
        if (message.contains("status") && message["status"] == "ready") {
            if (message.contains("context_info") && message["context_info"].is_string()) {
                rlm::utils::LogInfo("sandbox", "ready: " + message["context_info"].get<std::string>());
            }
            return true;
        }
    }
}

std::optional<nlohmann::json> ProcessBackend::Request(nlohmann::json request,
                                                      std::chrono::seconds timeout,
                                                      std::string& error) {
    std::lock_guard<std::mutex> lock(request_mutex_);
    if (!child_ || state_.load() != SessionState::kReady) {
        error = "Sandbox is not running";
        return std::nullopt;
    }

    const auto id = ++next_id_;
    request["id"] = id;
    state_ = SessionState::kExecuting;
    *stdin_ << request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    stdin_->flush();
    if (!*stdin_) {
        state_ = SessionState::kReady;
        error = "Failed to write to sandbox";
        return std::nullopt;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string line;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (!queue_.TryPop(line, remaining)) {
            if (queue_.Closed()) {
                state_ = SessionState::kReady;
                error = "Sandbox process exited";
                return std::nullopt;
            }
            continue;
        }
        auto reply = nlohmann::json::parse(line, nullptr, false);
        if (reply.is_discarded() || !reply.is_object()) {
            rlm::utils::LogDebug("sandbox", "ignoring non-JSON line: " + line);
            continue;
        }
        if (reply.contains("id") && reply["id"] != id) {
            rlm::utils::LogDebug("sandbox", "discarding stale reply " + reply["id"].dump());
            continue;
        }
        state_ = SessionState::kReady;
        return reply;
    }

    state_ = SessionState::kReady;
    error = "Execution timed out after " + std::to_string(timeout.count()) + " seconds";
    rlm::utils::LogWarn("sandbox", error);
    return std::nullopt;
}

bool ProcessBackend::Ping() {
    std::string error;
    const auto reply = Request({{"action", "ping"}}, options_.ping_timeout, error);
    return reply && reply->contains("success") && (*reply)["success"] == true;
}

ExecutionResult ProcessBackend::ExecCode(const std::string& code, std::chrono::seconds timeout) {
    std::string error;
    const auto reply = Request({{"action", "execute"}, {"code", code}}, timeout, error);
    if (!reply) {
        return ExecutionResult::Failure(error);
    }
    return ExecutionResultFromJson(*reply);
}

std::optional<nlohmann::json> ProcessBackend::GetVariable(const std::string& name) {
    std::string error;
    const auto reply = Request({{"action", "get_var"}, {"name", name}}, options_.get_var_timeout, error);
    if (!reply || !reply->contains("success") || (*reply)["success"] != true || !reply->contains("value")) {
        return std::nullopt;
    }
    return (*reply)["value"];
}

int ProcessBackend::Reindex() {
    std::string error;
    const auto reply = Request({{"action", "reindex"}}, options_.get_var_timeout, error);
    if (!reply || !reply->contains("files_indexed") || !(*reply)["files_indexed"].is_number_integer()) {
        return 0;
    }
    return (*reply)["files_indexed"].get<int>();
}

std::map<std::string, std::string> ProcessBackend::ListVariables() {
    std::map<std::string, std::string> variables;
    std::string error;
    const auto reply = Request({{"action", "list_vars"}}, options_.get_var_timeout, error);
    if (!reply || !reply->contains("variables") || !(*reply)["variables"].is_object()) {
        return variables;
    }
    for (const auto& [name, type] : (*reply)["variables"].items()) {
        variables[name] = type.is_string() ? type.get<std::string>() : type.dump();
    }
    return variables;
}

bool ProcessBackend::Reset() {
    std::string error;
    const auto reply = Request({{"action", "reset"}}, options_.get_var_timeout, error);
    return reply && reply->contains("success") && (*reply)["success"] == true;
}

bool ProcessBackend::WaitForExit(std::chrono::seconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    std::error_code ec;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!child_->running(ec) || ec) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return !child_->running(ec);
}

void ProcessBackend::Stop() {
    if (!child_) {
        RemoveContainer();
        state_ = SessionState::kStopped;
        return;
    }

    std::lock_guard<std::mutex> lock(request_mutex_);
    std::error_code ec;
    if (child_->running(ec)) {
        const nlohmann::json shutdown{{"action", "shutdown"}, {"id", ++next_id_}};
        *stdin_ << shutdown.dump() << '\n';
        stdin_->flush();
    }
    stdin_->pipe().close();

    if (!WaitForExit(options_.shutdown_grace)) {
        rlm::utils::LogWarn("sandbox", "server ignored shutdown, sending SIGTERM");
        SignalGroup(SIGTERM);
        if (!WaitForExit(options_.shutdown_grace)) {
            rlm::utils::LogWarn("sandbox", "server ignored SIGTERM, killing it");
            SignalGroup(SIGKILL);
            child_->terminate(ec);
        }
    }
    child_->wait(ec);
    // Background processes started by executed code would keep the pipes open.
    SignalGroup(SIGKILL);

    JoinReaders();
    RemoveContainer();
    queue_.Close();

    child_.reset();
    stdin_.reset();
    stdout_.reset();
    stderr_.reset();
    process_group_ = 0;
    state_ = SessionState::kStopped;
    rlm::utils::LogInfo("sandbox", "stopped");
}

void ProcessBackend::SignalGroup(int signal) {
    if (process_group_ <= 0) {
        return;
    }
    if (::kill(-process_group_, signal) != 0 && errno != ESRCH) {
        rlm::utils::LogDebug("sandbox", "kill process group: " + std::string(std::strerror(errno)));
    }
}

void ProcessBackend::JoinReaders() {
    const auto deadline = std::chrono::steady_clock::now() + kReaderDrain;
    while (readers_running_.load() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (readers_running_.load() > 0) {
        rlm::utils::LogWarn("sandbox", "output pipes still open after exit, abandoning them");
    }
    readers_stop_ = true;
    if (stdout_reader_.joinable()) {
        stdout_reader_.join();
    }
    if (stderr_reader_.joinable()) {
        stderr_reader_.join();
    }
}

void ProcessBackend::RemoveContainer() {
    if (!cleanup_pending_) {
        return;
    }
    cleanup_pending_ = false;
    const auto result = CommandRunner::Run(
        {"docker", "rm", "-f", options_.container_name}, "", std::chrono::seconds(10));
    if (result.exit_code != 0) {
        rlm::utils::LogDebug("sandbox", "docker rm -f " + options_.container_name + ": " + result.error);
    }
}

}  // namespace rlm::sandbox
