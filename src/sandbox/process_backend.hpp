#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/process.hpp>
#include <sys/types.h>

#include "config/config_schema.hpp"
#include "sandbox/execution_backend.hpp"
#include "sandbox/response_queue.hpp"

namespace rlm::sandbox {

struct ProcessBackendOptions {
    // kLocal runs server_command directly, kDocker wraps it in docker run.
    rlm::config::BackendKind launcher = rlm::config::BackendKind::kLocal;
    std::string server_command = "rlm_repl_server";
    std::string docker_image = "rlm-sandbox";
    std::string container_name = "rlm-sandbox-instance";
    rlm::config::ContextSource context;
    std::string model;
    int depth = 0;
    int max_depth = 3;
    // Exported to the server as OPENROUTER_API_KEY for llm_query.
    std::string api_key;
    std::string log_level;
    std::chrono::seconds ready_timeout{30};
    std::chrono::seconds ping_timeout{5};
    std::chrono::seconds get_var_timeout{10};
    std::chrono::seconds shutdown_grace{5};
};

// Runs rlm_repl_server as a child process and talks to it over its
// stdin/stdout with one JSON document per line.
class ProcessBackend : public ExecutionBackend {
public:
    explicit ProcessBackend(ProcessBackendOptions options);
    ~ProcessBackend() override;

    bool Start() override;
    void Stop() override;
    bool Ping() override;
    ExecutionResult ExecCode(const std::string& code, std::chrono::seconds timeout) override;
    std::optional<nlohmann::json> GetVariable(const std::string& name) override;
    int Reindex() override;
    std::map<std::string, std::string> ListVariables() override;
    bool Reset() override;
    std::string Name() const override;

    SessionState State() const { return state_.load(); }
    std::vector<std::string> BuildCommand() const;

private:
    ProcessBackendOptions options_;
    std::atomic<SessionState> state_{SessionState::kStopped};
    std::unique_ptr<boost::process::child> child_;
    std::unique_ptr<boost::process::opstream> stdin_;
    std::unique_ptr<boost::process::pipe> stdout_;
    std::unique_ptr<boost::process::pipe> stderr_;
    std::thread stdout_reader_;
    std::thread stderr_reader_;
    std::atomic<int> readers_running_{0};
    std::atomic<bool> readers_stop_{false};
    // The server leads its own process group; stray children die with it.
    pid_t process_group_ = 0;
    ResponseQueue queue_;
    std::mutex request_mutex_;
    long long next_id_ = 0;
    bool cleanup_pending_ = false;

    bool WaitForReady();
    // Reply carrying this request's id, or std::nullopt with error set.
    std::optional<nlohmann::json> Request(nlohmann::json request,
                                          std::chrono::seconds timeout,
                                          std::string& error);
    bool WaitForExit(std::chrono::seconds grace);
    void SignalGroup(int signal);
    void StartReaders();
    // Lets the readers drain, then stops them even if a stray process
    // still holds the write ends.
    void JoinReaders();
    void RemoveContainer();
};

}  // namespace rlm::sandbox
