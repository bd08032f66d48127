#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "httplib.h"
#include "sandbox/execution_backend.hpp"

namespace rlm::sandbox {

struct HttpBackendOptions {
    std::string server_url = "http://localhost:8080";
    std::string api_key;
    std::chrono::seconds ready_timeout{30};
    std::chrono::seconds request_timeout{120};
    std::chrono::seconds ping_timeout{5};
    std::chrono::milliseconds poll_interval{1000};
};

// Talks to a long-running `rlm_repl_server --http`. The remote session
// outlives this backend, so Stop() leaves it running.
class HttpBackend : public ExecutionBackend {
public:
    explicit HttpBackend(HttpBackendOptions options);

    bool Start() override;
    void Stop() override;
    bool Ping() override;
    ExecutionResult ExecCode(const std::string& code, std::chrono::seconds timeout) override;
    std::optional<nlohmann::json> GetVariable(const std::string& name) override;
    int Reindex() override;
    std::map<std::string, std::string> ListVariables() override;
    bool Reset() override;
    std::string Name() const override { return "http"; }

    std::vector<std::string> ListFiles(const std::string& pattern = "*");
    std::optional<std::string> ReadFile(const std::string& path);
    std::optional<nlohmann::json> Status();

private:
    HttpBackendOptions options_;

    // Throws utils::TransportError on connection failures, non-2xx answers
    // and non-JSON bodies. A 404 passes when the caller asks for the status.
    nlohmann::json Call(const std::string& method,
                        const std::string& path,
                        const nlohmann::json& body,
                        std::chrono::seconds timeout,
                        int* status = nullptr,
                        const httplib::Params& params = {});
};

}  // namespace rlm::sandbox
