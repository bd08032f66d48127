#pragma once

#include "runtime/python_session.hpp"
#include "sandbox/execution_backend.hpp"

namespace rlm::sandbox {

// Runs code in the caller's own PythonSession. No isolation and no
// timeout enforcement; meant for debugging.
class InProcessBackend : public ExecutionBackend {
public:
    explicit InProcessBackend(rlm::runtime::PythonSession& session);

    bool Start() override;
    void Stop() override;
    bool Ping() override;
    ExecutionResult ExecCode(const std::string& code, std::chrono::seconds timeout) override;
    std::optional<nlohmann::json> GetVariable(const std::string& name) override;
    int Reindex() override;
    std::map<std::string, std::string> ListVariables() override;
    bool Reset() override;
    std::string Name() const override { return "inprocess"; }

private:
    rlm::runtime::PythonSession& session_;
};

}  // namespace rlm::sandbox
