#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/execution_result.hpp"

namespace rlm::sandbox {

enum class SessionState {
    kStopped,
    kStarting,
    kReady,
    kExecuting
};

inline const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::kStopped: return "stopped";
        case SessionState::kStarting: return "starting";
        case SessionState::kReady: return "ready";
        case SessionState::kExecuting: return "executing";
    }
    return "unknown";
}

// Capability set shared by every place that can run code against a
// persistent namespace. Failures are reported as data: a failed
// ExecutionResult, false, std::nullopt or 0.
class ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;

    virtual bool Start() = 0;
    // Safe to call repeatedly and on a backend that never started.
    virtual void Stop() = 0;
    virtual bool Ping() = 0;
    virtual ExecutionResult ExecCode(const std::string& code, std::chrono::seconds timeout) = 0;
    virtual std::optional<nlohmann::json> GetVariable(const std::string& name) = 0;
    virtual int Reindex() = 0;

    // name -> type name, without internal and helper bindings.
    virtual std::map<std::string, std::string> ListVariables() = 0;
    virtual bool Reset() = 0;

    virtual std::string Name() const = 0;
};

// Stops the backend when the owning scope exits, whatever the exit path.
class SessionGuard {
public:
    explicit SessionGuard(ExecutionBackend& backend)
        : backend_(backend) {}
    ~SessionGuard() {
        backend_.Stop();
    }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

private:
    ExecutionBackend& backend_;
};

}  // namespace rlm::sandbox
