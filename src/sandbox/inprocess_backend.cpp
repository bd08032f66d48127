#include "sandbox/inprocess_backend.hpp"

#include <exception>

#include "utils/logging.hpp"

namespace rlm::sandbox {

InProcessBackend::InProcessBackend(rlm::runtime::PythonSession& session)
    : session_(session) {}

bool InProcessBackend::Start() {
    rlm::utils::LogWarn("sandbox", "in-process backend: executed code shares this process");
    return true;
}

void InProcessBackend::Stop() {}

bool InProcessBackend::Ping() {
    return true;
}

ExecutionResult InProcessBackend::ExecCode(const std::string& code, std::chrono::seconds) {
    return session_.Execute(code);
}

std::optional<nlohmann::json> InProcessBackend::GetVariable(const std::string& name) {
    return session_.GetVariable(name);
}

int InProcessBackend::Reindex() {
    return session_.FileCount();
}

std::map<std::string, std::string> InProcessBackend::ListVariables() {
    return session_.ListVariables();
}

bool InProcessBackend::Reset() {
    try {
        session_.Reset();
        return true;
    } catch (const std::exception& ex) {
        rlm::utils::LogError("sandbox", ex.what());
        return false;
    }
}

}  // namespace rlm::sandbox
