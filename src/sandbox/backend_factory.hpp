#pragma once

#include <memory>

#include "config/config_schema.hpp"
#include "runtime/python_session.hpp"
#include "sandbox/execution_backend.hpp"

namespace rlm::sandbox {

// Picks the backend named by config.sandbox.backend. The in-process
// backend needs a session; throws utils::ConfigurationError without one.
std::unique_ptr<ExecutionBackend> CreateBackend(const rlm::config::Config& config,
                                                const rlm::config::RunConfig& run,
                                                rlm::runtime::PythonSession* session = nullptr);

}  // namespace rlm::sandbox
