#include "sandbox/backend_factory.hpp"

#include <utility>

#include "sandbox/http_backend.hpp"
#include "sandbox/inprocess_backend.hpp"
#include "sandbox/process_backend.hpp"
#include "utils/errors.hpp"

namespace rlm::sandbox {

std::unique_ptr<ExecutionBackend> CreateBackend(const rlm::config::Config& config,
                                                const rlm::config::RunConfig& run,
                                                rlm::runtime::PythonSession* session) {
    const auto& sandbox = config.sandbox;
    switch (sandbox.backend) {
        case rlm::config::BackendKind::kLocal:
        case rlm::config::BackendKind::kDocker: {
            ProcessBackendOptions options{};
            options.launcher = sandbox.backend;
            options.server_command = sandbox.server_command;
            options.docker_image = sandbox.docker_image;
            options.container_name = sandbox.container_name;
            options.context = run.context;
            options.model = config.agents.defaults.sub_query_model.empty()
                ? run.model
                : config.agents.defaults.sub_query_model;
            options.depth = 0;
            options.max_depth = run.max_recursion_depth;
            options.api_key = config.providers.openrouter.api_key;
            options.log_level = config.logging.level;
            options.ready_timeout = std::chrono::seconds(sandbox.ready_timeout_s);
            options.ping_timeout = std::chrono::seconds(sandbox.ping_timeout_s);
            options.get_var_timeout = std::chrono::seconds(sandbox.get_var_timeout_s);
            return std::make_unique<ProcessBackend>(std::move(options));
        }
        case rlm::config::BackendKind::kHttp: {
            HttpBackendOptions options{};
            options.server_url = sandbox.server_url;
            options.api_key = sandbox.api_key;
            options.ready_timeout = std::chrono::seconds(sandbox.ready_timeout_s);
            options.request_timeout = std::chrono::seconds(run.per_exec_timeout_s);
            options.ping_timeout = std::chrono::seconds(sandbox.ping_timeout_s);
            return std::make_unique<HttpBackend>(std::move(options));
        }
        case rlm::config::BackendKind::kInProcess:
            if (!session) {
                throw rlm::utils::ConfigurationError("the inprocess backend needs a python session");
            }
            return std::make_unique<InProcessBackend>(*session);
    }
    throw rlm::utils::ConfigurationError("unknown sandbox backend");
}

}  // namespace rlm::sandbox
