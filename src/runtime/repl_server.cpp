#include "runtime/repl_server.hpp"

#include <exception>
#include <istream>
#include <ostream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace rlm::runtime {

nlohmann::json ListVariablesJson(PythonSession& session) {
    nlohmann::json variables = nlohmann::json::object();
    for (const auto& [name, type] : session.ListVariables()) {
        variables[name] = type;
    }
    return variables;
}

ReplServer::ReplServer(PythonSession& session, std::istream& input, std::ostream& output)
    : session_(session)
    , input_(input)
    , output_(output) {}

nlohmann::json ReplServer::ReadyMessage() const {
    const auto recursion = session_.Recursion();
    return {
        {"status", "ready"},
        {"message", "RLM Sandbox initialized"},
        {"context_info", session_.ContextInfo()},
        {"depth", recursion.current_depth},
        {"max_depth", recursion.max_depth}
    };
}

int ReplServer::Run() {
    Send(ReadyMessage());
    std::string line;
    while (std::getline(input_, line)) {
        line = rlm::utils::Trim(line);
        if (line.empty()) {
            continue;
        }
        bool shutdown = false;
        Send(Handle(line, shutdown));
        if (shutdown) {
            rlm::utils::LogInfo("server", "shutdown requested");
            return 0;
        }
    }
    rlm::utils::LogInfo("server", "input closed");
    return 0;
}

nlohmann::json ReplServer::Handle(const std::string& line, bool& shutdown) {
    shutdown = false;
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& ex) {
        return {{"success", false}, {"error", std::string("Invalid JSON: ") + ex.what()}};
    }
    if (!request.is_object()) {
        return {{"success", false}, {"error", "Invalid JSON: expected an object"}};
    }

    auto reply = Dispatch(request, shutdown);
    if (request.contains("id")) {
        reply["id"] = request["id"];
    }
    return reply;
}

nlohmann::json ReplServer::Dispatch(const nlohmann::json& request, bool& shutdown) {
    const auto action = request.contains("action") && request["action"].is_string()
        ? request["action"].get<std::string>()
        : std::string("execute");
    const auto text_field = [&request](const char* key) {
        return request.contains(key) && request[key].is_string()
            ? request[key].get<std::string>()
            : std::string();
    };

    if (action == "execute") {
        const auto code = text_field("code");
        rlm::utils::LogInfo("server", "Executing code (" + std::to_string(code.size()) + " chars)");
        return rlm::sandbox::ToJson(session_.Execute(code));
    }
    if (action == "get_var") {
        const auto name = text_field("name");
        auto value = session_.GetVariable(name);
        if (!value) {
            return {{"success", false}, {"error", "Variable '" + name + "' not found"}};
        }
        return {{"success", true}, {"value", std::move(*value)}};
    }
    if (action == "list_vars") {
        return {{"success", true}, {"variables", ListVariablesJson(session_)}};
    }
    if (action == "ping") {
        return {{"success", true}, {"message", "pong"}};
    }
    if (action == "reset") {
        try {
            session_.Reset();
        } catch (const std::exception& ex) {
            return {{"success", false}, {"error", ex.what()}};
        }
        return {{"success", true}, {"message", "Namespace reset"}};
    }
    if (action == "reindex") {
        return {{"success", true}, {"files_indexed", session_.Reindex()}};
    }
    if (action == "shutdown") {
        shutdown = true;
        return {{"success", true}, {"message", "Shutting down"}};
    }
    return {{"success", false}, {"error", "Unknown action: " + action}};
}

void ReplServer::Send(const nlohmann::json& reply) {
    output_ << reply.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    output_.flush();
}

}  // namespace rlm::runtime
