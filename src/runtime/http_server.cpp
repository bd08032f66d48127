#include "runtime/http_server.hpp"

#include <exception>
#include <utility>

#include "nlohmann/json.hpp"
#include "runtime/repl_server.hpp"
#include "utils/logging.hpp"

namespace rlm::runtime {
namespace {

constexpr const char* kJsonType = "application/json";

void Reply(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), kJsonType);
}

// Body as a JSON object, or false after answering 400.
bool ParseBody(const httplib::Request& req, httplib::Response& res, nlohmann::json& body) {
    body = nlohmann::json::parse(req.body.empty() ? std::string("{}") : req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        Reply(res, {{"detail", "Request body must be a JSON object"}}, 400);
        return false;
    }
    return true;
}

std::string StringField(const nlohmann::json& body, const char* key) {
    return body.contains(key) && body[key].is_string() ? body[key].get<std::string>() : std::string();
}

}  // namespace

SandboxHttpServer::SandboxHttpServer(PythonSession& session, std::string api_key)
    : session_(session)
    , api_key_(std::move(api_key)) {
    RegisterRoutes();
}

void SandboxHttpServer::RegisterRoutes() {
    server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (api_key_.empty() || req.get_header_value("X-API-Key") == api_key_) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        rlm::utils::LogWarn("http", "rejected " + req.method + " " + req.path + ": bad API key");
        Reply(res, {{"detail", "Invalid API key"}}, 401);
        return httplib::Server::HandlerResponse::Handled;
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string detail = "internal error";
        try {
            if (ep) {
                std::rethrow_exception(ep);
            }
        } catch (const std::exception& ex) {
            detail = ex.what();
        } catch (...) {
            detail = "unknown exception";
        }
        rlm::utils::LogError("http", req.method + " " + req.path + " failed: " + detail);
        Reply(res, {{"detail", detail}}, 500);
    });

    server_.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(session_mutex_);
        const auto recursion = session_.Recursion();
        Reply(res, {
            {"status", "ready"},
            {"files_indexed", session_.FileCount()},
            {"depth", recursion.current_depth},
            {"max_depth", recursion.max_depth}
        });
    });

    server_.Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!ParseBody(req, res, body)) {
            return;
        }
        const auto code = StringField(body, "code");
        rlm::utils::LogInfo("http", "Executing code (" + std::to_string(code.size()) + " chars)");
        std::lock_guard<std::mutex> lock(session_mutex_);
        Reply(res, rlm::sandbox::ToJson(session_.Execute(code)));
    });

    server_.Get("/files", [this](const httplib::Request& req, httplib::Response& res) {
        const auto pattern = req.has_param("pattern") ? req.get_param_value("pattern") : std::string("*");
        std::lock_guard<std::mutex> lock(session_mutex_);
        Reply(res, {{"files", session_.ListFiles(pattern)}});
    });

    server_.Get(R"(/file/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string path = req.matches[1];
        std::lock_guard<std::mutex> lock(session_mutex_);
        const auto content = session_.ReadFile(path);
        if (!content) {
            Reply(res, {{"detail", "File not found: " + path}}, 404);
            return;
        }
        Reply(res, {{"path", path}, {"content", *content}});
    });

    server_.Post("/reindex", [this](const httplib::Request&, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(session_mutex_);
        Reply(res, {{"files_indexed", session_.Reindex()}});
    });

    server_.Post("/get_var", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!ParseBody(req, res, body)) {
            return;
        }
        const auto name = StringField(body, "name");
        std::lock_guard<std::mutex> lock(session_mutex_);
        auto value = session_.GetVariable(name);
        if (!value) {
            Reply(res, {{"success", false}, {"error", "Variable '" + name + "' not found"}});
            return;
        }
        Reply(res, {{"success", true}, {"value", std::move(*value)}});
    });

    server_.Get("/vars", [this](const httplib::Request&, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(session_mutex_);
        Reply(res, {{"success", true}, {"variables", ListVariablesJson(session_)}});
    });

    server_.Post("/reset", [this](const httplib::Request&, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_.Reset();
        Reply(res, {{"status", "reset"}});
    });
}

bool SandboxHttpServer::Listen(const std::string& host, int port) {
    rlm::utils::LogInfo("http", "listening on " + host + ":" + std::to_string(port));
    return server_.listen(host, port);
}

int SandboxHttpServer::BindToAnyPort(const std::string& host) {
    return server_.bind_to_any_port(host);
}

bool SandboxHttpServer::ListenAfterBind() {
    return server_.listen_after_bind();
}

bool SandboxHttpServer::IsRunning() const {
    return server_.is_running();
}

void SandboxHttpServer::Stop() {
    server_.stop();
}

}  // namespace rlm::runtime
