#pragma once

#include <mutex>
#include <string>

#include "httplib.h"
#include "runtime/python_session.hpp"

namespace rlm::runtime {

// HTTP front end of one PythonSession. Requests are served one at a time;
// when api_key is set every request must carry it in X-API-Key.
class SandboxHttpServer {
public:
    SandboxHttpServer(PythonSession& session, std::string api_key);

    bool Listen(const std::string& host, int port);
    // Returns the chosen port, or -1.
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();
    bool IsRunning() const;
    void Stop();

private:
    PythonSession& session_;
    std::string api_key_;
    httplib::Server server_;
    std::mutex session_mutex_;

    void RegisterRoutes();
};

}  // namespace rlm::runtime
