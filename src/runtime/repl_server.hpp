#pragma once

#include <iosfwd>
#include <string>

#include "nlohmann/json.hpp"
#include "runtime/python_session.hpp"

namespace rlm::runtime {

// Serves one PythonSession over newline-delimited JSON: a ready line on
// start, then one reply per request line until shutdown or end of input.
class ReplServer {
public:
    ReplServer(PythonSession& session, std::istream& input, std::ostream& output);

    int Run();
    nlohmann::json ReadyMessage() const;
    // Sets shutdown when the request asks the server to exit.
    nlohmann::json Handle(const std::string& line, bool& shutdown);

private:
    PythonSession& session_;
    std::istream& input_;
    std::ostream& output_;

    void Send(const nlohmann::json& reply);
    nlohmann::json Dispatch(const nlohmann::json& request, bool& shutdown);
};

// Shared by the stdio and HTTP front ends.
nlohmann::json ListVariablesJson(PythonSession& session);

}  // namespace rlm::runtime
