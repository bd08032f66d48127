#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace rlm::sandbox {

struct CommandResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
};

// Runs a short-lived helper command (docker housekeeping) to completion,
// escalating SIGTERM then SIGKILL once the timeout passes.
class CommandRunner {
public:
    static CommandResult Run(const std::vector<std::string>& argv,
                             const std::string& working_dir,
                             std::chrono::seconds timeout);
};

}  // namespace rlm::sandbox
