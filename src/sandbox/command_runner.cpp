#include "sandbox/command_runner.hpp"

#include <boost/process.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include <signal.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace rlm::sandbox {
namespace bp = boost::process;

namespace {

bool WaitForExit(bp::child& child, std::chrono::steady_clock::time_point deadline) {
    std::error_code ec;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!child.running(ec)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return !child.running(ec);
}

}  // namespace

CommandResult CommandRunner::Run(const std::vector<std::string>& argv,
                                 const std::string& working_dir,
                                 std::chrono::seconds timeout) {
    CommandResult result{};
    if (argv.empty()) {
        result.error = "Error: empty command";
        return result;
    }

    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    const auto stdout_path = std::filesystem::temp_directory_path() / ("rlm_stdout_" + stamp + ".log");
    const auto stderr_path = std::filesystem::temp_directory_path() / ("rlm_stderr_" + stamp + ".log");

    const auto executable = bp::search_path(argv.front());
    if (executable.empty()) {
        result.error = "Error: command not found: " + argv.front();
        return result;
    }
    const std::vector<std::string> args(argv.begin() + 1, argv.end());
    rlm::utils::LogDebug("cmd", rlm::utils::Join(argv, " "));

    try {
        bp::child child_process(
            executable,
            bp::args(args),
            bp::start_dir = working_dir.empty() ? std::string(".") : working_dir,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            bp::std_in < bp::null);

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        if (!WaitForExit(child_process, deadline)) {
            result.timed_out = true;
            ::kill(child_process.id(), SIGTERM);
            if (!WaitForExit(child_process, std::chrono::steady_clock::now() + std::chrono::seconds(2))) {
                std::error_code ec;
                child_process.terminate(ec);
            }
        }
        result.exit_code = result.timed_out ? 124 : child_process.exit_code();
    } catch (const bp::process_error& ex) {
        result.exit_code = -1;
        result.error = std::string("Error: exec failed: ") + ex.what();
    }

    auto read_file = [](const std::filesystem::path& path) {
        std::ostringstream target;
        std::ifstream input(path);
        if (input.is_open()) {
            target << input.rdbuf();
        }
        return target.str();
    };
    result.output = read_file(stdout_path);
    if (result.error.empty()) {
        result.error = read_file(stderr_path);
    }

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace rlm::sandbox
