#include "cli/arguments.hpp"

#include <stdexcept>

namespace rlm::cli {
namespace {

// Cursor over argv that hands out flag values.
class ArgCursor {
public:
    explicit ArgCursor(const std::vector<std::string>& args)
        : args_(args) {}

    bool Done() const { return index_ >= args_.size(); }
    const std::string& Next() { return args_[index_++]; }

    std::string Value(const std::string& flag) {
        if (Done()) {
            throw std::invalid_argument("missing value for " + flag);
        }
        return Next();
    }

    int IntValue(const std::string& flag) {
        const auto text = Value(flag);
        int value = 0;
        std::size_t used = 0;
        try {
            value = std::stoi(text, &used);
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid integer for " + flag + ": " + text);
        }
        if (used != text.size()) {
            throw std::invalid_argument("invalid integer for " + flag + ": " + text);
        }
        return value;
    }

private:
    const std::vector<std::string>& args_;
    std::size_t index_ = 0;
};

int PositiveValue(ArgCursor& cursor, const std::string& flag) {
    const int value = cursor.IntValue(flag);
    if (value < 1) {
        throw std::invalid_argument(flag + " must be positive");
    }
    return value;
}

}  // namespace

std::string RunUsage() {
    return
        "Usage: rlm \"<query>\" <file-or-directory> [options]\n"
        "\n"
        "Options:\n"
        "  --type T               what the context is (default: \"text document\")\n"
        "  --model M              root model\n"
        "  --max-turns N          turn budget (default 15)\n"
        "  --truncation-limit N   characters of execution output fed back (default 2000)\n"
        "  --max-depth N          nested llm_query depth (default 3)\n"
        "  --timeout S            per-execution timeout in seconds (default 120)\n"
        "  --backend B            local | docker | http | inprocess\n"
        "  --server-url URL       remote sandbox for --backend http\n"
        "  --quiet                only print warnings and the answer\n"
        "  --build-only           build the sandbox docker image and exit\n";
}

std::string ServerUsage() {
    return
        "Usage: rlm_repl_server [--context FILE | --directory DIR] [--depth N] [--max-depth N]\n"
        "                       [--model M] [--http [--host H] [--port P]]\n";
}

RunArguments ParseRunArguments(const std::vector<std::string>& args) {
    RunArguments parsed{};
    std::vector<std::string> positional;
    ArgCursor cursor(args);
    while (!cursor.Done()) {
        const auto arg = cursor.Next();
        if (arg == "-h" || arg == "--help") {
            parsed.help = true;
        } else if (arg == "--type") {
            parsed.type = cursor.Value(arg);
        } else if (arg == "--model") {
            parsed.model = cursor.Value(arg);
        } else if (arg == "--max-turns") {
            parsed.max_turns = PositiveValue(cursor, arg);
        } else if (arg == "--truncation-limit") {
            parsed.truncation_limit = PositiveValue(cursor, arg);
        } else if (arg == "--max-depth") {
            const int depth = cursor.IntValue(arg);
            if (depth < 0) {
                throw std::invalid_argument("--max-depth cannot be negative");
            }
            parsed.max_depth = depth;
        } else if (arg == "--timeout") {
            parsed.timeout_s = PositiveValue(cursor, arg);
        } else if (arg == "--backend") {
            const auto value = cursor.Value(arg);
            rlm::config::BackendKind kind{};
            if (!rlm::config::ParseBackendKind(value, kind)) {
                throw std::invalid_argument("unknown backend: " + value);
            }
            parsed.backend = kind;
        } else if (arg == "--server-url") {
            parsed.server_url = cursor.Value(arg);
        } else if (arg == "--quiet" || arg == "-q") {
            parsed.quiet = true;
        } else if (arg == "--build-only") {
            parsed.build_only = true;
        } else if (arg.size() > 1 && arg.front() == '-') {
            throw std::invalid_argument("unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (parsed.help || parsed.build_only) {
        return parsed;
    }
    if (positional.size() != 2) {
        throw std::invalid_argument("expected a query and a file or directory");
    }
    parsed.query = positional[0];
    parsed.path = positional[1];
    return parsed;
}

ServerArguments ParseServerArguments(const std::vector<std::string>& args) {
    ServerArguments parsed{};
    ArgCursor cursor(args);
    while (!cursor.Done()) {
        const auto arg = cursor.Next();
        if (arg == "-h" || arg == "--help") {
            parsed.help = true;
        } else if (arg == "--context") {
            parsed.context_file = cursor.Value(arg);
        } else if (arg == "--directory") {
            parsed.directory = cursor.Value(arg);
        } else if (arg == "--depth") {
            parsed.depth = cursor.IntValue(arg);
        } else if (arg == "--max-depth") {
            parsed.max_depth = cursor.IntValue(arg);
        } else if (arg == "--model") {
            parsed.model = cursor.Value(arg);
        } else if (arg == "--http") {
            parsed.http = true;
        } else if (arg == "--host") {
            parsed.host = cursor.Value(arg);
        } else if (arg == "--port") {
            parsed.port = cursor.IntValue(arg);
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
    if (!parsed.context_file.empty() && !parsed.directory.empty()) {
        throw std::invalid_argument("--context and --directory are mutually exclusive");
    }
    if (parsed.depth < 0 || parsed.max_depth < 0) {
        throw std::invalid_argument("depths cannot be negative");
    }
    if (parsed.port < 0 || parsed.port > 65535) {
        throw std::invalid_argument("invalid port: " + std::to_string(parsed.port));
    }
    return parsed;
}

void ApplyRunArguments(const RunArguments& args, rlm::config::Config& config) {
    if (args.model) {
        config.agents.defaults.model = *args.model;
    }
    if (args.max_turns) {
        config.agents.defaults.max_turns = *args.max_turns;
    }
    if (args.truncation_limit) {
        config.agents.defaults.truncation_limit = *args.truncation_limit;
    }
    if (args.max_depth) {
        config.sandbox.max_recursion_depth = *args.max_depth;
    }
    if (args.timeout_s) {
        config.sandbox.exec_timeout_s = *args.timeout_s;
    }
    if (args.backend) {
        config.sandbox.backend = *args.backend;
    }
    if (args.server_url) {
        config.sandbox.server_url = *args.server_url;
        if (!args.backend) {
            config.sandbox.backend = rlm::config::BackendKind::kHttp;
        }
    }
    if (args.quiet) {
        config.logging.level = "warn";
    }
}

}  // namespace rlm::cli
