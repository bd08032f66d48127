#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "providers/llm_provider.hpp"
#include "runtime/query_gate.hpp"
#include "sandbox/execution_result.hpp"

namespace rlm::runtime {

struct SessionOptions {
    // File mode: context_text wins over context_file when both are set.
    std::string context_file;
    std::string context_text;
    // Directory mode when non-empty.
    std::string data_root;
    RecursionContext recursion;
    std::string sub_query_model = "xiaomi/mimo-v2-flash:free";
};

// One persistent Python namespace backed by the process-wide embedded
// interpreter. Helpers injected into the namespace: context, file_index,
// list_files, read_file and llm_query.
class PythonSession {
public:
    static constexpr std::size_t kMaxOutputChars = 50000;

    // provider may be null; llm_query then answers with an error string.
    PythonSession(SessionOptions options, rlm::providers::LLMProvider* provider);
    ~PythonSession();

    PythonSession(const PythonSession&) = delete;
    PythonSession& operator=(const PythonSession&) = delete;

    rlm::sandbox::ExecutionResult Execute(const std::string& code);
    // JSON value of the binding, its repr() as a string when it does not
    // serialize, std::nullopt when unbound.
    std::optional<nlohmann::json> GetVariable(const std::string& name);
    std::map<std::string, std::string> ListVariables();
    void Reset();
    int Reindex();

    bool DirectoryMode() const;
    int FileCount() const;
    std::vector<std::string> ListFiles(const std::string& pattern) const;
    std::optional<std::string> ReadFile(const std::string& path) const;
    const std::string& ContextInfo() const;
    RecursionContext Recursion() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace rlm::runtime
