#include <boost/python.hpp>

#include "runtime/python_session.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "utils/logging.hpp"

namespace bp = boost::python;

namespace {

class GilLock {
public:
    GilLock()
        : state_(PyGILState_Ensure()) {}
    ~GilLock() {
        PyGILState_Release(state_);
    }

    GilLock(const GilLock&) = delete;
    GilLock& operator=(const GilLock&) = delete;

private:
    PyGILState_STATE state_;
};

class GilRelease {
public:
    GilRelease()
        : state_(PyEval_SaveThread()) {}
    ~GilRelease() {
        PyEval_RestoreThread(state_);
    }

    GilRelease(const GilRelease&) = delete;
    GilRelease& operator=(const GilRelease&) = delete;

private:
    PyThreadState* state_;
};

bp::object Utf8Object(const std::string& text) {
    return bp::object(bp::handle<>(
        PyUnicode_DecodeUTF8(text.data(), static_cast<Py_ssize_t>(text.size()), "replace")));
}

std::string ToUtf8(const bp::object& value) {
    bp::object encoded = bp::str(value).attr("encode")("utf-8", "replace");
    char* data = nullptr;
    Py_ssize_t size = 0;
    if (PyBytes_AsStringAndSize(encoded.ptr(), &data, &size) != 0) {
        bp::throw_error_already_set();
    }
    return std::string(data, static_cast<std::size_t>(size));
}

// Consumes the pending Python exception and renders it like the
// interpreter's own traceback printout.
std::string FetchTraceback() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) {
        return "Unknown error";
    }
    PyErr_NormalizeException(&type, &value, &traceback);
    bp::object exc_type{bp::handle<>(type)};
    bp::object exc_value = value ? bp::object(bp::handle<>(value)) : bp::object();
    bp::object exc_tb = traceback ? bp::object(bp::handle<>(traceback)) : bp::object();
    try {
        bp::object lines = bp::import("traceback").attr("format_exception")(exc_type, exc_value, exc_tb);
        return ToUtf8(bp::str("").join(lines));
    } catch (const bp::error_already_set&) {
        PyErr_Clear();
        return "Error: exception could not be formatted";
    }
}

bp::object GateCall(rlm::runtime::QueryGate& gate, bp::object prompt, bp::object model) {
    const auto text = ToUtf8(prompt);
    std::string chosen;
    if (!model.is_none()) {
        chosen = ToUtf8(model);
    }
    std::string answer;
    {
        GilRelease release;
        answer = gate.Query(text, chosen);
    }
    return Utf8Object(answer);
}

bp::list ListFilesPy(const rlm::sandbox::FileIndex& files, const std::string& pattern) {
    bp::list result;
    for (const auto& path : files.ListFiles(pattern)) {
        result.append(Utf8Object(path));
    }
    return result;
}

bp::object ReadFilePy(const rlm::sandbox::FileIndex& files, const std::string& path) {
    const auto content = files.ReadFile(path);
    if (!content) {
        PyErr_SetString(PyExc_FileNotFoundError, ("File not found or outside the data root: " + path).c_str());
        bp::throw_error_already_set();
    }
    return Utf8Object(*content);
}

bp::dict IndexPy(const rlm::sandbox::FileIndex& files) {
    bp::dict index;
    for (const auto& entry : files.Entries()) {
        bp::dict info;
        info["size"] = entry.size;
        info["type"] = entry.type;
        index[Utf8Object(entry.path)] = info;
    }
    return index;
}

}  // namespace

BOOST_PYTHON_MODULE(rlm_native) {
    bp::class_<rlm::runtime::QueryGate, boost::noncopyable>("QueryGate", bp::no_init)
        .def("__call__", &GateCall, (bp::arg("self"), bp::arg("prompt"), bp::arg("model") = bp::object()));
    bp::class_<rlm::sandbox::FileIndex, boost::noncopyable>("FileIndex", bp::no_init)
        .def("list_files", &ListFilesPy, (bp::arg("self"), bp::arg("pattern") = "*"))
        .def("read_file", &ReadFilePy, (bp::arg("self"), bp::arg("path")))
        .def("index", &IndexPy);
}

namespace rlm::runtime {
namespace {

const char* const kHelperNames[] = {
    "llm_query",
    "context",
    "list_files",
    "read_file",
    "file_index"
};

// True when every int inside value fits a 64-bit JSON number.
const char* const kFitsJsonSource =
    "def _rlm_fits_json(value):\n"
    "    if isinstance(value, bool):\n"
    "        return True\n"
    "    if isinstance(value, int):\n"
    "        return -2**63 <= value < 2**64\n"
    "    if isinstance(value, (list, tuple)):\n"
    "        return all(_rlm_fits_json(v) for v in value)\n"
    "    if isinstance(value, dict):\n"
    "        return all(_rlm_fits_json(v) for v in value.values())\n"
    "    return True\n";

std::once_flag g_interpreter_once;
// The interpreter (and sys.stdout) is shared by every session.
std::recursive_mutex g_interpreter_mutex;

void EnsureInterpreter() {
    std::call_once(g_interpreter_once, [] {
        if (Py_IsInitialized()) {
            return;
        }
        PyImport_AppendInittab("rlm_native", &PyInit_rlm_native);
        Py_InitializeEx(0);
        PyEval_SaveThread();
        rlm::utils::LogDebug("python", std::string("interpreter ") + Py_GetVersion());
    });
}

bool IsHelperName(const std::string& name) {
    for (const auto* helper : kHelperNames) {
        if (name == helper) {
            return true;
        }
    }
    return false;
}

std::size_t CountCodePoints(const std::string& text) {
    std::size_t count = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::size_t CountWords(const std::string& text) {
    std::istringstream stream(text);
    std::size_t count = 0;
    std::string word;
    while (stream >> word) {
        ++count;
    }
    return count;
}

}  // namespace

struct PythonSession::Impl {
    SessionOptions options;
    std::string context;
    std::string context_info;
    rlm::sandbox::FileIndex files;
    QueryGate gate;
    bp::dict ns;
    bp::object fits_json;

    Impl(SessionOptions opts, rlm::providers::LLMProvider* provider)
        : options(std::move(opts))
        , files(options.data_root)
        , gate(provider, options.recursion, options.sub_query_model) {
        if (DirectoryMode()) {
            files.Rebuild();
            gate.SetFileIndex(&files);
            context_info = "Indexed " + std::to_string(files.Size()) + " files from " + options.data_root;
        } else {
            LoadContext();
        }
        bp::import("rlm_native");
        bp::dict private_ns;
        private_ns["__builtins__"] = bp::import("builtins");
        bp::exec(kFitsJsonSource, private_ns, private_ns);
        fits_json = private_ns["_rlm_fits_json"];
        InstallHelpers();
    }

    bool DirectoryMode() const {
        return !options.data_root.empty();
    }

    void LoadContext() {
        if (!options.context_text.empty()) {
            context = options.context_text;
        } else if (!options.context_file.empty() && std::filesystem::exists(options.context_file)) {
            std::ifstream input(options.context_file, std::ios::binary);
            if (!input.is_open()) {
                context_info = "Error loading context: cannot open " + options.context_file;
                rlm::utils::LogError("python", context_info);
                return;
            }
            std::ostringstream buffer;
            buffer << input.rdbuf();
            context = buffer.str();
        } else {
            context_info = "No context file found";
            rlm::utils::LogWarn("python", context_info);
            return;
        }
        context_info = "Loaded context with " + std::to_string(CountCodePoints(context)) +
            " characters (" + std::to_string(CountWords(context)) + " words)";
        rlm::utils::LogInfo("python", context_info);
    }

    void InstallHelpers() {
        ns["__builtins__"] = bp::import("builtins");
        ns["__name__"] = "__main__";
        ns["context"] = Utf8Object(context);

        bp::object gate_object(bp::ptr(&gate));
        bp::object files_object(bp::ptr(&files));
        ns["_rlm_gate"] = gate_object;
        ns["_rlm_files"] = files_object;
        ns["llm_query"] = gate_object;
        ns["list_files"] = files_object.attr("list_files");
        ns["read_file"] = files_object.attr("read_file");
        ns["file_index"] = IndexPy(files);
    }

    std::string CapOutput(const bp::object& text) const {
        if (bp::len(text) <= static_cast<long>(kMaxOutputChars)) {
            return ToUtf8(text);
        }
        return ToUtf8(text.slice(0, static_cast<long>(kMaxOutputChars))) +
            "\n... [Output truncated at " + std::to_string(kMaxOutputChars) + " chars]";
    }

    rlm::sandbox::ExecutionResult Execute(const std::string& code) {
        rlm::sandbox::ExecutionResult result{};
        bp::object sys = bp::import("sys");
        bp::object io = bp::import("io");
        bp::object out = io.attr("StringIO")();
        bp::object err = io.attr("StringIO")();
        bp::object saved_out = sys.attr("stdout");
        bp::object saved_err = sys.attr("stderr");

        sys.attr("stdout") = out;
        sys.attr("stderr") = err;
        std::string trace;
        try {
            bp::exec(code.c_str(), ns, ns);
            result.success = true;
        } catch (const bp::error_already_set&) {
            trace = FetchTraceback();
        }
        sys.attr("stdout") = saved_out;
        sys.attr("stderr") = saved_err;

        result.output = CapOutput(out.attr("getvalue")());
        if (result.success) {
            const auto stderr_text = ToUtf8(err.attr("getvalue")());
            if (!stderr_text.empty()) {
                result.error = stderr_text;
            }
        } else {
            result.error = trace;
        }
        return result;
    }

    nlohmann::json Serialize(const bp::object& value) {
        bp::object json = bp::import("json");
        bp::object text;
        try {
            bp::dict kwargs;
            kwargs["allow_nan"] = false;
            text = json.attr("dumps")(*bp::make_tuple(value), **kwargs);
        } catch (const bp::error_already_set&) {
            PyErr_Clear();
            text = json.attr("dumps")(bp::import("builtins").attr("repr")(value));
        }
        const auto json_text = ToUtf8(text);
        bool fits = true;
        try {
            fits = bp::extract<bool>(fits_json(value))();
        } catch (const bp::error_already_set&) {
            // Self-referencing containers; dumps already fell back to repr.
            PyErr_Clear();
        }
        // nlohmann::json would turn these ints into doubles; keep the digits.
        if (!fits) {
            return nlohmann::json(json_text);
        }
        const auto parsed = nlohmann::json::parse(json_text, nullptr, false);
        if (parsed.is_discarded()) {
            return nlohmann::json(ToUtf8(bp::import("builtins").attr("repr")(value)));
        }
        return parsed;
    }

    std::map<std::string, std::string> ListVariables() {
        std::map<std::string, std::string> variables;
        bp::list items = ns.items();
        const auto count = bp::len(items);
        for (long i = 0; i < count; ++i) {
            bp::object key = items[i][0];
            if (!PyUnicode_Check(key.ptr())) {
                continue;
            }
            const auto name = ToUtf8(key);
            if (name.empty() || name.front() == '_' || IsHelperName(name)) {
                continue;
            }
            bp::object value = items[i][1];
            bp::object type_name = bp::object(bp::handle<>(bp::borrowed(
                reinterpret_cast<PyObject*>(Py_TYPE(value.ptr()))))).attr("__name__");
            variables[name] = ToUtf8(type_name);
        }
        return variables;
    }
};

PythonSession::PythonSession(SessionOptions options, rlm::providers::LLMProvider* provider) {
    EnsureInterpreter();
    std::lock_guard<std::recursive_mutex> lock(g_interpreter_mutex);
    GilLock gil;
    try {
        impl_ = std::make_unique<Impl>(std::move(options), provider);
    } catch (const bp::error_already_set&) {
        const auto trace = FetchTraceback();
        throw std::runtime_error("cannot initialize python session: " + trace);
    }
}

PythonSession::~PythonSession() {
    std::lock_guard<std::recursive_mutex> lock(g_interpreter_mutex);
    GilLock gil;
    impl_.reset();
}

rlm::sandbox::ExecutionResult PythonSession::Execute(const std::string& code) {
    std::lock_guard<std::recursive_mutex> lock(g_interpreter_mutex);
    GilLock gil;
    rlm::utils::LogDebug("python", "executing " + std::to_string(code.size()) + " chars");
    try {
        return impl_->Execute(code);
    } catch (const bp::error_already_set&) {
        return rlm::sandbox::ExecutionResult::Failure(FetchTraceback());
    }
}

std::optional<nlohmann::json> PythonSession::GetVariable(const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(g_interpreter_mutex);
    GilLock gil;
    try {
        if (!impl_->ns.has_key(name)) {
            return std::nullopt;
        }
        return impl_->Serialize(impl_->ns[name]);
    } catch (const bp::error_already_set&) {
        rlm::utils::LogWarn("python", "get_var " + name + " failed: " + FetchTraceback());
        return std::nullopt;
    }
}

std::map<std::string, std::string> PythonSession::ListVariables() {
    std::lock_guard<std::recursive_mutex> lock(g_interpreter_mutex);
    GilLock gil;
    try {
        return impl_->ListVariables();
    } catch (const bp::error_already_set&) {
        rlm::utils::LogWarn("python", "list_vars failed: " + FetchTraceback());
        return {};
    }
}

void PythonSession::Reset() {
    std::lock_guard<std::recursive_mutex> lock(g_interpreter_mutex);
    GilLock gil;
    try {
        impl_->ns.clear();
        impl_->InstallHelpers();
    } catch (const bp::error_already_set&) {
        throw std::runtime_error("cannot reset python namespace: " + FetchTraceback());
    }
    rlm::utils::LogInfo("python", "namespace reset");
}

int PythonSession::Reindex() {
    std::lock_guard<std::recursive_mutex> lock(g_interpreter_mutex);
    GilLock gil;
    if (!impl_->DirectoryMode()) {
        return 0;
    }
    const auto count = impl_->files.Rebuild();
    impl_->ns["file_index"] = IndexPy(impl_->files);
    impl_->context_info = "Indexed " + std::to_string(count) + " files from " + impl_->options.data_root;
    return count;
}

bool PythonSession::DirectoryMode() const {
    return impl_->DirectoryMode();
}

int PythonSession::FileCount() const {
    std::lock_guard<std::recursive_mutex> lock(g_interpreter_mutex);
    return static_cast<int>(impl_->files.Size());
}

std::vector<std::string> PythonSession::ListFiles(const std::string& pattern) const {
    std::lock_guard<std::recursive_mutex> lock(g_interpreter_mutex);
    return impl_->files.ListFiles(pattern);
}

std::optional<std::string> PythonSession::ReadFile(const std::string& path) const {
    std::lock_guard<std::recursive_mutex> lock(g_interpreter_mutex);
    return impl_->files.ReadFile(path);
}

const std::string& PythonSession::ContextInfo() const {
    return impl_->context_info;
}

RecursionContext PythonSession::Recursion() const {
    std::lock_guard<std::recursive_mutex> lock(g_interpreter_mutex);
    return impl_->gate.Context();
}

}  // namespace rlm::runtime
