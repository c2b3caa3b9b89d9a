#include "sandbox/python_runtime.hpp"

#include <pybind11/embed.h>

#include <stdexcept>
#include <string_view>

#include "sandbox/allow_list.hpp"
#include "utils/logging.hpp"

namespace py = pybind11;

namespace codetutor::sandbox {
namespace {

thread_local bool t_sandboxed = false;

// Audit events refused on a sandboxed thread. An entry ending in '.' covers
// every event with that prefix.
constexpr std::string_view kDeniedEvents[] = {
    "open", "import", "os.", "subprocess.", "socket.", "shutil.", "ctypes.", "pty.", "fcntl.",
    "mmap.", "signal.", "resource.", "syslog.", "glob.", "tempfile.", "urllib.", "http.", "webbrowser.",
    "marshal.", "pickle.", "code.__new__", "function.__new__", "sys.settrace", "sys.setprofile",
    "sys._getframe", "sys._current_frames", "sys.addaudithook", "sys.setrecursionlimit"};

// Modules imported on the host thread at startup besides the permitted ones:
// lazy dependencies of permitted modules and what this file uses itself.
constexpr const char* kPreloadedModules[] = {"_strptime", "traceback", "types", "ast"};

bool IsDenied(std::string_view event) {
    for (const auto entry : kDeniedEvents) {
        if (entry.back() == '.' ? event.substr(0, entry.size()) == entry : event == entry) {
            return true;
        }
    }
    return false;
}

int DenyHostAccess(const char* event, PyObject*, void*) {
    if (!t_sandboxed || !IsDenied(event)) {
        return 0;
    }
    PyErr_Format(PyExc_PermissionError, "operation not permitted in the sandbox: %s", event);
    return -1;
}

PyObject* CancelledType() {
    static PyObject* type = PyErr_NewException("codetutor.ExecutionCancelled", PyExc_BaseException, nullptr);
    return type;
}

int CheckCancelled(PyObject* capsule, PyFrameObject*, int what, PyObject*) {
    if (what != PyTrace_LINE && what != PyTrace_CALL) {
        return 0;
    }
    const auto* token = static_cast<const CancellationToken*>(PyCapsule_GetPointer(capsule, nullptr));
    if (token == nullptr) {
        return -1;
    }
    if (token->IsCancelled()) {
        PyErr_SetString(CancelledType(), "execution cancelled");
        return -1;
    }
    return 0;
}

// Marks the calling thread as sandboxed and installs the cancellation check
// as its trace function for the lifetime of the scope.
class SandboxedScope {
public:
    explicit SandboxedScope(const CancellationToken& token)
        : capsule_(static_cast<const void*>(&token)) {
        PyEval_SetTrace(CheckCancelled, capsule_.ptr());
        t_sandboxed = true;
    }

    ~SandboxedScope() {
        t_sandboxed = false;
        PyEval_SetTrace(nullptr, nullptr);
    }

    SandboxedScope(const SandboxedScope&) = delete;
    SandboxedScope& operator=(const SandboxedScope&) = delete;

private:
    py::capsule capsule_;
};

int SubmissionLine(const py::object& trace) {
    int line = 0;
    py::object entry = trace;
    while (entry && !entry.is_none()) {
        const py::object code = entry.attr("tb_frame").attr("f_code");
        if (ToUtf8(code.attr("co_filename")) == kSubmissionFilename) {
            line = entry.attr("tb_lineno").cast<int>();
        }
        entry = entry.attr("tb_next");
    }
    return line;
}

ScriptOutcome Describe(const py::error_already_set& error) {
    ScriptOutcome outcome;
    outcome.status = ScriptStatus::kRaised;
    // tp_name is module qualified for types defined in C ("decimal.InvalidOperation").
    const std::string qualified = reinterpret_cast<PyTypeObject*>(error.type().ptr())->tp_name;
    outcome.type = qualified.substr(qualified.rfind('.') + 1);
    try {
        outcome.message = ToUtf8(error.value());
        outcome.line = SubmissionLine(error.trace());
        if (outcome.line == 0 && error.matches(PyExc_SyntaxError)) {
            const py::object lineno = py::getattr(error.value(), "lineno", py::none());
            outcome.line = lineno.is_none() ? 0 : lineno.cast<int>();
        }
        py::object trace = py::none();
        if (error.trace()) {
            trace = error.trace();
        }
        const py::list lines = py::module_::import("traceback").attr("format_exception")(error.type(), error.value(), trace);
        for (const auto& line : lines) {
            outcome.traceback += ToUtf8(line);
        }
    } catch (const py::error_already_set& e) {
        // The exception's own __str__ failed, or the run was cancelled meanwhile.
        utils::LogDebug("sandbox", std::string("could not format script exception: ") + e.what());
        outcome.traceback = outcome.type + (outcome.message.empty() ? "" : ": " + outcome.message) + "\n";
    }
    return outcome;
}

}  // namespace

PythonRuntime& PythonRuntime::Instance() {
    static PythonRuntime* runtime = new PythonRuntime();
    return *runtime;
}

PythonRuntime::PythonRuntime() {
    py::initialize_interpreter(false);
    CancelledType();
    if (PySys_AddAuditHook(DenyHostAccess, nullptr) != 0) {
        throw std::runtime_error("failed to install the sandbox audit hook");
    }
    for (const auto& module : DefaultAllowList().modules) {
        py::module_::import(module.c_str());
    }
    for (const auto* module : kPreloadedModules) {
        py::module_::import(module);
    }
    const std::string version = Py_GetVersion();
    version_ = version.substr(0, version.find(' '));
    release_ = std::make_unique<py::gil_scoped_release>();
    utils::LogInfo("sandbox", "embedded Python " + version_ + " ready");
}

std::string ToUtf8(py::handle value) {
    const auto text = py::str(py::reinterpret_borrow<py::object>(value));
    return text.attr("encode")("utf-8", "backslashreplace").cast<std::string>();
}

ScriptOutcome ExecuteSource(const std::string& source, const py::dict& globals, const CancellationToken& token) {
    ScriptOutcome outcome;
    SandboxedScope scope(token);
    try {
        const auto code = py::reinterpret_steal<py::object>(
            Py_CompileString(source.c_str(), kSubmissionFilename, Py_file_input));
        if (!code) {
            throw py::error_already_set();
        }
        const auto result = py::reinterpret_steal<py::object>(PyEval_EvalCode(code.ptr(), globals.ptr(), globals.ptr()));
        if (!result) {
            throw py::error_already_set();
        }
    } catch (const py::error_already_set& error) {
        if (token.IsCancelled() || error.matches(CancelledType())) {
            outcome.status = ScriptStatus::kCancelled;
        } else {
            outcome = Describe(error);
            if (token.IsCancelled()) {
                outcome.status = ScriptStatus::kCancelled;
            }
        }
    }
    globals.clear();
    return outcome;
}

}  // namespace codetutor::sandbox
