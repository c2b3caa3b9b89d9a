#pragma once

#include <pybind11/pybind11.h>

#include <memory>
#include <string>

#include "sandbox/cancellation.hpp"

namespace codetutor::sandbox {

inline constexpr const char* kSubmissionFilename = "<submission>";

// The embedded CPython interpreter shared by every run in the process. It
// starts on first use, the GIL is released once startup is done, and it is
// never finalized. Permitted modules are imported during startup so that runs
// never load new modules.
class PythonRuntime {
public:
    static PythonRuntime& Instance();

    const std::string& Version() const { return version_; }

private:
    PythonRuntime();

    std::string version_;
    std::unique_ptr<pybind11::gil_scoped_release> release_;
};

enum class ScriptStatus {
    kCompleted,
    kRaised,
    kCancelled
};

struct ScriptOutcome {
    ScriptStatus status = ScriptStatus::kCompleted;
    std::string type;
    std::string message;
    // Innermost line of the submission in the traceback, 0 when unknown.
    int line = 0;
    std::string traceback;
};

// Compiles and runs `source` with `globals` as its module namespace on the
// calling thread, which must hold the GIL. While it runs the thread is marked
// sandboxed (host file, process, network and import operations are refused)
// and every line checks `token`; once cancelled the script raises an
// exception at each further line until it unwinds. `globals` is cleared
// before returning.
ScriptOutcome ExecuteSource(const std::string& source, const pybind11::dict& globals, const CancellationToken& token);

// UTF-8 text of str(value). Code points UTF-8 cannot carry become backslash
// escapes. Caller holds the GIL.
std::string ToUtf8(pybind11::handle value);

}  // namespace codetutor::sandbox
