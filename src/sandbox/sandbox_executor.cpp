#include "sandbox/sandbox_executor.hpp"

#include <boost/asio/post.hpp>
#include <future>
#include <memory>
#include <new>

#include "sandbox/environment.hpp"
#include "sandbox/input_simulator.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/python_runtime.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/utf8.hpp"

namespace py = pybind11;

namespace codetutor::sandbox {
namespace {

struct RunContext {
    RunContext(std::string source_text, std::vector<std::string> input_values, std::size_t cap)
        : source(std::move(source_text))
        , inputs(std::move(input_values))
        , out(cap + 1)
        , err(cap + 1) {}

    std::string source;
    std::vector<std::string> inputs;
    CancellationToken token;
    OutputCapture out;
    OutputCapture err;
};

struct Outcome {
    RunState state = RunState::kCompleted;
    ErrorKind kind = ErrorKind::kNone;
    std::string error;
};

std::string FormatSeconds(std::chrono::milliseconds timeout) {
    const auto ms = timeout.count();
    if (ms % 1000 == 0) {
        return std::to_string(ms / 1000);
    }
    auto text = std::to_string(ms / 1000) + "." + std::to_string(ms % 1000 + 1000).substr(1);
    while (text.back() == '0') {
        text.pop_back();
    }
    return text;
}

std::string LineSuffix(int line) {
    return line > 0 ? " (line " + std::to_string(line) + ")" : std::string();
}

Outcome Fail(ErrorKind kind, std::string error) {
    Outcome outcome;
    outcome.state = RunState::kFailed;
    outcome.kind = kind;
    outcome.error = std::move(error);
    return outcome;
}

Outcome Describe(const ScriptOutcome& script) {
    const auto message = script.message.empty() ? script.type : script.type + ": " + script.message;
    if (script.type == "EOFError") {
        return Fail(ErrorKind::kEndOfInput, message + LineSuffix(script.line));
    }
    if (script.type == "SyntaxError" || script.type == "IndentationError" || script.type == "TabError") {
        return Fail(ErrorKind::kSyntaxInvalid, message + LineSuffix(script.line));
    }
    return Fail(ErrorKind::kRuntimeFailure, message + LineSuffix(script.line));
}

Outcome Execute(RunContext& run, const AllowList& allow_list) {
    try {
        py::gil_scoped_acquire gil;
        InputSimulator inputs(run.inputs, run.out);
        ScriptOutcome script;
        {
            auto environment = Environment::Build(inputs, allow_list);
            script = ExecuteSource(run.source, environment.Globals(), run.token);
        }
        switch (script.status) {
            case ScriptStatus::kCompleted:
                return {};
            case ScriptStatus::kCancelled: {
                Outcome outcome;
                outcome.state = RunState::kTimedOut;
                outcome.kind = ErrorKind::kTimeoutExceeded;
                return outcome;
            }
            case ScriptStatus::kRaised:
                break;
        }
        run.err.Write(script.traceback);
        return Describe(script);
    } catch (const std::bad_alloc&) {
        return Fail(ErrorKind::kRuntimeFailure, "MemoryError: out of memory");
    } catch (const std::exception& e) {
        utils::LogError("sandbox", std::string("run failed inside the host: ") + e.what());
        return Fail(ErrorKind::kRuntimeFailure, std::string("internal error: ") + e.what());
    }
}

ExecResult Rejected(ErrorKind kind, std::string error) {
    ExecResult result;
    result.state = RunState::kFailed;
    result.kind = kind;
    result.blocked = true;
    result.error = std::move(error);
    return result;
}

}  // namespace

const char* RunStateName(RunState state) {
    switch (state) {
        case RunState::kIdle: return "Idle";
        case RunState::kRunning: return "Running";
        case RunState::kCompleted: return "Completed";
        case RunState::kFailed: return "Failed";
        case RunState::kTimedOut: return "TimedOut";
    }
    return "Unknown";
}

SandboxOptions ResolveSandboxOptions(const codetutor::config::SandboxConfig& config) {
    SandboxOptions options;
    options.timeout = std::chrono::seconds(config.timeout_seconds);
    options.max_output_chars = static_cast<std::size_t>(config.max_output_chars);
    options.max_concurrent_runs = static_cast<std::size_t>(config.max_concurrent_runs);
    options.limits.max_code_chars = static_cast<std::size_t>(config.max_code_chars);
    options.limits.max_inputs = static_cast<std::size_t>(config.max_inputs);
    options.limits.max_input_chars = static_cast<std::size_t>(config.max_input_chars);
    return options;
}

SandboxExecutor::SandboxExecutor(SandboxOptions options, const AllowList& allow_list)
    : options_(std::move(options))
    , allow_list_(allow_list)
    , validator_(allow_list)
    , pool_(options_.max_concurrent_runs > 0 ? options_.max_concurrent_runs : 1) {
    PythonRuntime::Instance();
    if (options_.max_concurrent_runs == 0) {
        options_.max_concurrent_runs = 1;
    }
}

SandboxExecutor::~SandboxExecutor() {
    Shutdown();
}

void SandboxExecutor::Shutdown() {
    if (shutting_down_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        for (const auto& [id, token] : active_) {
            token.Cancel();
        }
    }
    pool_.join();
}

std::string SandboxExecutor::ComposeOutput(const std::string& out, const std::string& err, std::size_t cap) {
    std::string combined = out;
    if (!out.empty() && !err.empty()) {
        combined += "\n";
    }
    combined += err;
    if (utils::Utf8Length(combined) > cap) {
        return utils::Utf8Prefix(combined, cap) + kTruncationMarker;
    }
    return combined;
}

ExecResult SandboxExecutor::Submit(const SubmissionRequest& request) {
    if (utils::Trim(request.code).empty()) {
        return Rejected(ErrorKind::kSyntaxInvalid, "no code received");
    }
    if (const auto rejection = CheckLimits(request, options_.limits)) {
        return Rejected(ErrorKind::kResourceExhausted, *rejection);
    }
    const auto verdict = validator_.Validate(request.code);
    if (!verdict.ok) {
        utils::LogInfo("sandbox", std::string("submission rejected (") + ErrorKindName(verdict.kind) + "): " +
                       verdict.reason);
        return Rejected(verdict.kind, "security check failed: " + verdict.reason);
    }
    return Run(request.code, request.inputs, options_.timeout);
}

ExecResult SandboxExecutor::Run(const std::string& source,
                                const std::vector<std::string>& inputs,
                                std::chrono::milliseconds timeout) {
    if (shutting_down_.load()) {
        return Rejected(ErrorKind::kResourceExhausted, "server is shutting down");
    }
    if (in_flight_.fetch_add(1) >= options_.max_concurrent_runs) {
        in_flight_.fetch_sub(1);
        utils::LogWarn("sandbox", "rejecting run: " + std::to_string(options_.max_concurrent_runs) +
                       " runs already in flight");
        return Rejected(ErrorKind::kResourceExhausted, "server busy, please try again later");
    }

    auto run = std::make_shared<RunContext>(source, inputs, options_.max_output_chars);
    std::uint64_t run_id = 0;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        run_id = next_run_id_++;
        active_.emplace(run_id, run->token);
    }
    if (shutting_down_.load()) {
        run->token.Cancel();
    }

    auto promise = std::make_shared<std::promise<Outcome>>();
    auto future = promise->get_future();
    boost::asio::post(pool_, [this, run, run_id, promise]() {
        auto outcome = Execute(*run, allow_list_);
        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            active_.erase(run_id);
        }
        in_flight_.fetch_sub(1);
        promise->set_value(std::move(outcome));
    });

    ExecResult result;
    result.state = RunState::kRunning;
    if (future.wait_for(timeout) != std::future_status::ready) {
        run->token.Cancel();
        utils::LogWarn("sandbox", "run " + std::to_string(run_id) + " timed out after " + FormatSeconds(timeout) +
                       "s, cancelled");
        result.state = RunState::kTimedOut;
        result.kind = ErrorKind::kTimeoutExceeded;
        result.timed_out = true;
        result.error = "execution timed out (" + FormatSeconds(timeout) +
            " seconds), the program may contain an infinite loop";
        return result;
    }

    const auto outcome = future.get();
    result.state = outcome.state;
    result.kind = outcome.kind;
    if (outcome.state == RunState::kTimedOut) {
        // Cancelled by Shutdown while the supervisor was still waiting.
        result.timed_out = true;
        result.error = "execution cancelled: server is shutting down";
        return result;
    }
    result.output = ComposeOutput(run->out.Text(), run->err.Text(), options_.max_output_chars);
    if (outcome.state == RunState::kFailed) {
        result.error = outcome.error;
        utils::LogDebug("sandbox", "run " + std::to_string(run_id) + " failed: " + outcome.error);
    } else if (result.output.empty()) {
        result.output = kNoOutputSentinel;
    }
    return result;
}

}  // namespace codetutor::sandbox
