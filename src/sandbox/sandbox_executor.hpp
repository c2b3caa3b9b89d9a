#pragma once

#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/cancellation.hpp"
#include "sandbox/submission.hpp"
#include "sandbox/validator.hpp"

namespace codetutor::sandbox {

inline constexpr const char* kTruncationMarker = "\n...(output truncated)";
inline constexpr const char* kNoOutputSentinel = "(program finished with no output)";

enum class RunState {
    kIdle,
    kRunning,
    kCompleted,
    kFailed,
    kTimedOut
};

const char* RunStateName(RunState state);

struct ExecResult {
    RunState state = RunState::kIdle;
    ErrorKind kind = ErrorKind::kNone;
    bool timed_out = false;
    // Rejected before running: limits, syntax, policy or backpressure.
    bool blocked = false;
    std::string output;
    std::string error;

    bool Succeeded() const { return state == RunState::kCompleted; }
};

struct SandboxOptions {
    std::chrono::milliseconds timeout{5000};
    std::size_t max_output_chars = 10000;
    std::size_t max_concurrent_runs = 8;
    SubmissionLimits limits;
};

SandboxOptions ResolveSandboxOptions(const codetutor::config::SandboxConfig& config);

// Runs validated submissions on a fixed worker pool, each in the embedded
// interpreter under the GIL. Each run owns a cancellation token; a timed out
// run is cancelled and unwinds at its next line, keeping its worker slot
// until it does. A single native operation (one huge integer power) is not
// interrupted until it returns.
class SandboxExecutor {
public:
    explicit SandboxExecutor(SandboxOptions options = {}, const AllowList& allow_list = DefaultAllowList());
    ~SandboxExecutor();

    SandboxExecutor(const SandboxExecutor&) = delete;
    SandboxExecutor& operator=(const SandboxExecutor&) = delete;

    // Empty-code and limits checks, validation, then Run. Never throws.
    ExecResult Submit(const SubmissionRequest& request);

    // Precondition: `source` passed the validator. Never throws.
    ExecResult Run(const std::string& source,
                   const std::vector<std::string>& inputs,
                   std::chrono::milliseconds timeout);
    ExecResult Run(const std::string& source, const std::vector<std::string>& inputs) {
        return Run(source, inputs, options_.timeout);
    }

    // Cancels every active run and joins the workers. Later runs are rejected.
    void Shutdown();

    const Validator& GetValidator() const { return validator_; }
    const SandboxOptions& Options() const { return options_; }
    std::size_t InFlight() const { return in_flight_.load(); }

    // Joins stdout and stderr and applies the size cap and truncation marker.
    static std::string ComposeOutput(const std::string& out, const std::string& err, std::size_t cap);

private:
    SandboxOptions options_;
    const AllowList& allow_list_;
    Validator validator_;
    boost::asio::thread_pool pool_;
    std::atomic<std::size_t> in_flight_{0};
    std::atomic<bool> shutting_down_{false};
    std::mutex active_mutex_;
    std::unordered_map<std::uint64_t, CancellationToken> active_;
    std::uint64_t next_run_id_ = 0;
};

}  // namespace codetutor::sandbox
