#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace codetutor::sandbox {

enum class ErrorKind {
    kNone,
    kSyntaxInvalid,
    kPolicyViolation,
    kRuntimeFailure,
    kTimeoutExceeded,
    kResourceExhausted,
    kEndOfInput
};

const char* ErrorKindName(ErrorKind kind);

struct SubmissionLimits {
    std::size_t max_code_chars = 50000;
    std::size_t max_inputs = 100;
    std::size_t max_input_chars = 1000;
};

struct SubmissionRequest {
    std::string code;
    std::vector<std::string> inputs;
};

// Checks the request against the size limits, counting code points. Returns
// the rejection message, or nullopt when the request may proceed to
// validation.
std::optional<std::string> CheckLimits(const SubmissionRequest& request, const SubmissionLimits& limits);

}  // namespace codetutor::sandbox
