#include "sandbox/submission.hpp"

#include "utils/utf8.hpp"

namespace codetutor::sandbox {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "None";
        case ErrorKind::kSyntaxInvalid: return "SyntaxInvalid";
        case ErrorKind::kPolicyViolation: return "PolicyViolation";
        case ErrorKind::kRuntimeFailure: return "RuntimeFailure";
        case ErrorKind::kTimeoutExceeded: return "TimeoutExceeded";
        case ErrorKind::kResourceExhausted: return "ResourceExhausted";
        case ErrorKind::kEndOfInput: return "EndOfInput";
    }
    return "Unknown";
}

std::optional<std::string> CheckLimits(const SubmissionRequest& request, const SubmissionLimits& limits) {
    if (utils::Utf8Length(request.code) > limits.max_code_chars) {
        return "code is too long (at most " + std::to_string(limits.max_code_chars) + " characters)";
    }
    if (request.inputs.size() > limits.max_inputs) {
        return "too many inputs (at most " + std::to_string(limits.max_inputs) + ")";
    }
    for (const auto& input : request.inputs) {
        if (utils::Utf8Length(input) > limits.max_input_chars) {
            return "each input must be a string of at most " + std::to_string(limits.max_input_chars) +
                " characters";
        }
    }
    return std::nullopt;
}

}  // namespace codetutor::sandbox
