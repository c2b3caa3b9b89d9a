#pragma once

#include <pybind11/pybind11.h>

#include <string>
#include <unordered_map>

#include "sandbox/allow_list.hpp"
#include "sandbox/submission.hpp"

namespace codetutor::sandbox {

struct ValidationResult {
    bool ok = true;
    std::string reason;
    ErrorKind kind = ErrorKind::kNone;
    std::string offending;
    int line = 0;
};

// Static policy check run before any code executes. The source is parsed
// with the embedded interpreter's `ast` module and every node kind maps to
// one rule; the walk is pre-order depth first and stops at the first
// violation. A tree that passes is also compiled, so errors the parser
// leaves to the compiler ('return' outside function) are reported here.
//
// This is a denylist over direct syntactic patterns. A capability reached
// through a late-bound attribute chain is not caught here; the runtime's
// getattr/hasattr refuse dunder names for that case.
class Validator {
public:
    enum class Rule {
        kAllow,
        kCheckImport,
        kDeny,
        kCheckCallee,
        kCheckAttribute
    };

    explicit Validator(const AllowList& allow_list = DefaultAllowList());

    // Acquires the GIL itself.
    ValidationResult Validate(const std::string& source) const;

    // Rule for an `ast` node class name such as "Import" or "Global".
    Rule RuleFor(const std::string& kind) const;

private:
    const AllowList& allow_list_;
    std::unordered_map<std::string, Rule> rules_;

    ValidationResult Check(const std::string& kind, const pybind11::handle& node) const;
    ValidationResult CheckModule(const std::string& module, int line) const;
};

}  // namespace codetutor::sandbox
