#include "sandbox/validator.hpp"

#include <vector>

#include "sandbox/python_runtime.hpp"

namespace py = pybind11;

namespace codetutor::sandbox {
namespace {

ValidationResult Violation(const std::string& reason, const std::string& offending, int line) {
    ValidationResult result;
    result.ok = false;
    result.kind = ErrorKind::kPolicyViolation;
    result.reason = reason;
    result.offending = offending;
    result.line = line;
    return result;
}

int IntAttribute(const py::handle& object, const char* name) {
    const py::object value = py::getattr(object, name, py::none());
    return PyLong_Check(value.ptr()) ? value.cast<int>() : 0;
}

int LineOf(const py::handle& node) {
    return IntAttribute(node, "lineno");
}

ValidationResult SyntaxFailure(const py::error_already_set& error) {
    ValidationResult result;
    result.ok = false;
    result.kind = ErrorKind::kSyntaxInvalid;
    if (error.matches(PyExc_SyntaxError)) {
        const py::object msg = py::getattr(error.value(), "msg", py::none());
        result.line = IntAttribute(error.value(), "lineno");
        result.reason = "syntax error: " + ToUtf8(msg.is_none() ? error.value() : msg) + " (line " +
                        std::to_string(result.line) + ", column " +
                        std::to_string(IntAttribute(error.value(), "offset")) + ")";
    } else {
        // Null bytes and undecodable text fail before parsing starts.
        result.reason = "syntax error: " + ToUtf8(error.value());
    }
    return result;
}

}  // namespace

Validator::Validator(const AllowList& allow_list)
    : allow_list_(allow_list) {
    PythonRuntime::Instance();
    rules_ = {
        {"Import", Rule::kCheckImport},
        {"ImportFrom", Rule::kCheckImport},
        {"Call", Rule::kCheckCallee},
        {"Attribute", Rule::kCheckAttribute},
    };
    for (const auto& statement : allow_list_.banned_statements) {
        rules_[statement] = Rule::kDeny;
    }
}

Validator::Rule Validator::RuleFor(const std::string& kind) const {
    const auto it = rules_.find(kind);
    return it == rules_.end() ? Rule::kAllow : it->second;
}

ValidationResult Validator::Validate(const std::string& source) const {
    py::gil_scoped_acquire gil;
    const auto ast = py::module_::import("ast");
    py::object tree;
    try {
        const auto text = py::reinterpret_steal<py::object>(
            PyUnicode_DecodeUTF8(source.data(), static_cast<Py_ssize_t>(source.size()), "strict"));
        if (!text) {
            throw py::error_already_set();
        }
        tree = ast.attr("parse")(text, kSubmissionFilename);
    } catch (const py::error_already_set& e) {
        return SyntaxFailure(e);
    }

    const auto iter_child_nodes = ast.attr("iter_child_nodes");
    std::vector<py::object> pending{tree};
    while (!pending.empty()) {
        const py::object node = std::move(pending.back());
        pending.pop_back();
        auto verdict = Check(ToUtf8(node.get_type().attr("__name__")), node);
        if (!verdict.ok) {
            return verdict;
        }
        const py::list children(iter_child_nodes(node));
        for (auto i = children.size(); i > 0; --i) {
            pending.push_back(children[i - 1]);
        }
    }

    try {
        py::module_::import("builtins").attr("compile")(tree, kSubmissionFilename, "exec");
    } catch (const py::error_already_set& e) {
        return SyntaxFailure(e);
    }
    return {};
}

ValidationResult Validator::Check(const std::string& kind, const py::handle& node) const {
    switch (RuleFor(kind)) {
        case Rule::kAllow:
            return {};
        case Rule::kDeny:
            return Violation("not allowed: " + kind, kind, LineOf(node));
        case Rule::kCheckCallee: {
            const py::object callee = node.attr("func");
            if (py::isinstance(callee, py::module_::import("ast").attr("Name"))) {
                const auto name = ToUtf8(callee.attr("id"));
                if (allow_list_.IsFunctionBanned(name)) {
                    return Violation("function not allowed: " + name, name, LineOf(node));
                }
            }
            return {};
        }
        case Rule::kCheckAttribute: {
            const auto attribute = ToUtf8(node.attr("attr"));
            if (allow_list_.IsAttributeBanned(attribute)) {
                return Violation("attribute access not allowed: " + attribute, attribute, LineOf(node));
            }
            return {};
        }
        case Rule::kCheckImport:
            break;
    }
    if (kind == "Import") {
        for (const auto& alias : node.attr("names")) {
            auto verdict = CheckModule(ToUtf8(alias.attr("name")), LineOf(node));
            if (!verdict.ok) {
                return verdict;
            }
        }
        return {};
    }
    const int level = IntAttribute(node, "level");
    const py::object module = node.attr("module");
    const auto name = module.is_none() ? std::string() : ToUtf8(module);
    if (level > 0) {
        return Violation("relative imports are not allowed", std::string(static_cast<std::size_t>(level), '.') + name,
                         LineOf(node));
    }
    return CheckModule(name, LineOf(node));
}

ValidationResult Validator::CheckModule(const std::string& module, int line) const {
    if (!allow_list_.IsModuleAllowed(module)) {
        return Violation("module not allowed: " + module, module, line);
    }
    return {};
}

}  // namespace codetutor::sandbox
