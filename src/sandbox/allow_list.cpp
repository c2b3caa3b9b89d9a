#include "sandbox/allow_list.hpp"

namespace codetutor::sandbox {
namespace {

AllowList BuildAllowList() {
    AllowList list;
    list.builtins = {
        "print", "len", "str", "int", "float", "bool", "list", "dict", "tuple", "set", "range",
        "enumerate", "zip", "sum", "min", "max", "abs", "round", "sorted", "reversed", "type",
        "isinstance", "hasattr", "getattr", "chr", "ord", "bin", "hex", "oct", "pow", "divmod",
        "all", "any", "filter", "map", "format", "repr", "complex", "iter", "next",
        // class definitions
        "__build_class__", "object", "super", "property", "staticmethod", "classmethod", "issubclass",
        // exception types
        "BaseException", "Exception", "ArithmeticError", "ZeroDivisionError", "OverflowError",
        "FloatingPointError", "LookupError", "IndexError", "KeyError", "ValueError", "UnicodeError",
        "TypeError", "NameError", "UnboundLocalError", "AttributeError", "EOFError", "ImportError",
        "ModuleNotFoundError", "RuntimeError", "RecursionError", "NotImplementedError", "AssertionError",
        "StopIteration", "MemoryError", "PermissionError", "KeyboardInterrupt", "GeneratorExit",
        "NotImplemented", "Ellipsis"};
    list.modules = {"math", "random", "datetime", "decimal", "fractions", "statistics", "string", "json", "re"};
    list.banned_statements = {"Global", "Nonlocal"};
    list.banned_functions = {
        "open", "file", "raw_input", "exec", "eval", "compile", "globals", "locals", "vars", "dir",
        "setattr", "delattr", "exit", "quit", "help", "license", "credits", "reload", "execfile",
        "__import__", "breakpoint", "memoryview"};
    list.banned_attributes = {
        "__globals__", "__locals__", "__builtins__", "__file__", "__name__", "__dict__", "__class__",
        "__base__", "__bases__", "__subclasses__", "__code__", "__closure__", "__mro__", "__import__",
        "__self__", "__func__", "__traceback__", "__getattribute__", "__loader__", "__spec__",
        "f_globals", "f_locals", "f_builtins", "f_back", "f_code", "tb_frame", "gi_frame", "gi_code",
        "cr_frame", "ag_frame"};
    return list;
}

}  // namespace

bool AllowList::IsAttributeRefused(const std::string& name) const {
    if (name.size() > 4 && name.compare(0, 2, "__") == 0 && name.compare(name.size() - 2, 2, "__") == 0) {
        return true;
    }
    return IsAttributeBanned(name);
}

const AllowList& DefaultAllowList() {
    static const AllowList list = BuildAllowList();
    return list;
}

}  // namespace codetutor::sandbox
