#pragma once

#include <set>
#include <string>

namespace codetutor::sandbox {

// What submitted code may name. Built once per process and never mutated.
struct AllowList {
    std::set<std::string> builtins;
    std::set<std::string> modules;
    std::set<std::string> banned_statements;
    std::set<std::string> banned_functions;
    std::set<std::string> banned_attributes;

    bool IsBuiltinAllowed(const std::string& name) const { return builtins.count(name) > 0; }
    bool IsModuleAllowed(const std::string& name) const { return modules.count(name) > 0; }
    bool IsFunctionBanned(const std::string& name) const { return banned_functions.count(name) > 0; }
    bool IsAttributeBanned(const std::string& name) const { return banned_attributes.count(name) > 0; }
    // Banned names plus every dunder name; used by the runtime getattr/hasattr.
    bool IsAttributeRefused(const std::string& name) const;
};

const AllowList& DefaultAllowList();

}  // namespace codetutor::sandbox
