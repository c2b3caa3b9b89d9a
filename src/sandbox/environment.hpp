#pragma once

#include <pybind11/pybind11.h>

#include <memory>
#include <string>

#include "sandbox/allow_list.hpp"
#include "sandbox/input_simulator.hpp"

namespace codetutor::sandbox {

// The module namespace a run executes in. Its `__builtins__` holds only the
// permitted builtins, plus host callables for `print`, `input`, `__import__`,
// `getattr` and `hasattr` bound to the run's simulator and allow list.
// Imports of permitted modules yield a copy of the module's public names.
// The caller holds the GIL for the whole lifetime of an Environment, and the
// simulator and allow list must outlive it. Once it is destroyed the host
// callables raise RuntimeError if anything still reaches them.
class Environment {
public:
    static Environment Build(InputSimulator& inputs, const AllowList& allow_list = DefaultAllowList());

    ~Environment();
    Environment(Environment&&) = default;
    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;
    Environment& operator=(Environment&&) = delete;

    const pybind11::dict& Globals() const { return globals_; }
    const pybind11::dict& Builtins() const { return builtins_; }

    bool Has(const std::string& name) const { return builtins_.contains(name); }

    // State shared with the host callables; detached on destruction.
    struct Binding;

private:
    Environment() = default;

    pybind11::dict builtins_;
    pybind11::dict globals_;
    std::shared_ptr<Binding> binding_;
};

}  // namespace codetutor::sandbox
