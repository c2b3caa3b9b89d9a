#include "sandbox/environment.hpp"

#include <stdexcept>

#include "sandbox/python_runtime.hpp"

namespace py = pybind11;

namespace codetutor::sandbox {

struct Environment::Binding {
    InputSimulator* inputs = nullptr;
    const AllowList* allow_list = nullptr;
    py::object print;
    py::object import;
    py::object getattr;

    InputSimulator& Inputs() const {
        if (inputs == nullptr) {
            throw std::runtime_error("the run has already finished");
        }
        return *inputs;
    }
};

namespace {

const char* TypeName(py::handle value) {
    return Py_TYPE(value.ptr())->tp_name;
}

std::string TextOption(py::handle value, const char* option, const char* fallback) {
    if (value.is_none()) {
        return fallback;
    }
    if (!PyUnicode_Check(value.ptr())) {
        throw py::type_error(std::string(option) + " must be None or a string, not " + TypeName(value));
    }
    return ToUtf8(value);
}

// A fresh module holding the public names of `module`. Submodules appear only
// when they are permitted themselves, as views of their own, one level deep.
py::object PublicView(py::handle module, const AllowList& allow_list, bool nested) {
    const auto module_type = py::reinterpret_borrow<py::object>(reinterpret_cast<PyObject*>(&PyModule_Type));
    py::object view = module_type(module.attr("__name__"));
    const auto names = py::reinterpret_borrow<py::dict>(PyModule_GetDict(module.ptr()));
    for (const auto& item : names) {
        const auto name = ToUtf8(item.first);
        if (name.empty() || name[0] == '_') {
            continue;
        }
        if (PyModule_Check(item.second.ptr())) {
            if (nested || !allow_list.IsModuleAllowed(ToUtf8(item.second.attr("__name__")))) {
                continue;
            }
            py::setattr(view, item.first, PublicView(item.second, allow_list, true));
        } else {
            py::setattr(view, item.first, item.second);
        }
    }
    return view;
}

py::object GuardedImport(const Environment::Binding& binding, const std::string& name, py::handle fromlist, int level) {
    if (level > 0) {
        throw py::import_error("relative imports are not allowed");
    }
    if (!binding.allow_list->IsModuleAllowed(name)) {
        throw py::import_error("permission denied: module '" + name + "' is not allowed");
    }
    const py::object module = binding.import(name, py::none(), py::none(), fromlist, 0);
    py::object view = PublicView(module, *binding.allow_list, false);
    if (!fromlist.is_none()) {
        // Keeps `from x import y` from falling back to hidden submodules.
        for (const auto& entry : fromlist) {
            const auto wanted = ToUtf8(entry);
            if (wanted != "*" && !py::hasattr(view, wanted.c_str())) {
                throw py::import_error("cannot import name '" + wanted + "' from '" + name + "'");
            }
        }
    }
    return view;
}

py::object Print(const Environment::Binding& binding, const py::args& args, const py::kwargs& kwargs) {
    std::string sep = " ";
    std::string end = "\n";
    bool redirected = false;
    for (const auto& item : kwargs) {
        const auto key = ToUtf8(item.first);
        if (key == "sep") {
            sep = TextOption(item.second, "sep", " ");
        } else if (key == "end") {
            end = TextOption(item.second, "end", "\n");
        } else if (key == "file") {
            redirected = !item.second.is_none();
        } else if (key != "flush") {
            throw py::type_error("'" + key + "' is an invalid keyword argument for print()");
        }
    }
    if (redirected) {
        return binding.print(*args, **kwargs);
    }
    std::string line;
    bool first = true;
    for (const auto& arg : args) {
        if (!first) {
            line += sep;
        }
        line += ToUtf8(arg);
        first = false;
    }
    line += end;
    binding.Inputs().Stdout().Write(line);
    return py::none();
}

py::str Input(const Environment::Binding& binding, py::handle prompt) {
    try {
        return py::str(binding.Inputs().NextInput(ToUtf8(prompt)));
    } catch (const EndOfInput& e) {
        PyErr_SetString(PyExc_EOFError, e.what());
        throw py::error_already_set();
    }
}

}  // namespace

Environment::~Environment() {
    if (binding_) {
        binding_->inputs = nullptr;
    }
}

Environment Environment::Build(InputSimulator& inputs, const AllowList& allow_list) {
    Environment environment;
    const auto builtins = py::module_::import("builtins");
    for (const auto& name : allow_list.builtins) {
        if (py::hasattr(builtins, name.c_str())) {
            environment.builtins_[name.c_str()] = builtins.attr(name.c_str());
        }
    }

    auto binding = std::make_shared<Binding>();
    binding->inputs = &inputs;
    binding->allow_list = &allow_list;
    binding->print = builtins.attr("print");
    binding->import = builtins.attr("__import__");
    binding->getattr = builtins.attr("getattr");
    environment.binding_ = binding;

    environment.builtins_["print"] = py::cpp_function(
        [binding](py::args args, py::kwargs kwargs) { return Print(*binding, args, kwargs); }, py::name("print"));
    environment.builtins_["input"] = py::cpp_function(
        [binding](py::object prompt) { return Input(*binding, prompt); }, py::name("input"), py::arg("prompt") = "");
    environment.builtins_["__import__"] = py::cpp_function(
        [binding](const std::string& name, py::object, py::object, py::object fromlist, int level) {
            return GuardedImport(*binding, name, fromlist, level);
        },
        py::name("__import__"), py::arg("name"), py::arg("globals") = py::none(), py::arg("locals") = py::none(),
        py::arg("fromlist") = py::tuple(), py::arg("level") = 0);
    environment.builtins_["getattr"] = py::cpp_function(
        [binding](py::object target, py::object name, py::args rest) -> py::object {
            if (PyUnicode_Check(name.ptr()) && binding->allow_list->IsAttributeRefused(ToUtf8(name))) {
                throw py::attribute_error("attribute access not allowed: " + ToUtf8(name));
            }
            return binding->getattr(target, name, *rest);
        },
        py::name("getattr"));
    environment.builtins_["hasattr"] = py::cpp_function(
        [binding](py::object target, py::object name) {
            if (!PyUnicode_Check(name.ptr())) {
                throw py::type_error("hasattr(): attribute name must be string");
            }
            if (binding->allow_list->IsAttributeRefused(ToUtf8(name))) {
                return false;
            }
            return py::hasattr(target, name);
        },
        py::name("hasattr"));

    environment.globals_["__builtins__"] = environment.builtins_;
    environment.globals_["__name__"] = "__main__";
    return environment;
}

}  // namespace codetutor::sandbox
