#include "sandbox/capability_environment.hpp"

#include "python/interpreter.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pyfence::sandbox {
namespace bp = boost::python;
namespace {

[[noreturn]] void RaiseImportError(const std::string& message) {
    PyErr_SetString(PyExc_ImportError, message.c_str());
    throw bp::error_already_set();
}

bool IsEmptyFromList(const bp::object& fromlist) {
    if (fromlist.is_none()) {
        return true;
    }
    const int truth = PyObject_IsTrue(fromlist.ptr());
    if (truth < 0) {
        bp::throw_error_already_set();
    }
    return truth == 0;
}

}  // namespace

const std::vector<std::string>& SafeBuiltinNames() {
    static const std::vector<std::string> kNames = {
        "abs", "all", "any", "bin", "bool", "bytearray", "bytes",
        "chr", "complex", "dict", "divmod", "enumerate", "filter",
        "float", "frozenset", "hash", "hex", "int", "isinstance",
        "issubclass", "iter", "len", "list", "map", "max", "min",
        "next", "oct", "ord", "pow", "range", "repr", "reversed", "round",
        "set", "slice", "sorted", "str", "sum", "tuple", "type", "zip",
        "Exception", "ArithmeticError", "AssertionError", "AttributeError",
        "IndexError", "KeyError", "LookupError", "NameError", "RuntimeError",
        "StopIteration", "TypeError", "ValueError", "ZeroDivisionError",
        "__build_class__"
    };
    return kNames;
}

bool IsSafeBinding(const std::string& name, const Value& value) {
    if (name.empty() || name[0] == '_') {
        return false;
    }
    if (PyCallable_Check(value.ptr())) {
        return false;
    }
    if (PyModule_Check(value.ptr())) {
        return false;
    }
    return true;
}

bp::object MakeImportGuard(const ImportRules& rules) {
    const bp::object real_import = bp::import("builtins").attr("__import__");
    return bp::raw_function([rules, real_import](bp::tuple args, bp::dict kwargs) -> bp::object {
        const auto argc = bp::len(args);
        const std::string name = bp::extract<std::string>(args[0]);

        int level = 0;
        if (argc > 4) {
            level = bp::extract<int>(args[4]);
        } else if (kwargs.has_key("level")) {
            level = bp::extract<int>(kwargs["level"]);
        }
        if (level != 0) {
            RaiseImportError("relative imports are not permitted in the sandbox");
        }

        auto violation = rules.Check(name);
        // "import a.b" binds the top-level package, so it must pass on its own.
        bp::object fromlist;
        if (argc > 3) {
            fromlist = args[3];
        } else {
            fromlist = kwargs.get("fromlist");
        }
        if (!violation && IsEmptyFromList(fromlist) && name.find('.') != std::string::npos) {
            violation = rules.Check(utils::TopLevelName(name));
        }
        if (violation) {
            RaiseImportError(violation->Message());
        }

        return bp::object(bp::handle<>(PyObject_Call(real_import.ptr(), args.ptr(), kwargs.ptr())));
    }, 1);
}

bp::dict BuildCapabilityEnvironment(const config::Policy& policy,
                                    const ImportRules& rules,
                                    const Bindings& injected) {
    const bp::object builtins_module = bp::import("builtins");
    bp::dict safe_builtins;
    for (const auto& name : SafeBuiltinNames()) {
        if (PyObject_HasAttrString(builtins_module.ptr(), name.c_str())) {
            safe_builtins[name] = builtins_module.attr(name.c_str());
        }
    }
    safe_builtins["__import__"] = MakeImportGuard(rules);

    bp::dict environment;
    environment["__builtins__"] = safe_builtins;
    environment["__name__"] = "__sandbox__";

    for (const auto& module_name : policy.allowed_imports) {
        if (module_name.find('.') != std::string::npos || rules.Check(module_name)) {
            continue;
        }
        try {
            environment[module_name] = bp::import(module_name.c_str());
        } catch (const bp::error_already_set&) {
            const auto error = python::FetchError();
            utils::Log(utils::LogLevel::kWarn, "sandbox", "allowed module unavailable", {
                {"module", module_name},
                {"error", error.Describe()}
            });
        }
    }

    for (const auto& [name, value] : injected) {
        if (!IsSafeBinding(name, value)) {
            utils::Log(utils::LogLevel::kDebug, "sandbox", "injected binding skipped", {
                {"name", name}
            });
            continue;
        }
        environment[name] = value;
    }
    return environment;
}

}  // namespace pyfence::sandbox
