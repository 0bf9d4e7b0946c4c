#include "cli/result_json.hpp"

#include "python/interpreter.hpp"

namespace pyfence::cli {
namespace bp = boost::python;

nlohmann::json ToJson(const bp::object& value, int depth) {
    PyObject* raw = value.ptr();
    if (depth > kMaxJsonDepth) {
        return python::Repr(value);
    }
    if (raw == Py_None) {
        return nullptr;
    }
    if (PyBool_Check(raw)) {
        return raw == Py_True;
    }
    if (PyLong_Check(raw)) {
        const long long number = PyLong_AsLongLong(raw);
        if (number == -1 && PyErr_Occurred()) {
            PyErr_Clear();
            return python::Repr(value);
        }
        return number;
    }
    if (PyFloat_Check(raw)) {
        return PyFloat_AsDouble(raw);
    }
    if (PyUnicode_Check(raw)) {
        return python::ToText(value);
    }
    if (PyList_Check(raw) || PyTuple_Check(raw)) {
        nlohmann::json items = nlohmann::json::array();
        const auto size = bp::len(value);
        for (Py_ssize_t i = 0; i < size; ++i) {
            items.push_back(ToJson(bp::object(value[i]), depth + 1));
        }
        return items;
    }
    if (PyDict_Check(raw)) {
        nlohmann::json fields = nlohmann::json::object();
        PyObject* key = nullptr;
        PyObject* item = nullptr;
        Py_ssize_t position = 0;
        while (PyDict_Next(raw, &position, &key, &item)) {
            const bp::object key_object(bp::handle<>(bp::borrowed(key)));
            const auto name = PyUnicode_Check(key) ? python::ToText(key_object)
                                                   : python::Repr(key_object);
            fields[name] = ToJson(bp::object(bp::handle<>(bp::borrowed(item))), depth + 1);
        }
        return fields;
    }
    return python::Repr(value);
}

nlohmann::json BuildResultJson(const sandbox::ExecutionResult& result) {
    nlohmann::json globals = nlohmann::json::object();
    for (const auto& [name, value] : result.exported_bindings) {
        globals[name] = ToJson(value);
    }
    nlohmann::json violations = nlohmann::json::array();
    for (const auto& violation : result.violations) {
        violations.push_back({
            {"kind", sandbox::ToString(violation.Kind())},
            {"message", violation.Message()}
        });
    }
    return {
        {"success", result.success},
        {"stdout", result.stdout_text},
        {"error", result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr)},
        {"failure", sandbox::ToString(result.failure)},
        {"result", result.return_value ? ToJson(*result.return_value) : nlohmann::json(nullptr)},
        {"globals", globals},
        {"violations", violations},
        {"elapsed_ms", result.elapsed.count()}
    };
}

}  // namespace pyfence::cli
