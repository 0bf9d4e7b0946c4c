#include "python/interpreter.hpp"

#include <mutex>

#include "utils/logging.hpp"

namespace pyfence::python {
namespace bp = boost::python;
namespace {

std::string UnicodeToString(PyObject* text) {
    if (text == nullptr) {
        PyErr_Clear();
        return "<unprintable>";
    }
    Py_ssize_t size = 0;
    const char* data = PyUnicode_AsUTF8AndSize(text, &size);
    if (data == nullptr) {
        PyErr_Clear();
        return "<unprintable>";
    }
    return std::string(data, static_cast<std::size_t>(size));
}

std::string Stringify(PyObject* obj, PyObject* (*convert)(PyObject*)) {
    if (obj == nullptr) {
        return "None";
    }
    bp::handle<> text(bp::allow_null(convert(obj)));
    return UnicodeToString(text.get());
}

}  // namespace

void EnsureInterpreter() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (Py_IsInitialized()) {
            return;
        }
        Py_InitializeEx(0);
        utils::Log(utils::LogLevel::kDebug, "python", "interpreter started", {
            {"version", Py_GetVersion()}
        });
    });
}

bool PythonError::Is(PyObject* exception_type) const {
    if (type.is_none() || exception_type == nullptr) {
        return false;
    }
    return PyErr_GivenExceptionMatches(type.ptr(), exception_type) != 0;
}

std::string PythonError::Describe() const {
    if (message.empty()) {
        return type_name;
    }
    return type_name + ": " + message;
}

PythonError FetchError() {
    PyObject* raw_type = nullptr;
    PyObject* raw_value = nullptr;
    PyObject* raw_traceback = nullptr;
    PyErr_Fetch(&raw_type, &raw_value, &raw_traceback);
    PyErr_NormalizeException(&raw_type, &raw_value, &raw_traceback);

    bp::handle<> type(bp::allow_null(raw_type));
    bp::handle<> value(bp::allow_null(raw_value));
    bp::handle<> traceback(bp::allow_null(raw_traceback));

    PythonError error;
    if (!type) {
        error.type_name = "UnknownError";
        error.message = "no exception was set";
        return error;
    }
    error.type = bp::object(type);
    if (PyType_Check(type.get())) {
        const char* name = reinterpret_cast<PyTypeObject*>(type.get())->tp_name;
        error.type_name = name ? name : "Exception";
    } else {
        error.type_name = "Exception";
    }
    if (value) {
        error.message = Stringify(value.get(), PyObject_Str);
    }
    return error;
}

std::string ToText(const bp::object& obj) {
    return Stringify(obj.ptr(), PyObject_Str);
}

std::string Repr(const bp::object& obj) {
    return Stringify(obj.ptr(), PyObject_Repr);
}

}  // namespace pyfence::python
