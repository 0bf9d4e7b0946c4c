#pragma once

#include <string>

#include <boost/python.hpp>

namespace pyfence::python {

// Starts the embedded interpreter once per process. Python's own signal
// handlers are not installed. Every pyfence call that touches Python must run
// on the thread that first called this.
void EnsureInterpreter();

// A Python exception taken off the interpreter's error indicator.
struct PythonError {
    std::string type_name;
    std::string message;
    boost::python::object type;

    bool Is(PyObject* exception_type) const;
    // "ValueError: bad value"
    std::string Describe() const;
};

// Clears the current error indicator and returns it as a value.
PythonError FetchError();

// str(obj) / repr(obj) that never throw; failures yield a placeholder.
std::string ToText(const boost::python::object& obj);
std::string Repr(const boost::python::object& obj);

}  // namespace pyfence::python
