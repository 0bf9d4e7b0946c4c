#pragma once

#include <string>

#include <boost/python.hpp>

namespace pyfence::sandbox {

// Points sys.stdout at an in-memory buffer for the lifetime of the object and
// puts the previous stream back afterwards. sys.stdout is process state, so
// captures must not overlap.
class OutputCapture {
public:
    OutputCapture();
    ~OutputCapture();

    OutputCapture(const OutputCapture&) = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;

    // print() that always writes to the buffer, for guest namespaces that do
    // not see the host's builtins. A file= argument is overridden.
    boost::python::object PrintFunction() const;

    std::string Text() const;

private:
    boost::python::object buffer_;
    boost::python::object saved_stdout_;
    bool had_stdout_ = false;
};

}  // namespace pyfence::sandbox
