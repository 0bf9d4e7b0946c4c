#include "sandbox/output_capture.hpp"

#include "utils/logging.hpp"

namespace pyfence::sandbox {
namespace bp = boost::python;

OutputCapture::OutputCapture()
    : buffer_(bp::import("io").attr("StringIO")()) {
    PyObject* current = PySys_GetObject("stdout");
    if (current != nullptr) {
        saved_stdout_ = bp::object(bp::handle<>(bp::borrowed(current)));
        had_stdout_ = true;
    }
    if (PySys_SetObject("stdout", buffer_.ptr()) != 0) {
        bp::throw_error_already_set();
    }
}

OutputCapture::~OutputCapture() {
    PyObject* previous = had_stdout_ ? saved_stdout_.ptr() : nullptr;
    if (PySys_SetObject("stdout", previous) != 0) {
        PyErr_Clear();
        utils::Log(utils::LogLevel::kError, "sandbox", "failed to restore sys.stdout");
    }
}

bp::object OutputCapture::PrintFunction() const {
    const bp::object print = bp::import("builtins").attr("print");
    const bp::object buffer = buffer_;
    // A native callable: nothing on it leads back to the real print.
    return bp::raw_function([print, buffer](bp::tuple args, bp::dict kwargs) -> bp::object {
        kwargs["file"] = buffer;
        return bp::object(bp::handle<>(PyObject_Call(print.ptr(), args.ptr(), kwargs.ptr())));
    });
}

std::string OutputCapture::Text() const {
    return bp::extract<std::string>(buffer_.attr("getvalue")());
}

}  // namespace pyfence::sandbox
