#include "sandbox/resource_limits.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <unistd.h>

#include "utils/logging.hpp"

namespace pyfence::sandbox {
namespace {

constexpr std::uint64_t kBytesPerMb = 1024ULL * 1024ULL;

// Cleared when the timer goes away, so a late pending call does nothing.
std::atomic<bool> g_deadline_armed{false};

int RaiseOnTrace(PyObject*, PyFrameObject*, int what, PyObject*) {
    if (what != PyTrace_LINE && what != PyTrace_CALL) {
        return 0;
    }
    PyErr_SetString(ExecutionTimeoutType(), "execution deadline exceeded");
    return -1;
}

int OnDeadline(void*) {
    if (!g_deadline_armed.load()) {
        return 0;
    }
    PyEval_SetTrace(RaiseOnTrace, nullptr);
    PyErr_SetString(ExecutionTimeoutType(), "execution deadline exceeded");
    return -1;
}

}  // namespace

PyObject* ExecutionTimeoutType() {
    static PyObject* type = PyErr_NewException("pyfence.ExecutionTimeout", PyExc_BaseException, nullptr);
    return type;
}

std::optional<std::uint64_t> CurrentAddressSpaceBytes() {
    std::ifstream statm("/proc/self/statm");
    std::uint64_t pages = 0;
    if (!(statm >> pages)) {
        return std::nullopt;
    }
    const long page_size = ::sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        return std::nullopt;
    }
    return pages * static_cast<std::uint64_t>(page_size);
}

MemoryCeiling::MemoryCeiling(unsigned max_memory_mb) {
    if (::getrlimit(RLIMIT_AS, &previous_) != 0) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "memory ceiling unavailable", {
            {"error", std::strerror(errno)}
        });
        return;
    }

    const auto baseline = CurrentAddressSpaceBytes().value_or(0);
    std::uint64_t limit = baseline + static_cast<std::uint64_t>(max_memory_mb) * kBytesPerMb;
    if (previous_.rlim_max != RLIM_INFINITY && limit > previous_.rlim_max) {
        limit = previous_.rlim_max;
    }

    // Only the soft limit moves, so the previous value can be restored.
    struct rlimit ceiling = previous_;
    ceiling.rlim_cur = static_cast<rlim_t>(limit);
    if (::setrlimit(RLIMIT_AS, &ceiling) != 0) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "memory ceiling not applied", {
            {"limit_bytes", std::to_string(limit)},
            {"error", std::strerror(errno)}
        });
        return;
    }
    applied_ = true;
    limit_bytes_ = limit;
}

MemoryCeiling::~MemoryCeiling() {
    if (!applied_) {
        return;
    }
    if (::setrlimit(RLIMIT_AS, &previous_) != 0) {
        utils::Log(utils::LogLevel::kError, "sandbox", "failed to restore address space limit", {
            {"error", std::strerror(errno)}
        });
    }
}

DeadlineTimer::DeadlineTimer(std::chrono::milliseconds budget)
    : target_thread_(PyThread_get_thread_ident()) {
    ExecutionTimeoutType();
    g_deadline_armed.store(true);
    const auto deadline = std::chrono::steady_clock::now() + budget;
    watcher_ = std::thread([this, deadline] { Watch(deadline); });
}

DeadlineTimer::~DeadlineTimer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
    if (watcher_.joinable()) {
        // The watcher may be waiting for the GIL.
        Py_BEGIN_ALLOW_THREADS
        watcher_.join();
        Py_END_ALLOW_THREADS
    }
    g_deadline_armed.store(false);
    if (delivered_) {
        PyThreadState_SetAsyncExc(target_thread_, nullptr);
        PyEval_SetTrace(nullptr, nullptr);
    }
}

void DeadlineTimer::Watch(std::chrono::steady_clock::time_point deadline) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_until(lock, deadline, [this] { return cancelled_; })) {
            return;
        }
        expired_.store(true);
    }

    // Never wait for the GIL while holding mutex_: the owner locks it with the
    // GIL held.
    const PyGILState_STATE gil = PyGILState_Ensure();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            delivered_ = true;
            // The async exception trips the eval breaker from this thread; the
            // pending call then runs on the interpreter thread and installs
            // the trace hook.
            if (PyThreadState_SetAsyncExc(target_thread_, ExecutionTimeoutType()) != 1) {
                utils::Log(utils::LogLevel::kError, "sandbox", "deadline not delivered", {
                    {"thread", std::to_string(target_thread_)}
                });
            }
            if (Py_AddPendingCall(OnDeadline, nullptr) != 0) {
                utils::Log(utils::LogLevel::kWarn, "sandbox", "deadline trace hook not scheduled");
            }
        }
    }
    PyGILState_Release(gil);
}

}  // namespace pyfence::sandbox
