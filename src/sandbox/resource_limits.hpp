#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

#include <Python.h>
#include <sys/resource.h>

namespace pyfence::sandbox {

// Exception type raised inside guest code when its deadline passes. Derives
// from BaseException so "except Exception" does not catch it.
PyObject* ExecutionTimeoutType();

// Virtual address space of this process, from /proc/self/statm.
std::optional<std::uint64_t> CurrentAddressSpaceBytes();

// Lowers the soft RLIMIT_AS to the current address space plus max_memory_mb
// and restores the previous soft limit on destruction. The limit is process
// wide, so only one ceiling may be active at a time.
class MemoryCeiling {
public:
    explicit MemoryCeiling(unsigned max_memory_mb);
    ~MemoryCeiling();

    MemoryCeiling(const MemoryCeiling&) = delete;
    MemoryCeiling& operator=(const MemoryCeiling&) = delete;

    bool Applied() const { return applied_; }
    std::uint64_t LimitBytes() const { return limit_bytes_; }

private:
    bool applied_ = false;
    struct rlimit previous_ {};
    std::uint64_t limit_bytes_ = 0;
};

// Watchdog for one run. When the budget is spent the watcher takes the GIL,
// raises ExecutionTimeout asynchronously in the interpreter thread and
// schedules a trace hook there that raises it again at every line until the
// run unwinds, so guest code cannot swallow it. Only bytecode is interrupted;
// a call blocked in native code has to return first.
//
// Construct, query and destroy on the thread that started the interpreter,
// with the GIL held.
class DeadlineTimer {
public:
    explicit DeadlineTimer(std::chrono::milliseconds budget);
    ~DeadlineTimer();

    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    bool Expired() const { return expired_.load(); }

private:
    void Watch(std::chrono::steady_clock::time_point deadline);

    unsigned long target_thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    bool delivered_ = false;
    std::atomic<bool> expired_{false};
    std::thread watcher_;
};

}  // namespace pyfence::sandbox
