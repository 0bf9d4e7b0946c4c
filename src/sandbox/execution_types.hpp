#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/python.hpp>

#include "sandbox/violation.hpp"

namespace pyfence::sandbox {

// A guest-language value.
using Value = boost::python::object;
using Bindings = std::map<std::string, Value>;

enum class ExecutionMode {
    kSandboxed,
    kDirect
};

enum class FailureKind {
    kNone,
    kDisabled,
    kBusy,
    kSecurityViolation,
    kTimeout,
    kResourceExceeded,
    kRuntimeFault
};

inline const char* ToString(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::kSandboxed: return "sandboxed";
        case ExecutionMode::kDirect: return "direct";
    }
    return "unknown";
}

inline const char* ToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::kNone: return "none";
        case FailureKind::kDisabled: return "disabled";
        case FailureKind::kBusy: return "busy";
        case FailureKind::kSecurityViolation: return "security_violation";
        case FailureKind::kTimeout: return "timeout";
        case FailureKind::kResourceExceeded: return "resource_exceeded";
        case FailureKind::kRuntimeFault: return "runtime_fault";
    }
    return "unknown";
}

struct ExecutionRequest {
    std::string code;
    Bindings injected_bindings;
};

struct ExecutionResult {
    bool success = false;
    std::string stdout_text;
    std::optional<std::string> error;
    std::optional<Value> return_value;
    Bindings exported_bindings;
    FailureKind failure = FailureKind::kNone;
    std::vector<Violation> violations;
    std::chrono::milliseconds elapsed{0};
};

}  // namespace pyfence::sandbox
