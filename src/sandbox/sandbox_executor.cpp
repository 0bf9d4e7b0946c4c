#include "sandbox/sandbox_executor.hpp"

#include <atomic>
#include <chrono>
#include <exception>

#include "config/config_loader.hpp"
#include "python/interpreter.hpp"
#include "sandbox/capability_environment.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/resource_limits.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pyfence::sandbox {
namespace bp = boost::python;
namespace {

std::atomic<bool> g_execution_active{false};

// Holds the process-wide execution flag for one call.
class ExecutionSlot {
public:
    ExecutionSlot() : acquired_(!g_execution_active.exchange(true)) {}
    ~ExecutionSlot() {
        if (acquired_) {
            g_execution_active.store(false);
        }
    }

    ExecutionSlot(const ExecutionSlot&) = delete;
    ExecutionSlot& operator=(const ExecutionSlot&) = delete;

    bool Acquired() const { return acquired_; }

private:
    bool acquired_;
};

struct RunOutcome {
    bool ok = false;
    python::PythonError error;
};

RunOutcome Run(const std::string& code, const bp::dict& ns) {
    RunOutcome outcome;
    bp::handle<> compiled(bp::allow_null(Py_CompileString(code.c_str(), "<sandbox>", Py_file_input)));
    if (!compiled) {
        outcome.error = python::FetchError();
        return outcome;
    }
    bp::handle<> value(bp::allow_null(PyEval_EvalCode(compiled.get(), ns.ptr(), ns.ptr())));
    if (!value) {
        outcome.error = python::FetchError();
        return outcome;
    }
    outcome.ok = true;
    return outcome;
}

// Sandboxed runs hide dunder names and the print override.
Bindings CollectBindings(const bp::dict& ns, bool sandboxed) {
    Bindings bindings;
    PyObject* key = nullptr;
    PyObject* value = nullptr;
    Py_ssize_t position = 0;
    while (PyDict_Next(ns.ptr(), &position, &key, &value)) {
        if (!PyUnicode_Check(key)) {
            continue;
        }
        const char* raw = PyUnicode_AsUTF8(key);
        if (raw == nullptr) {
            PyErr_Clear();
            continue;
        }
        const std::string name(raw);
        if (name == "__builtins__") {
            continue;
        }
        if (sandboxed && (utils::StartsWith(name, "__") || name == "print")) {
            continue;
        }
        bindings.emplace(name, bp::object(bp::handle<>(bp::borrowed(value))));
    }
    return bindings;
}

std::string SummarizeViolations(const std::vector<Violation>& violations) {
    std::vector<std::string> messages;
    messages.reserve(violations.size());
    for (const auto& violation : violations) {
        messages.push_back(violation.Message());
    }
    return "Security violations: " + utils::Join(messages, "; ");
}

void Fail(ExecutionResult& result, FailureKind kind, std::string error) {
    result.success = false;
    result.failure = kind;
    result.error = std::move(error);
    result.return_value.reset();
}

}  // namespace

SandboxExecutor::SandboxExecutor(config::Policy policy)
    : policy_(std::move(policy)) {
    config::ValidatePolicy(policy_);
    python::EnsureInterpreter();
    validator_ = std::make_unique<SecurityValidator>(policy_);
}

SandboxExecutor SandboxExecutor::FromFile(const std::filesystem::path& policy_path) {
    return SandboxExecutor(config::LoadPolicy(policy_path));
}

std::vector<Violation> SandboxExecutor::Validate(const std::string& code) const {
    return validator_->Validate(code);
}

ExecutionResult SandboxExecutor::Execute(const ExecutionRequest& request) const {
    return Execute(request, policy_.sandboxed ? ExecutionMode::kSandboxed : ExecutionMode::kDirect);
}

ExecutionResult SandboxExecutor::Execute(const ExecutionRequest& request, ExecutionMode mode) const {
    const auto started = std::chrono::steady_clock::now();
    ExecutionResult result;

    if (!policy_.enabled) {
        Fail(result, FailureKind::kDisabled, "execution disabled");
        return result;
    }

    ExecutionSlot slot;
    if (!slot.Acquired()) {
        Fail(result, FailureKind::kBusy, "sandbox busy: another execution is running in this process");
        utils::Log(utils::LogLevel::kWarn, "sandbox", "refused overlapping execution");
        return result;
    }

    utils::Log(utils::LogLevel::kInfo, "sandbox", "execute", {
        {"mode", ToString(mode)},
        {"bytes", std::to_string(request.code.size())}
    });

    try {
        auto violations = validator_->Validate(request.code);
        if (!violations.empty()) {
            utils::Log(utils::LogLevel::kWarn, "sandbox", "refused", {
                {"violations", std::to_string(violations.size())}
            });
            Fail(result, FailureKind::kSecurityViolation, SummarizeViolations(violations));
            result.violations = std::move(violations);
            return result;
        }
        result = mode == ExecutionMode::kSandboxed ? ExecuteSandboxed(request) : ExecuteDirect(request);
    } catch (const bp::error_already_set&) {
        const auto error = python::FetchError();
        Fail(result, FailureKind::kRuntimeFault, "Execution error: " + error.Describe());
    } catch (const std::exception& ex) {
        Fail(result, FailureKind::kRuntimeFault, std::string("Execution error: ") + ex.what());
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    utils::Log(utils::LogLevel::kInfo, "sandbox", "finished", {
        {"success", result.success ? "true" : "false"},
        {"failure", ToString(result.failure)},
        {"elapsed_ms", std::to_string(result.elapsed.count())}
    });
    return result;
}

ExecutionResult SandboxExecutor::ExecuteSandboxed(const ExecutionRequest& request) const {
    ExecutionResult result;
    OutputCapture capture;
    bp::dict ns = BuildCapabilityEnvironment(policy_, validator_->Imports(), request.injected_bindings);
    ns["print"] = capture.PrintFunction();

    RunOutcome outcome;
    bool timed_out = false;
    {
        // Watchdog thread first: its stack must not count against the ceiling.
        DeadlineTimer timer(std::chrono::seconds(policy_.timeout_seconds));
        MemoryCeiling ceiling(policy_.max_memory_mb);
        outcome = Run(request.code, ns);
        timed_out = timer.Expired();
    }

    result.stdout_text = capture.Text();
    result.exported_bindings = CollectBindings(ns, true);

    if (timed_out || (!outcome.ok && outcome.error.Is(ExecutionTimeoutType()))) {
        Fail(result, FailureKind::kTimeout,
             "Code execution timed out after " + std::to_string(policy_.timeout_seconds) + " seconds");
        return result;
    }
    if (!outcome.ok && outcome.error.Is(PyExc_MemoryError)) {
        Fail(result, FailureKind::kResourceExceeded,
             "Code execution exceeded memory limit (" + std::to_string(policy_.max_memory_mb) + " MB)");
        return result;
    }
    if (!outcome.ok) {
        Fail(result, FailureKind::kRuntimeFault, "Execution error: " + outcome.error.Describe());
        return result;
    }

    result.success = true;
    if (ns.has_key("result")) {
        result.return_value = bp::object(ns["result"]);
    }
    return result;
}

ExecutionResult SandboxExecutor::ExecuteDirect(const ExecutionRequest& request) const {
    ExecutionResult result;
    OutputCapture capture;
    bp::dict ns;
    for (const auto& [name, value] : request.injected_bindings) {
        ns[name] = value;
    }
    if (!ns.has_key("__builtins__")) {
        ns["__builtins__"] = bp::import("builtins");
    }

    const auto outcome = Run(request.code, ns);
    result.stdout_text = capture.Text();
    result.exported_bindings = CollectBindings(ns, false);

    if (!outcome.ok) {
        Fail(result, FailureKind::kRuntimeFault, "Execution error: " + outcome.error.Describe());
        return result;
    }

    result.success = true;
    if (ns.has_key("result")) {
        result.return_value = bp::object(ns["result"]);
    }
    return result;
}

}  // namespace pyfence::sandbox
