#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/execution_types.hpp"
#include "sandbox/security_validator.hpp"

namespace pyfence::sandbox {

// Validates guest code and runs it under the policy's restrictions.
//
// Limits, the deadline watchdog and output redirection are process state:
// one execution at a time per process. A call that overlaps another returns
// FailureKind::kBusy. Use from the thread that started the interpreter.
class SandboxExecutor {
public:
    // Throws config::ConfigError when the policy's numeric bounds are invalid.
    explicit SandboxExecutor(config::Policy policy);

    // Loads the policy file; throws config::ConfigError on any problem.
    static SandboxExecutor FromFile(const std::filesystem::path& policy_path);

    // Never throws. The mode defaults to the policy's sandboxed flag.
    ExecutionResult Execute(const ExecutionRequest& request) const;
    ExecutionResult Execute(const ExecutionRequest& request, ExecutionMode mode) const;

    std::vector<Violation> Validate(const std::string& code) const;

    const config::Policy& GetPolicy() const { return policy_; }
    SecurityValidator& Validator() { return *validator_; }

private:
    ExecutionResult ExecuteSandboxed(const ExecutionRequest& request) const;
    ExecutionResult ExecuteDirect(const ExecutionRequest& request) const;

    config::Policy policy_;
    std::unique_ptr<SecurityValidator> validator_;
};

}  // namespace pyfence::sandbox
