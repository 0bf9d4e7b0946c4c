#include "sandbox/sandbox_executor.hpp"

#include <gtest/gtest.h>

#include "config/config_loader.hpp"
#include "python/interpreter.hpp"

namespace pyfence::sandbox {
namespace {

namespace bp = boost::python;

class SandboxExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        python::EnsureInterpreter();
        policy_.timeout_seconds = 2;
        policy_.max_memory_mb = 64;
        policy_.blocked_imports = {"requests"};
    }

    ExecutionResult Run(const std::string& code, ExecutionMode mode = ExecutionMode::kSandboxed) const {
        SandboxExecutor executor(policy_);
        ExecutionRequest request;
        request.code = code;
        return executor.Execute(request, mode);
    }

    config::Policy policy_;
};

TEST_F(SandboxExecutorTest, ResultBindingBecomesReturnValue) {
    const auto result = Run("result = 2 + 2\n");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.failure, FailureKind::kNone);
    EXPECT_FALSE(result.error.has_value());
    ASSERT_TRUE(result.return_value.has_value());
    EXPECT_EQ(bp::extract<int>(*result.return_value)(), 4);
}

TEST_F(SandboxExecutorTest, NoResultBindingMeansNoReturnValue) {
    const auto result = Run("value = 1\n");
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.return_value.has_value());
}

TEST_F(SandboxExecutorTest, PrintedOutputIsCapturedAndHostStreamKept) {
    PyObject* host_stdout = PySys_GetObject("stdout");
    const auto result = Run("print('hi')\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "hi\n");
    EXPECT_EQ(PySys_GetObject("stdout"), host_stdout);
}

TEST_F(SandboxExecutorTest, BlockedImportIsRefusedBeforeRunning) {
    const auto result = Run("print('ran')\nimport requests\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, FailureKind::kSecurityViolation);
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_EQ(result.error.value_or(""), "Security violations: Blocked import: requests");
    ASSERT_EQ(result.violations.size(), 1u);
    EXPECT_EQ(result.violations[0].Kind(), ViolationKind::kBlockedImport);
    EXPECT_FALSE(result.return_value.has_value());
}

TEST_F(SandboxExecutorTest, ReflectionChainIsRefused) {
    const auto result = Run("result = ().__class__.__bases__[0].__subclasses__()\n");
    EXPECT_EQ(result.failure, FailureKind::kSecurityViolation);
    EXPECT_EQ(result.violations.size(), 3u);
    EXPECT_FALSE(result.return_value.has_value());
}

TEST_F(SandboxExecutorTest, BuiltinOwnerModuleIsUnreachable) {
    const auto read = Run("result = len.__self__.open('/etc/hostname').read()\n");
    EXPECT_EQ(read.failure, FailureKind::kSecurityViolation);
    EXPECT_FALSE(read.return_value.has_value());

    const auto reach = Run(
        "B = len.__self__\n"
        "m = B.getattr(B, '__imp' + 'ort__')('os')\n"
        "result = m.getcwd()\n");
    EXPECT_EQ(reach.failure, FailureKind::kSecurityViolation);
    EXPECT_FALSE(reach.return_value.has_value());
}

TEST_F(SandboxExecutorTest, GuestPrintDoesNotExposeRealPrint) {
    const auto result = Run("result = print.func\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, FailureKind::kRuntimeFault);
    EXPECT_EQ(result.error.value_or("").rfind("Execution error: AttributeError", 0), 0u);
    EXPECT_FALSE(result.return_value.has_value());
}

TEST_F(SandboxExecutorTest, TracebackFramesAreUnreachable) {
    const auto result = Run(
        "try:\n"
        "    1 / 0\n"
        "except ZeroDivisionError as e:\n"
        "    result = e.__traceback__.tb_frame.f_globals\n");
    EXPECT_EQ(result.failure, FailureKind::kSecurityViolation);
    EXPECT_EQ(result.violations.size(), 3u);
}

TEST_F(SandboxExecutorTest, SpawningMethodRefusedWithAllowedReceiver) {
    policy_.allowed_imports = {"subprocess"};
    const auto result = Run("import subprocess\nsubprocess.check_output(['id'])\n");
    EXPECT_EQ(result.failure, FailureKind::kSecurityViolation);
    EXPECT_EQ(result.error.value_or(""), "Security violations: Dangerous method call: check_output");
}

TEST_F(SandboxExecutorTest, InfiniteLoopTimesOut) {
    policy_.timeout_seconds = 1;
    const auto result = Run("result = 1\nwhile True:\n    pass\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, FailureKind::kTimeout);
    EXPECT_EQ(result.error.value_or(""), "Code execution timed out after 1 seconds");
    EXPECT_FALSE(result.return_value.has_value());
    EXPECT_GE(result.elapsed.count(), 1000);
}

TEST_F(SandboxExecutorTest, TimeoutCannotBeSwallowed) {
    policy_.timeout_seconds = 1;
    const auto result = Run(
        "caught = 0\n"
        "while True:\n"
        "    try:\n"
        "        while True:\n"
        "            pass\n"
        "    except:\n"
        "        caught += 1\n");
    EXPECT_EQ(result.failure, FailureKind::kTimeout);
}

TEST_F(SandboxExecutorTest, InterpreterUsableAfterTimeout) {
    policy_.timeout_seconds = 1;
    ASSERT_EQ(Run("while True:\n    pass\n").failure, FailureKind::kTimeout);

    const auto result = Run("total = 0\nfor i in range(1000):\n    total += i\nresult = total\n");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(bp::extract<int>(*result.return_value)(), 499500);
}

TEST_F(SandboxExecutorTest, LargeAllocationHitsMemoryCeiling) {
    policy_.max_memory_mb = 32;
    const auto result = Run("n = 512 * 1024 * 1024\ndata = bytearray(n)\nresult = len(data)\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, FailureKind::kResourceExceeded);
    EXPECT_EQ(result.error.value_or(""), "Code execution exceeded memory limit (32 MB)");
    EXPECT_FALSE(result.return_value.has_value());
}

TEST_F(SandboxExecutorTest, GuestExceptionIsRuntimeFault) {
    const auto result = Run("print('before')\nraise ValueError('boom')\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, FailureKind::kRuntimeFault);
    EXPECT_EQ(result.error.value_or(""), "Execution error: ValueError: boom");
    EXPECT_EQ(result.stdout_text, "before\n");
}

TEST_F(SandboxExecutorTest, BuiltinsOutsideAllowListAreMissing) {
    const auto result = Run("result = getattr(3, 'real')\n");
    EXPECT_EQ(result.failure, FailureKind::kRuntimeFault);
    EXPECT_EQ(result.error.value_or(""), "Execution error: NameError: name 'getattr' is not defined");
}

TEST_F(SandboxExecutorTest, AllowedModuleIsBoundWithoutImport) {
    policy_.allowed_imports = {"math"};
    const auto result = Run("result = math.sqrt(9)\n");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_DOUBLE_EQ(bp::extract<double>(*result.return_value)(), 3.0);
}

TEST_F(SandboxExecutorTest, ExportedBindingsHideDunderNamesAndPrint) {
    SandboxExecutor executor(policy_);
    ExecutionRequest request;
    request.code = "a = 1\nb = [a, rows[0]]\n__hidden = 3\n";
    bp::list rows;
    rows.append(7);
    request.injected_bindings["rows"] = rows;
    request.injected_bindings["_token"] = bp::object("secret");

    const auto result = executor.Execute(request);
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.exported_bindings.count("a"), 1u);
    EXPECT_EQ(result.exported_bindings.count("b"), 1u);
    EXPECT_EQ(result.exported_bindings.count("rows"), 1u);
    EXPECT_EQ(result.exported_bindings.count("_token"), 0u);
    EXPECT_EQ(result.exported_bindings.count("__hidden"), 0u);
    EXPECT_EQ(result.exported_bindings.count("__builtins__"), 0u);
    EXPECT_EQ(result.exported_bindings.count("__name__"), 0u);
    EXPECT_EQ(result.exported_bindings.count("print"), 0u);
    EXPECT_EQ(bp::extract<int>(result.exported_bindings.at("b")[1])(), 7);
}

TEST_F(SandboxExecutorTest, NamespaceDoesNotLeakBetweenCalls) {
    SandboxExecutor executor(policy_);
    ExecutionRequest first;
    first.code = "leftover = 1\n";
    ASSERT_TRUE(executor.Execute(first).success);

    ExecutionRequest second;
    second.code = "result = leftover\n";
    const auto result = executor.Execute(second);
    EXPECT_EQ(result.failure, FailureKind::kRuntimeFault);
}

TEST_F(SandboxExecutorTest, DisabledPolicyRefusesEverything) {
    policy_.enabled = false;
    const auto result = Run("result = 1\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, FailureKind::kDisabled);
    EXPECT_EQ(result.error.value_or(""), "execution disabled");
    EXPECT_TRUE(result.violations.empty());
}

TEST_F(SandboxExecutorTest, OverlappingExecutionIsRefused) {
    SandboxExecutor executor(policy_);
    std::optional<ExecutionResult> inner;
    executor.Validator().RegisterChecker(NodeCategory::kCall,
        [&executor, &inner](const bp::object&, std::vector<Violation>&) {
            ExecutionRequest nested;
            nested.code = "result = 1\n";
            inner = executor.Execute(nested);
        });

    ExecutionRequest request;
    request.code = "result = abs(-3)\n";
    const auto outer = executor.Execute(request);
    ASSERT_TRUE(outer.success) << outer.error.value_or("");
    ASSERT_TRUE(inner.has_value());
    EXPECT_EQ(inner->failure, FailureKind::kBusy);
    EXPECT_FALSE(inner->success);
}

TEST_F(SandboxExecutorTest, DirectModeUsesFullBuiltins) {
    const auto result = Run("result = getattr(3, 'real')\n", ExecutionMode::kDirect);
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(bp::extract<int>(*result.return_value)(), 3);
}

TEST_F(SandboxExecutorTest, DirectModeStillValidatesAndCaptures) {
    auto result = Run("import requests\n", ExecutionMode::kDirect);
    EXPECT_EQ(result.failure, FailureKind::kSecurityViolation);

    result = Run("print('direct')\n", ExecutionMode::kDirect);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "direct\n");
}

TEST_F(SandboxExecutorTest, DirectModeExportsInjectedCallables) {
    policy_.sandboxed = false;
    SandboxExecutor executor(policy_);
    ExecutionRequest request;
    request.code = "result = helper([1, 2, 3])\n";
    request.injected_bindings["helper"] = bp::import("builtins").attr("len");

    const auto result = executor.Execute(request);
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(bp::extract<int>(*result.return_value)(), 3);
    EXPECT_EQ(result.exported_bindings.count("helper"), 1u);
    EXPECT_EQ(result.exported_bindings.count("__builtins__"), 0u);
}

TEST_F(SandboxExecutorTest, InvalidLimitsRejectedAtConstruction) {
    policy_.timeout_seconds = 0;
    EXPECT_THROW(SandboxExecutor executor(policy_), config::ConfigError);
}

}  // namespace
}  // namespace pyfence::sandbox
