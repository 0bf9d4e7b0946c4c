#include "config/config_loader.hpp"

#include <cstdlib>
#include <optional>

#include <gtest/gtest.h>

#include "sandbox/scoped_temp_file.hpp"

namespace pyfence::config {
namespace {

using sandbox::ScopedTempFile;

// Sets an environment variable for one test and puts the old value back.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        if (const char* previous = std::getenv(name)) {
            previous_ = std::string(previous);
        }
        ::setenv(name, value, 1);
    }
    ~EnvGuard() {
        if (previous_) {
            ::setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {
                 "PYFENCE_ENABLE_EXECUTION", "PYFENCE_TIMEOUT_SECONDS", "PYFENCE_MAX_MEMORY_MB",
                 "PYFENCE_CODE_EXECUTION__ENABLE_EXECUTION",
                 "PYFENCE_CODE_EXECUTION__TIMEOUT_SECONDS",
                 "PYFENCE_CODE_EXECUTION__MAX_MEMORY_MB"}) {
            ::unsetenv(name);
        }
    }
};

TEST_F(ConfigLoaderTest, EmptyDocumentYieldsDefaults) {
    ScopedTempFile file(".json", "{}");
    const auto policy = LoadPolicy(file.Path());
    EXPECT_TRUE(policy.enabled);
    EXPECT_TRUE(policy.sandboxed);
    EXPECT_EQ(policy.timeout_seconds, 10u);
    EXPECT_EQ(policy.max_memory_mb, 100u);
    EXPECT_TRUE(policy.allowed_imports.empty());
    EXPECT_TRUE(policy.blocked_imports.empty());
    EXPECT_EQ(policy.allowed_file_operations, std::set<std::string>{"read"});
}

TEST_F(ConfigLoaderTest, ReadsTopLevelKeys) {
    ScopedTempFile file(".json", R"({
        "enable_execution": true,
        "sandboxed": false,
        "timeout_seconds": 3,
        "max_memory_mb": 64,
        "allowed_imports": ["math", "json"],
        "blocked_imports": ["requests"],
        "restricted_paths": ["/etc"],
        "blocked_attributes": ["gi_frame"]
    })");
    const auto policy = LoadPolicy(file.Path());
    EXPECT_FALSE(policy.sandboxed);
    EXPECT_EQ(policy.timeout_seconds, 3u);
    EXPECT_EQ(policy.max_memory_mb, 64u);
    EXPECT_EQ(policy.allowed_imports, (std::set<std::string>{"json", "math"}));
    EXPECT_EQ(policy.blocked_imports, std::set<std::string>{"requests"});
    EXPECT_EQ(policy.restricted_paths, std::set<std::string>{"/etc"});
    EXPECT_EQ(policy.blocked_attributes, std::set<std::string>{"gi_frame"});
}

TEST_F(ConfigLoaderTest, ReadsCodeExecutionSection) {
    ScopedTempFile file(".json", R"({
        "model": "ignored",
        "code_execution": {
            "enable_execution": false,
            "timeout_seconds": 5,
            "allowed_file_operations": []
        }
    })");
    const auto policy = LoadPolicy(file.Path());
    EXPECT_FALSE(policy.enabled);
    EXPECT_EQ(policy.timeout_seconds, 5u);
    EXPECT_TRUE(policy.allowed_file_operations.empty());
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    std::filesystem::path path;
    {
        ScopedTempFile file(".json");
        path = file.Path();
    }
    EXPECT_THROW(LoadPolicy(path), ConfigError);
}

TEST_F(ConfigLoaderTest, MalformedJsonThrows) {
    ScopedTempFile file(".json", "{\"timeout_seconds\": ");
    EXPECT_THROW(LoadPolicy(file.Path()), ConfigError);
}

TEST_F(ConfigLoaderTest, WrongTypesThrow) {
    EXPECT_THROW(ParsePolicy(nlohmann::json::parse(R"({"timeout_seconds": "ten"})")), ConfigError);
    EXPECT_THROW(ParsePolicy(nlohmann::json::parse(R"({"sandboxed": 1})")), ConfigError);
    EXPECT_THROW(ParsePolicy(nlohmann::json::parse(R"({"allowed_imports": ["math", 3]})")), ConfigError);
    EXPECT_THROW(ParsePolicy(nlohmann::json::parse(R"({"max_memory_mb": -1})")), ConfigError);
    EXPECT_THROW(ParsePolicy(nlohmann::json::parse(R"({"code_execution": []})")), ConfigError);
    EXPECT_THROW(ParsePolicy(nlohmann::json::parse("[]")), ConfigError);
}

TEST_F(ConfigLoaderTest, NonPositiveLimitsAreRejected) {
    ScopedTempFile zero_timeout(".json", R"({"timeout_seconds": 0})");
    EXPECT_THROW(LoadPolicy(zero_timeout.Path()), ConfigError);

    Policy policy;
    policy.max_memory_mb = 0;
    EXPECT_THROW(ValidatePolicy(policy), ConfigError);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    ScopedTempFile file(".json", R"({"timeout_seconds": 30, "max_memory_mb": 256})");
    EnvGuard timeout("PYFENCE_TIMEOUT_SECONDS", "2");
    EnvGuard enabled("PYFENCE_ENABLE_EXECUTION", "off");
    const auto policy = LoadPolicy(file.Path());
    EXPECT_EQ(policy.timeout_seconds, 2u);
    EXPECT_EQ(policy.max_memory_mb, 256u);
    EXPECT_FALSE(policy.enabled);
}

TEST_F(ConfigLoaderTest, NestedEnvironmentNameWins) {
    ScopedTempFile file(".json", "{}");
    EnvGuard flat("PYFENCE_MAX_MEMORY_MB", "64");
    EnvGuard nested("PYFENCE_CODE_EXECUTION__MAX_MEMORY_MB", "48");
    EXPECT_EQ(LoadPolicy(file.Path()).max_memory_mb, 48u);
}

TEST_F(ConfigLoaderTest, UnparsableOverrideThrows) {
    ScopedTempFile file(".json", "{}");
    {
        EnvGuard timeout("PYFENCE_TIMEOUT_SECONDS", "soon");
        EXPECT_THROW(LoadPolicy(file.Path()), ConfigError);
    }
    {
        EnvGuard enabled("PYFENCE_ENABLE_EXECUTION", "maybe");
        EXPECT_THROW(LoadPolicy(file.Path()), ConfigError);
    }
}

TEST_F(ConfigLoaderTest, DefaultPathHonorsEnvironment) {
    EnvGuard path("PYFENCE_POLICY_PATH", "/tmp/pyfence-policy.json");
    EXPECT_EQ(DefaultPolicyPath(), std::filesystem::path("/tmp/pyfence-policy.json"));
}

}  // namespace
}  // namespace pyfence::config
