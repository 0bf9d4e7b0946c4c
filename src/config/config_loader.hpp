#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace pyfence::config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// PYFENCE_POLICY_PATH, else ~/.pyfence/settings.json.
std::filesystem::path DefaultPolicyPath();

// Reads the policy file and applies PYFENCE_* environment overrides.
// Throws ConfigError when the file is missing, unreadable or malformed.
Policy LoadPolicy(const std::filesystem::path& path);

// Builds a policy from an already parsed document. Accepts the keys at the top
// level or nested under "code_execution". Throws ConfigError on type mismatch.
Policy ParsePolicy(const nlohmann::json& data);

// Throws ConfigError unless timeout_seconds and max_memory_mb are positive.
void ValidatePolicy(const Policy& policy);

}  // namespace pyfence::config
