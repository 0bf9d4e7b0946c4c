#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>

#include "utils/logging.hpp"

namespace pyfence::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ReadBool(const nlohmann::json& section, const char* key, bool fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto& value = section[key];
    if (!value.is_boolean()) {
        throw ConfigError(std::string("policy key '") + key + "' must be a boolean");
    }
    return value.get<bool>();
}

unsigned ReadUnsigned(const nlohmann::json& section, const char* key, unsigned fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto& value = section[key];
    if (!value.is_number_integer()) {
        throw ConfigError(std::string("policy key '") + key + "' must be an integer");
    }
    const auto number = value.get<long long>();
    if (number < 0 || number > static_cast<long long>(std::numeric_limits<unsigned>::max())) {
        throw ConfigError(std::string("policy key '") + key + "' is out of range");
    }
    return static_cast<unsigned>(number);
}

std::set<std::string> ReadNames(const nlohmann::json& section, const char* key,
                                const std::set<std::string>& fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto& value = section[key];
    if (!value.is_array()) {
        throw ConfigError(std::string("policy key '") + key + "' must be an array of strings");
    }
    std::set<std::string> names;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ConfigError(std::string("policy key '") + key + "' must be an array of strings");
        }
        names.insert(item.get<std::string>());
    }
    return names;
}

bool ParseBool(const std::string& name, const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    throw ConfigError(name + " is not a boolean: " + value);
}

unsigned ParseUnsigned(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto number = std::stoul(value, &consumed);
        if (consumed != value.size() || number > std::numeric_limits<unsigned>::max()) {
            throw ConfigError(name + " is not a valid count: " + value);
        }
        return static_cast<unsigned>(number);
    } catch (const std::logic_error&) {
        throw ConfigError(name + " is not a valid count: " + value);
    }
}

void ApplyEnvOverrides(Policy& policy) {
    const auto enabled = GetEnvFallback(
        "PYFENCE_CODE_EXECUTION__ENABLE_EXECUTION",
        "PYFENCE_ENABLE_EXECUTION");
    if (!enabled.empty()) {
        policy.enabled = ParseBool("PYFENCE_ENABLE_EXECUTION", enabled);
    }

    const auto timeout = GetEnvFallback(
        "PYFENCE_CODE_EXECUTION__TIMEOUT_SECONDS",
        "PYFENCE_TIMEOUT_SECONDS");
    if (!timeout.empty()) {
        policy.timeout_seconds = ParseUnsigned("PYFENCE_TIMEOUT_SECONDS", timeout);
    }

    const auto max_memory = GetEnvFallback(
        "PYFENCE_CODE_EXECUTION__MAX_MEMORY_MB",
        "PYFENCE_MAX_MEMORY_MB");
    if (!max_memory.empty()) {
        policy.max_memory_mb = ParseUnsigned("PYFENCE_MAX_MEMORY_MB", max_memory);
    }
}

}  // namespace

std::filesystem::path DefaultPolicyPath() {
    const auto configured = GetEnv("PYFENCE_POLICY_PATH");
    if (!configured.empty()) {
        return std::filesystem::path(configured);
    }
    return GetHomePath() / ".pyfence" / "settings.json";
}

Policy ParsePolicy(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ConfigError("policy document must be a JSON object");
    }
    const nlohmann::json* section = &data;
    if (data.contains("code_execution")) {
        if (!data["code_execution"].is_object()) {
            throw ConfigError("policy key 'code_execution' must be an object");
        }
        section = &data["code_execution"];
    }

    Policy policy{};
    policy.enabled = ReadBool(*section, "enable_execution", policy.enabled);
    policy.sandboxed = ReadBool(*section, "sandboxed", policy.sandboxed);
    policy.timeout_seconds = ReadUnsigned(*section, "timeout_seconds", policy.timeout_seconds);
    policy.max_memory_mb = ReadUnsigned(*section, "max_memory_mb", policy.max_memory_mb);
    policy.allowed_imports = ReadNames(*section, "allowed_imports", policy.allowed_imports);
    policy.blocked_imports = ReadNames(*section, "blocked_imports", policy.blocked_imports);
    policy.allowed_file_operations = ReadNames(
        *section, "allowed_file_operations", policy.allowed_file_operations);
    policy.restricted_paths = ReadNames(*section, "restricted_paths", policy.restricted_paths);
    policy.blocked_attributes = ReadNames(*section, "blocked_attributes", policy.blocked_attributes);
    return policy;
}

void ValidatePolicy(const Policy& policy) {
    if (policy.timeout_seconds == 0) {
        throw ConfigError("timeout_seconds must be greater than zero");
    }
    if (policy.max_memory_mb == 0) {
        throw ConfigError("max_memory_mb must be greater than zero");
    }
}

Policy LoadPolicy(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ConfigError("cannot open policy file: " + path.string());
    }

    nlohmann::json data;
    try {
        input >> data;
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigError("malformed policy file " + path.string() + ": " + ex.what());
    }

    auto policy = ParsePolicy(data);
    ApplyEnvOverrides(policy);
    ValidatePolicy(policy);

    utils::Log(utils::LogLevel::kInfo, "config", "policy loaded", {
        {"path", path.string()},
        {"enabled", policy.enabled ? "true" : "false"},
        {"sandboxed", policy.sandboxed ? "true" : "false"},
        {"timeout_s", std::to_string(policy.timeout_seconds)},
        {"max_memory_mb", std::to_string(policy.max_memory_mb)}
    });
    return policy;
}

}  // namespace pyfence::config
