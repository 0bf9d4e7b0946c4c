#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "cli/result_json.hpp"
#include "config/config_loader.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace {

struct CliOptions {
    std::string command;
    std::string source;
    std::optional<std::string> policy_path;
    bool direct = false;
};

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  pyfence validate <file|-> [--policy <path>]\n"
              << "  pyfence run <file|-> [--policy <path>] [--direct]\n"
              << "  pyfence help\n"
              << "\n"
              << "The policy defaults to $PYFENCE_POLICY_PATH or ~/.pyfence/settings.json.\n";
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    if (argc < 2) {
        return std::nullopt;
    }
    CliOptions options;
    options.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--policy") {
            if (i + 1 >= argc) {
                return std::nullopt;
            }
            options.policy_path = argv[++i];
        } else if (arg == "--direct") {
            options.direct = true;
        } else if (options.source.empty()) {
            options.source = arg;
        } else {
            return std::nullopt;
        }
    }
    return options;
}

std::optional<std::string> ReadSource(const std::string& source) {
    std::ostringstream buffer;
    if (source == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream input(source);
    if (!input.is_open()) {
        return std::nullopt;
    }
    buffer << input.rdbuf();
    return buffer.str();
}

int RunValidate(const pyfence::sandbox::SandboxExecutor& executor, const std::string& code) {
    const auto violations = executor.Validate(code);
    for (const auto& violation : violations) {
        std::cout << pyfence::sandbox::ToString(violation.Kind()) << ": " << violation.Message() << std::endl;
    }
    if (violations.empty()) {
        std::cout << "OK" << std::endl;
        return 0;
    }
    return 1;
}

int RunExecute(const pyfence::sandbox::SandboxExecutor& executor, const std::string& code, bool direct) {
    pyfence::sandbox::ExecutionRequest request;
    request.code = code;
    const auto mode = direct ? pyfence::sandbox::ExecutionMode::kDirect
                             : pyfence::sandbox::ExecutionMode::kSandboxed;
    const auto result = executor.Execute(request, mode);
    std::cout << pyfence::cli::BuildResultJson(result).dump(2) << std::endl;
    return result.success ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = ParseArgs(argc, argv);
    if (!options || options->command == "help" || options->command == "--help") {
        PrintUsage();
        return options ? 0 : 2;
    }
    if (options->command != "validate" && options->command != "run") {
        std::cerr << "Unknown command: " << options->command << std::endl;
        PrintUsage();
        return 2;
    }
    if (options->source.empty()) {
        PrintUsage();
        return 2;
    }

    const auto code = ReadSource(options->source);
    if (!code) {
        std::cerr << "[cli] cannot read " << options->source << std::endl;
        return 2;
    }

    try {
        const auto policy_path = options->policy_path
            ? std::filesystem::path(*options->policy_path)
            : pyfence::config::DefaultPolicyPath();
        const auto executor = pyfence::sandbox::SandboxExecutor::FromFile(policy_path);
        if (options->command == "validate") {
            return RunValidate(executor, *code);
        }
        return RunExecute(executor, *code, options->direct);
    } catch (const pyfence::config::ConfigError& ex) {
        std::cerr << "[cli] configuration error: " << ex.what() << std::endl;
        return 2;
    }
}
