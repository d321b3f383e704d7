#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
#if defined(_WIN32)
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
    FILE* pipe = _popen(command.c_str(), "r");
#else
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
    FILE* pipe = popen(command.c_str(), "r");
#endif
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

#if defined(_WIN32)
    const int status = _pclose(pipe);
    const int exit_code = status;
#else
    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
#endif

    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void set_environment(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void clear_environment(const char* name) {
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("ZKPIG_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "ZKPIG_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }

    const std::string executable = std::filesystem::path(executable_env).string();

    try {
        const auto defaults = run_cli(executable, "config");
        if (defaults.exit_code != 0) {
            std::cerr << "config failed. exit=" << defaults.exit_code << "\n" << defaults.output << std::endl;
            return 1;
        }
        if (!expect_contains(defaults.output, "\"data-dir\": \"data\"") ||
            !expect_contains(defaults.output, "\"dir\": \"data/preflight\"") ||
            !expect_contains(defaults.output, "\"content-type\": \"application/json\"") ||
            !expect_contains(defaults.output, "\"level\": \"info\"") ||
            !expect_contains(defaults.output, "\"id\": null")) {
            std::cerr << "Unexpected default configuration:\n" << defaults.output << std::endl;
            return 1;
        }

        const auto flags = run_cli(executable,
                                   "--chain-id 10 config --chain-rpc-url http://127.0.0.1:8545 "
                                   "--s3-bucket inputs --s3-secret-key s3cr3t --inputs-content-encoding gzip");
        if (flags.exit_code != 0 || !expect_contains(flags.output, "\"id\": 10") ||
            !expect_contains(flags.output, "\"rpc-url\": \"http://127.0.0.1:8545\"") ||
            !expect_contains(flags.output, "\"bucket\": \"inputs\"") ||
            !expect_contains(flags.output, "\"secret-key\": \"s3cr3t\"") ||
            !expect_contains(flags.output, "\"content-encoding\": \"gzip\"")) {
            std::cerr << "Flags were not reflected in the configuration. exit=" << flags.exit_code << "\n" << flags.output << std::endl;
            return 1;
        }

        set_environment("ZKPIG_DATA_DIR", "/srv/zkpig");
        set_environment("ZKPIG_LOG_FORMAT", "json");
        const auto from_env = run_cli(executable, "config");
        const auto overridden = run_cli(executable, "--data-dir /opt/zkpig config");
        clear_environment("ZKPIG_DATA_DIR");
        clear_environment("ZKPIG_LOG_FORMAT");

        if (from_env.exit_code != 0 || !expect_contains(from_env.output, "\"data-dir\": \"/srv/zkpig\"") ||
            !expect_contains(from_env.output, "\"dir\": \"/srv/zkpig/inputs\"") ||
            !expect_contains(from_env.output, "\"format\": \"json\"")) {
            std::cerr << "Environment was not applied. exit=" << from_env.exit_code << "\n" << from_env.output << std::endl;
            return 1;
        }
        if (overridden.exit_code != 0 || !expect_contains(overridden.output, "\"data-dir\": \"/opt/zkpig\"") ||
            expect_contains(overridden.output, "/srv/zkpig")) {
            std::cerr << "Flag did not override the environment. exit=" << overridden.exit_code << "\n" << overridden.output << std::endl;
            return 1;
        }

        const auto preflight = run_cli(executable, "preflight --chain-rpc-url http://127.0.0.1:8545 -b 123");
        if (preflight.exit_code != 0 || !expect_contains(preflight.output, "stage.dispatched") ||
            !expect_contains(preflight.output, "block=0x7b") || !expect_contains(preflight.output, "command.completed")) {
            std::cerr << "Failure on preflight. exit=" << preflight.exit_code << "\n" << preflight.output << std::endl;
            return 1;
        }

        const auto generate = run_cli(executable, "--log-format json generate --chain-rpc-url http://127.0.0.1:8545");
        if (generate.exit_code != 0 || !expect_contains(generate.output, "\"event\":\"stage.dispatched\"") ||
            !expect_contains(generate.output, "\"block\":\"latest\"") ||
            !expect_contains(generate.output, "\"stage\":\"execute\"")) {
            std::cerr << "Failure on generate. exit=" << generate.exit_code << "\n" << generate.output << std::endl;
            return 1;
        }

        const auto offline = run_cli(executable, "execute --chain-id 7 --block-number finalized");
        if (offline.exit_code != 0 || !expect_contains(offline.output, "chain=7")) {
            std::cerr << "Failure on offline execute. exit=" << offline.exit_code << "\n" << offline.output << std::endl;
            return 1;
        }

        const auto command_help = run_cli(executable, "preflight --help");
        if (command_help.exit_code != 0 || !expect_contains(command_help.output, "Usage: zkpig [options] preflight")) {
            std::cerr << "Failure on preflight --help. exit=" << command_help.exit_code << "\n" << command_help.output << std::endl;
            return 1;
        }

    } catch (const std::exception& ex) {
        std::cerr << "Exception during CLI config tests: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
