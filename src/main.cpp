#include "zkpig/commands/Command.hpp"
#include "zkpig/config/Settings.hpp"
#include "zkpig/service/DryRunService.hpp"

#include <csignal>
#include <cstddef>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <signal.h>
#endif

#ifndef ZKPIG_VERSION
#define ZKPIG_VERSION "v0.1.0"
#endif

namespace {

constexpr std::string_view kZkpigVersion = ZKPIG_VERSION;

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_error(const char* formatted, const std::string& hint) {
    std::cerr << formatted << std::endl;
    if (!hint.empty()) {
        std::cerr << "Hint: " << hint << std::endl;
    }
}

zkpig::service::CancellationToken g_cancellation;

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
#ifdef SIGQUIT
    case SIGQUIT:
#endif
        g_cancellation.cancel();
        break;
    default:
        break;
    }
}

void install_termination_handlers() {
#ifdef _WIN32
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#else
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
#ifdef SIGQUIT
    install(SIGQUIT);
#endif
#endif
}

void uninstall_termination_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if !defined(_WIN32) && defined(SIGQUIT)
    std::signal(SIGQUIT, SIG_DFL);
#endif
}

class TerminationHandlerScope {
public:
    TerminationHandlerScope() { install_termination_handlers(); }
    ~TerminationHandlerScope() { uninstall_termination_handlers(); }

    TerminationHandlerScope(const TerminationHandlerScope&) = delete;
    TerminationHandlerScope& operator=(const TerminationHandlerScope&) = delete;
};

void print_global_options() {
    std::cout << "Global options:\n";
    for (const auto& descriptor : zkpig::config::setting_descriptors()) {
        const std::string flag = std::string(descriptor.flag) + " " + std::string(descriptor.placeholder);
        std::cout << "  " << std::left << std::setw(34) << flag << descriptor.description << '\n';
        std::cout << "  " << std::setw(34) << "" << "env: " << descriptor.env << '\n';
    }
    std::cout << "  " << std::setw(34) << "--version" << "Print the CLI version and exit\n"
              << "  " << std::setw(34) << "--help" << "Print this help message\n";
}

void print_usage() {
    std::cout << "zkpig - prover input generator for Ethereum-compatible chains" << std::endl;
    std::cout << "Usage: zkpig [options] <command> [command options]\n\n";
    print_global_options();
    std::cout << "\nCommands:\n";
    for (const auto& definition : zkpig::commands::command_definitions()) {
        std::cout << "  " << std::left << std::setw(12) << definition.name << definition.summary << '\n';
    }
    std::cout << "\nRun 'zkpig <command> --help' for command options." << std::endl;
}

void print_command_usage(const zkpig::commands::CommandDefinition& definition) {
    std::cout << "Usage: zkpig [options] " << definition.name;
    if (definition.operation) {
        std::cout << " [--block-number|-b <n>]";
    }
    std::cout << "\n" << definition.description << "\n";
    if (definition.operation) {
        std::cout << "\nOptions:\n"
                  << "  --block-number, -b <n>   Block height (decimal or 0x-prefixed) or tag: latest, earliest,\n"
                  << "                           pending, safe, finalized (default "
                  << zkpig::commands::kDefaultBlockNumber << ")\n";
    }
    std::cout << std::endl;
}

bool is_help_flag(std::string_view value) {
    return value == "--help" || value == "-h";
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        zkpig::config::Settings flag_settings;
        std::optional<std::string> command_name;
        std::optional<std::string> block_argument;
        bool help_requested = false;
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        while (index < args.size()) {
            const auto arg = args[index++];
            if (!arg.starts_with("-")) {
                if (command_name) {
                    throw_cli_error("E_UNEXPECTED_ARGUMENT",
                                    "Unexpected argument: " + std::string(arg),
                                    "Commands do not take positional arguments; use --block-number to select a block");
                }
                command_name = std::string(arg);
                continue;
            }

            if (is_help_flag(arg)) {
                help_requested = true;
                continue;
            }
            if (arg == "--version") {
                std::cout << "zkpig " << kZkpigVersion << std::endl;
                return 0;
            }
            if (arg == "--block-number" || arg == "-b") {
                if (block_argument) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --block-number specified multiple times",
                                    "Select a single block per invocation");
                }
                block_argument = require_value(arg);
                continue;
            }
            if (const auto* descriptor = zkpig::config::find_setting_by_flag(arg)) {
                if (flag_settings.contains(descriptor->key)) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option " + std::string(descriptor->flag) + " specified multiple times",
                                    "Provide " + std::string(descriptor->flag) + " only once");
                }
                flag_settings.set(descriptor->key, require_value(arg));
                continue;
            }

            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(arg),
                            "Run 'zkpig --help' to view available options");
        }

        if (!command_name || *command_name == "help") {
            print_usage();
            return command_name || help_requested ? 0 : 1;
        }

        const auto* definition = zkpig::commands::find_command(*command_name);
        if (!definition) {
            throw_cli_error("E_UNKNOWN_COMMAND",
                            "Unknown command: " + *command_name,
                            "Run 'zkpig --help' to see the list of available commands");
        }
        if (help_requested) {
            print_command_usage(*definition);
            return 0;
        }
        if (!definition->operation && block_argument) {
            throw_cli_error("E_UNKNOWN_OPTION",
                            std::string(definition->name) + " does not accept --block-number",
                            "Run 'zkpig " + std::string(definition->name) + " --help' to view usage");
        }

        auto settings = zkpig::config::Settings::from_environment();
        settings.merge(flag_settings);

        if (!definition->operation) {
            zkpig::commands::run_config_command(settings, std::cout);
            return 0;
        }

        TerminationHandlerScope termination_scope;
        zkpig::service::InvocationContext ctx{std::string(definition->name), g_cancellation};
        zkpig::commands::PipelineCommand command(*definition, zkpig::service::make_dry_run_service);
        command.invoke(settings, block_argument.value_or(std::string(zkpig::commands::kDefaultBlockNumber)), ctx);
        return 0;

    } catch (const CliException& ex) {
        print_error(ex.what(), ex.hint());
        return 1;
    } catch (const zkpig::commands::CommandError& ex) {
        print_error(ex.what(), ex.hint());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
