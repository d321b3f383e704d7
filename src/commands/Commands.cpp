#include "zkpig/commands/Command.hpp"

#include "zkpig/config/Value.hpp"
#include "zkpig/log/StructuredLogger.hpp"

#include <algorithm>
#include <utility>

namespace zkpig::commands {

namespace {

const std::vector<CommandDefinition> kCommandDefinitions{
    {"generate",
     "Generate prover input for a specific block",
     "Generate prover inputs by running preflight, prepare and execute in a single run. It runs online and "
     "requires --chain-rpc-url to be set to a remote JSON-RPC Ethereum Execution Layer node.",
     Operation::Generate},
    {"preflight",
     "Collect necessary data to generate prover inputs from a remote JSON-RPC Ethereum Execution Layer node",
     "Collect necessary data to generate prover inputs from a remote JSON-RPC Ethereum Execution Layer node. "
     "It runs online and requires --chain-rpc-url to be set to a remote JSON-RPC Ethereum Execution Layer node.",
     Operation::Preflight},
    {"prepare",
     "Prepare prover inputs by basing on data previously collected during preflight",
     "Prepare prover inputs by basing on data previously collected during preflight. It can be run offline, in "
     "which case it needs --chain-id to be provided.",
     Operation::Prepare},
    {"execute",
     "Execute block by basing on prover inputs previously generated during prepare",
     "Execute block by basing on prover inputs previously generated during prepare. It can be run offline, in "
     "which case it needs --chain-id to be provided.",
     Operation::Execute},
    {"config",
     "Returns current configuration",
     "Print the resolved configuration, defaults included, as JSON on standard output.",
     std::nullopt},
};

}  // namespace

std::string_view stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::Config:
            return "config";
        case Stage::ServiceCreate:
            return "service-create";
        case Stage::ServiceStart:
            return "service-start";
        case Stage::BlockNumber:
            return "block-number";
        case Stage::Validation:
            return "validation";
        case Stage::Run:
            return "run";
        case Stage::Teardown:
            return "teardown";
        case Stage::Output:
            return "output";
    }
    return "unknown";
}

CommandError::CommandError(Stage stage,
                           std::string code,
                           std::string message,
                           std::string hint,
                           std::vector<std::string> details)
    : stage_(stage),
      code_(std::move(code)),
      message_(std::move(message)),
      hint_(std::move(hint)),
      details_(std::move(details)) {
    formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
}

std::string_view operation_to_string(Operation operation) {
    switch (operation) {
        case Operation::Generate:
            return "generate";
        case Operation::Preflight:
            return "preflight";
        case Operation::Prepare:
            return "prepare";
        case Operation::Execute:
            return "execute";
    }
    return "unknown";
}

const std::vector<CommandDefinition>& command_definitions() {
    return kCommandDefinitions;
}

const CommandDefinition* find_command(std::string_view name) {
    const auto it = std::find_if(kCommandDefinitions.begin(), kCommandDefinitions.end(),
                                 [&](const CommandDefinition& definition) { return definition.name == name; });
    return it == kCommandDefinitions.end() ? nullptr : &*it;
}

void apply_logging(const Config& config) {
    auto& logger = log::StructuredLogger::instance();
    logger.set_level(log::StructuredLogger::parse_level(config.log.level).value_or(log::StructuredLogger::Level::Info));
    logger.set_format(log::StructuredLogger::parse_format(config.log.format).value_or(log::StructuredLogger::Format::Text));
}

void run_config_command(const config::Settings& settings, std::ostream& out) {
    Config config;
    try {
        config = config::prepare_config(settings);
    } catch (const config::ConfigError& ex) {
        throw CommandError(Stage::Config, ex.code, ex.message, ex.hint);
    }

    out << config::to_json(config::to_value(config), 2) << '\n';
    out.flush();
    if (!out) {
        throw CommandError(Stage::Output, "E_CONFIG_OUTPUT", "failed to write configuration to output stream");
    }
}

}  // namespace zkpig::commands
