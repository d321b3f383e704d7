#include "zkpig/commands/Command.hpp"

#include "zkpig/log/StructuredLogger.hpp"
#include "zkpig/validation/RequiredTogether.hpp"

#include <stdexcept>
#include <utility>

namespace zkpig::commands {

namespace {

constexpr const char* kBlockNumberHint =
    "Use a decimal or 0x-prefixed height, or one of latest, earliest, pending, safe, finalized";
constexpr const char* kS3Hint =
    "Set --s3-bucket, --s3-access-key, --s3-secret-key and --s3-region together, or none of them";

void log_failure(const CommandDefinition& definition, PipelineCommand::State state, const CommandError& error) {
    log::StructuredLogger::FieldList fields{
        {"command", std::string(definition.name)},
        {"stage", std::string(stage_to_string(error.stage()))},
        {"state", std::string(state_to_string(state))},
        {"code", error.code()},
        {"error", error.message()},
    };
    log::error("command.failed", std::move(fields));
}

}  // namespace

std::string_view state_to_string(PipelineCommand::State state) {
    switch (state) {
        case PipelineCommand::State::Idle:
            return "idle";
        case PipelineCommand::State::Configured:
            return "configured";
        case PipelineCommand::State::ServiceCreated:
            return "service-created";
        case PipelineCommand::State::ServiceStarted:
            return "service-started";
        case PipelineCommand::State::BlockResolved:
            return "block-resolved";
        case PipelineCommand::State::Ready:
            return "ready";
        case PipelineCommand::State::SetupFailed:
            return "setup-failed";
        case PipelineCommand::State::Ran:
            return "ran";
        case PipelineCommand::State::RunFailed:
            return "run-failed";
        case PipelineCommand::State::Completed:
            return "completed";
        case PipelineCommand::State::Failed:
            return "failed";
    }
    return "unknown";
}

PipelineCommand::PipelineCommand(const CommandDefinition& definition, service::ServiceFactory factory)
    : definition_(definition), factory_(std::move(factory)) {
    if (!definition_.operation) {
        throw std::invalid_argument(std::string(definition_.name) + " is not a pipeline command");
    }
    if (!factory_) {
        throw std::invalid_argument("a service factory is required");
    }
}

void PipelineCommand::fail_setup(const CommandError& error) {
    state_ = State::SetupFailed;
    log_failure(definition_, state_, error);
    throw error;
}

void PipelineCommand::setup(const config::Settings& settings,
                            std::string_view block_argument,
                            const service::InvocationContext& ctx) {
    if (state_ != State::Idle) {
        throw std::logic_error("setup may only run once per command invocation");
    }

    try {
        context_.config = config::prepare_config(settings);
    } catch (const config::ConfigError& ex) {
        fail_setup(CommandError(Stage::Config, ex.code, ex.message, ex.hint));
    }
    apply_logging(context_.config);
    state_ = State::Configured;
    log::debug("command.setup", {{"command", std::string(definition_.name)},
                                 {"block_argument", std::string(block_argument)}});

    try {
        context_.service = factory_(context_.config);
    } catch (const std::exception& ex) {
        fail_setup(CommandError(Stage::ServiceCreate,
                                "E_SERVICE_CREATE",
                                std::string("failed to create prover inputs service: ") + ex.what(),
                                "Check --chain-rpc-url and the store settings"));
    }
    if (!context_.service) {
        fail_setup(CommandError(Stage::ServiceCreate,
                                "E_SERVICE_CREATE",
                                "failed to create prover inputs service: factory returned no service"));
    }
    state_ = State::ServiceCreated;
    log::debug("service.created", {{"command", std::string(definition_.name)}});

    try {
        context_.service->start(ctx);
    } catch (const std::exception& ex) {
        fail_setup(CommandError(Stage::ServiceStart,
                                "E_SERVICE_START",
                                std::string("failed to start prover inputs service: ") + ex.what(),
                                "Verify the chain RPC endpoint is reachable"));
    }
    state_ = State::ServiceStarted;
    log::info("service.started", {{"command", std::string(definition_.name)}});

    std::string parse_error;
    auto block = rpc::parse_block_number(block_argument, parse_error);
    if (!block) {
        fail_setup(CommandError(Stage::BlockNumber,
                                "E_INVALID_BLOCK_NUMBER",
                                "invalid block number: " + parse_error,
                                kBlockNumberHint));
    }
    context_.block_number = *block;
    state_ = State::BlockResolved;
    log::debug("block_number.resolved", {{"block", context_.block_number->to_string()}});

    if (auto violation = validation::validate_s3_config(context_.config)) {
        fail_setup(CommandError(Stage::Validation,
                                "E_S3_CONFIG_INCOMPLETE",
                                violation->message(),
                                kS3Hint,
                                violation->missing_fields));
    }
    state_ = State::Ready;
}

void PipelineCommand::run(const service::InvocationContext& ctx) {
    if (state_ != State::Ready) {
        throw std::logic_error("run requires a successful setup");
    }

    const auto operation = *definition_.operation;
    const auto& block = *context_.block_number;
    log::info("command.run", {{"command", std::string(definition_.name)},
                              {"operation", std::string(operation_to_string(operation))},
                              {"block", block.to_string()}});

    try {
        auto& svc = *context_.service;
        switch (operation) {
            case Operation::Generate:
                svc.generate(ctx, block);
                break;
            case Operation::Preflight:
                svc.preflight(ctx, block);
                break;
            case Operation::Prepare:
                svc.prepare(ctx, block);
                break;
            case Operation::Execute:
                svc.execute(ctx, block);
                break;
        }
    } catch (const std::exception& ex) {
        state_ = State::RunFailed;
        throw CommandError(Stage::Run,
                           "E_RUN_FAILED",
                           std::string(definition_.name) + " failed: " + ex.what());
    }
    state_ = State::Ran;
}

void PipelineCommand::teardown(const service::InvocationContext& ctx) {
    if (state_ != State::Ran && state_ != State::RunFailed) {
        throw std::logic_error("teardown requires a successful setup and an attempted run");
    }

    const bool run_failed = state_ == State::RunFailed;
    try {
        context_.service->stop(ctx);
    } catch (const std::exception& ex) {
        state_ = State::Failed;
        CommandError error(Stage::Teardown,
                           "E_SERVICE_STOP",
                           std::string("failed to stop prover inputs service: ") + ex.what());
        log::StructuredLogger::instance().log(
            run_failed ? log::StructuredLogger::Level::Warning : log::StructuredLogger::Level::Error,
            "service.stop_failed",
            {{"command", std::string(definition_.name)}, {"error", error.message()}});
        throw error;
    }
    state_ = run_failed ? State::Failed : State::Completed;
    log::info("service.stopped", {{"command", std::string(definition_.name)}});
}

void PipelineCommand::invoke(const config::Settings& settings,
                             std::string_view block_argument,
                             const service::InvocationContext& ctx) {
    setup(settings, block_argument, ctx);

    std::optional<CommandError> run_failure;
    try {
        run(ctx);
    } catch (const CommandError& ex) {
        run_failure = ex;
    }

    try {
        teardown(ctx);
    } catch (const CommandError& ex) {
        if (!run_failure) {
            log_failure(definition_, state_, ex);
            throw;
        }
    }

    if (run_failure) {
        log_failure(definition_, state_, *run_failure);
        throw *run_failure;
    }
    log::info("command.completed", {{"command", std::string(definition_.name)},
                                    {"block", context_.block_number->to_string()}});
}

}  // namespace zkpig::commands
