#pragma once

#include "zkpig/Config.hpp"
#include "zkpig/Export.hpp"
#include "zkpig/config/Settings.hpp"
#include "zkpig/rpc/BlockNumber.hpp"
#include "zkpig/service/Service.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace zkpig::commands {

enum class Stage {
    Config,
    ServiceCreate,
    ServiceStart,
    BlockNumber,
    Validation,
    Run,
    Teardown,
    Output
};

ZKPIG_API std::string_view stage_to_string(Stage stage);

class ZKPIG_API CommandError : public std::exception {
public:
    CommandError(Stage stage,
                 std::string code,
                 std::string message,
                 std::string hint = {},
                 std::vector<std::string> details = {});

    const char* what() const noexcept override { return formatted_.c_str(); }

    Stage stage() const noexcept { return stage_; }
    const std::string& code() const& { return code_; }
    const std::string& message() const& { return message_; }
    const std::string& hint() const& { return hint_; }
    // Structured payload of the failure, e.g. the missing S3 field names.
    const std::vector<std::string>& details() const& { return details_; }

private:
    Stage stage_;
    std::string code_;
    std::string message_;
    std::string hint_;
    std::vector<std::string> details_;
    std::string formatted_;
};

enum class Operation {
    Generate,
    Preflight,
    Prepare,
    Execute
};

ZKPIG_API std::string_view operation_to_string(Operation operation);

struct CommandDefinition {
    std::string_view name;
    std::string_view summary;
    std::string_view description;
    // Unset for commands that never touch the service.
    std::optional<Operation> operation;
};

inline constexpr std::string_view kDefaultBlockNumber = "latest";

ZKPIG_API const std::vector<CommandDefinition>& command_definitions();
ZKPIG_API const CommandDefinition* find_command(std::string_view name);

// Per-invocation state populated by setup and read by run and teardown.
struct ExecutionContext {
    Config config;
    std::unique_ptr<service::ProverInputService> service;
    std::optional<rpc::BlockNumber> block_number;
};

// One invocation of a pipeline command: setup, run, then teardown.
class ZKPIG_API PipelineCommand {
public:
    enum class State {
        Idle,
        Configured,
        ServiceCreated,
        ServiceStarted,
        BlockResolved,
        Ready,
        SetupFailed,
        Ran,
        RunFailed,
        Completed,
        Failed
    };

    PipelineCommand(const CommandDefinition& definition, service::ServiceFactory factory);

    PipelineCommand(const PipelineCommand&) = delete;
    PipelineCommand& operator=(const PipelineCommand&) = delete;

    // Resolves configuration, creates and starts the service, resolves the block number and
    // validates the S3 group, in that order. Any failure leaves the command in SetupFailed.
    void setup(const config::Settings& settings,
               std::string_view block_argument,
               const service::InvocationContext& ctx);

    void run(const service::InvocationContext& ctx);

    // Stops the service. Requires a successful setup; runs whatever the run outcome was.
    void teardown(const service::InvocationContext& ctx);

    // Full lifecycle. Throws the first failure; a teardown failure never masks a run failure.
    void invoke(const config::Settings& settings,
                std::string_view block_argument,
                const service::InvocationContext& ctx);

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] const CommandDefinition& definition() const noexcept { return definition_; }
    [[nodiscard]] const ExecutionContext& context() const noexcept { return context_; }

private:
    [[noreturn]] void fail_setup(const CommandError& error);

    const CommandDefinition& definition_;
    service::ServiceFactory factory_;
    ExecutionContext context_;
    State state_{State::Idle};
};

ZKPIG_API std::string_view state_to_string(PipelineCommand::State state);

// Resolves configuration and writes it to `out` as indented JSON. Never creates a service.
ZKPIG_API void run_config_command(const config::Settings& settings, std::ostream& out);

// Applies log.level and log.format to the process logger.
ZKPIG_API void apply_logging(const Config& config);

}  // namespace zkpig::commands
