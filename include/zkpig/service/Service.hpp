#pragma once

#include "zkpig/Config.hpp"
#include "zkpig/Export.hpp"
#include "zkpig/rpc/BlockNumber.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace zkpig::service {

// Shared flag observed by long-running service calls. Copies refer to the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }
    [[nodiscard]] bool cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Ambient state handed to every service call of one command invocation.
struct InvocationContext {
    std::string command;
    CancellationToken cancellation;
};

class ZKPIG_API ServiceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ZKPIG_API ServiceCancelled : public ServiceError {
public:
    ServiceCancelled() : ServiceError("operation cancelled") {}
};

// Backing service of the pipeline commands. Implementations report failures by throwing.
class ZKPIG_API ProverInputService {
public:
    virtual ~ProverInputService() = default;

    virtual void start(const InvocationContext& ctx) = 0;
    virtual void stop(const InvocationContext& ctx) = 0;

    // Runs preflight, prepare and execute for one block.
    virtual void generate(const InvocationContext& ctx, const rpc::BlockNumber& block) = 0;
    virtual void preflight(const InvocationContext& ctx, const rpc::BlockNumber& block) = 0;
    virtual void prepare(const InvocationContext& ctx, const rpc::BlockNumber& block) = 0;
    virtual void execute(const InvocationContext& ctx, const rpc::BlockNumber& block) = 0;
};

// Builds a service from a resolved configuration; throws when the configuration is unusable.
using ServiceFactory = std::function<std::unique_ptr<ProverInputService>(const Config&)>;

}  // namespace zkpig::service
