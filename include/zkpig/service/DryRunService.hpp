#pragma once

#include "zkpig/service/Service.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace zkpig::service {

struct RpcEndpoint {
    std::string scheme;
    std::string host;
    std::string port;
};

// Parses an http(s)/ws(s) JSON-RPC URL with libcurl's URL API. Throws ServiceError when malformed.
ZKPIG_API RpcEndpoint parse_rpc_endpoint(const std::string& url);

// Service linked into the zkpig binary. It honours the start/stop contract and the online/offline
// requirements of each stage, and records every dispatched stage as a structured log event
// instead of processing block data.
class ZKPIG_API DryRunService : public ProverInputService {
public:
    explicit DryRunService(Config config);
    ~DryRunService() override;

    DryRunService(const DryRunService&) = delete;
    DryRunService& operator=(const DryRunService&) = delete;

    void start(const InvocationContext& ctx) override;
    void stop(const InvocationContext& ctx) override;

    void generate(const InvocationContext& ctx, const rpc::BlockNumber& block) override;
    void preflight(const InvocationContext& ctx, const rpc::BlockNumber& block) override;
    void prepare(const InvocationContext& ctx, const rpc::BlockNumber& block) override;
    void execute(const InvocationContext& ctx, const rpc::BlockNumber& block) override;

    [[nodiscard]] bool running() const noexcept { return running_; }

private:
    void require_running(std::string_view stage) const;
    void require_online(std::string_view stage) const;
    void require_chain_identity(std::string_view stage) const;
    void dispatch(const InvocationContext& ctx, std::string_view stage, const rpc::BlockNumber& block);
    void release() noexcept;

    Config config_;
    std::optional<RpcEndpoint> endpoint_;
    bool running_{false};
};

ZKPIG_API std::unique_ptr<ProverInputService> make_dry_run_service(const Config& config);

}  // namespace zkpig::service
