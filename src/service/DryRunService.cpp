#include "zkpig/service/DryRunService.hpp"

#include "zkpig/log/StructuredLogger.hpp"

#include <array>
#include <memory>
#include <utility>

#include <curl/curl.h>

namespace zkpig::service {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* handle) const noexcept {
        curl_url_cleanup(handle);
    }
};

struct CurlStringDeleter {
    void operator()(char* value) const noexcept {
        curl_free(value);
    }
};

using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

constexpr std::array<std::string_view, 4> kSupportedSchemes{"http", "https", "ws", "wss"};

std::string read_part(CURLU* handle, CURLUPart part) {
    char* raw = nullptr;
    if (curl_url_get(handle, part, &raw, 0) != CURLUE_OK) {
        return {};
    }
    CurlString owned(raw);
    return owned ? std::string(owned.get()) : std::string{};
}

}  // namespace

RpcEndpoint parse_rpc_endpoint(const std::string& url) {
    CurlUrlHandle handle(curl_url());
    if (!handle) {
        throw ServiceError("unable to allocate URL handle");
    }

    const CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME);
    if (rc != CURLUE_OK) {
        throw ServiceError("invalid chain RPC URL '" + url + "': " + curl_url_strerror(rc));
    }

    RpcEndpoint endpoint;
    endpoint.scheme = read_part(handle.get(), CURLUPART_SCHEME);
    endpoint.host = read_part(handle.get(), CURLUPART_HOST);
    endpoint.port = read_part(handle.get(), CURLUPART_PORT);

    bool supported = false;
    for (const auto scheme : kSupportedSchemes) {
        if (endpoint.scheme == scheme) {
            supported = true;
            break;
        }
    }
    if (!supported) {
        throw ServiceError("invalid chain RPC URL '" + url + "': unsupported scheme '" + endpoint.scheme + "'");
    }
    if (endpoint.host.empty()) {
        throw ServiceError("invalid chain RPC URL '" + url + "': missing host");
    }
    return endpoint;
}

DryRunService::DryRunService(Config config)
    : config_(std::move(config)) {
    if (!config_.chain.rpc_url.empty()) {
        endpoint_ = parse_rpc_endpoint(config_.chain.rpc_url);
    }
}

DryRunService::~DryRunService() {
    release();
}

void DryRunService::start(const InvocationContext& ctx) {
    if (running_) {
        return;
    }
    if (ctx.cancellation.cancelled()) {
        throw ServiceCancelled();
    }
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw ServiceError("unable to initialize libcurl");
    }
    running_ = true;

    log::StructuredLogger::FieldList fields{{"command", ctx.command}};
    if (endpoint_) {
        fields.emplace_back("rpc_host", endpoint_->host);
    } else {
        fields.emplace_back("mode", "offline");
    }
    log::debug("dry_run.started", std::move(fields));
}

void DryRunService::stop(const InvocationContext& ctx) {
    if (!running_) {
        throw ServiceError("service is not running");
    }
    release();
    log::debug("dry_run.stopped", {{"command", ctx.command}});
}

void DryRunService::generate(const InvocationContext& ctx, const rpc::BlockNumber& block) {
    require_running("generate");
    require_online("generate");
    dispatch(ctx, "preflight", block);
    dispatch(ctx, "prepare", block);
    dispatch(ctx, "execute", block);
}

void DryRunService::preflight(const InvocationContext& ctx, const rpc::BlockNumber& block) {
    require_running("preflight");
    require_online("preflight");
    dispatch(ctx, "preflight", block);
}

void DryRunService::prepare(const InvocationContext& ctx, const rpc::BlockNumber& block) {
    require_running("prepare");
    require_chain_identity("prepare");
    dispatch(ctx, "prepare", block);
}

void DryRunService::execute(const InvocationContext& ctx, const rpc::BlockNumber& block) {
    require_running("execute");
    require_chain_identity("execute");
    dispatch(ctx, "execute", block);
}

void DryRunService::require_running(std::string_view stage) const {
    if (!running_) {
        throw ServiceError(std::string(stage) + " called before the service was started");
    }
}

void DryRunService::require_online(std::string_view stage) const {
    if (!endpoint_) {
        throw ServiceError(std::string(stage) + " runs online and requires chain.rpc-url (--chain-rpc-url)");
    }
}

void DryRunService::require_chain_identity(std::string_view stage) const {
    if (!endpoint_ && !config_.chain.id) {
        throw ServiceError(std::string(stage) + " runs offline and requires chain.id (--chain-id)");
    }
}

void DryRunService::dispatch(const InvocationContext& ctx, std::string_view stage, const rpc::BlockNumber& block) {
    if (ctx.cancellation.cancelled()) {
        throw ServiceCancelled();
    }

    const auto& store_dir = stage == "preflight" ? config_.preflight_data_store.file.dir
                                                 : config_.prover_input_store.file.dir;
    log::StructuredLogger::FieldList fields{
        {"stage", std::string(stage)},
        {"block", block.to_rpc_argument()},
        {"chain", config_.chain.id ? std::to_string(*config_.chain.id) : std::string{"auto"}},
        {"store", store_dir},
    };
    if (stage != "preflight") {
        fields.emplace_back("content_type", config_.prover_input_store.content_type);
    }
    log::info("stage.dispatched", std::move(fields));
}

void DryRunService::release() noexcept {
    if (running_) {
        curl_global_cleanup();
        running_ = false;
    }
}

std::unique_ptr<ProverInputService> make_dry_run_service(const Config& config) {
    return std::make_unique<DryRunService>(config);
}

}  // namespace zkpig::service
