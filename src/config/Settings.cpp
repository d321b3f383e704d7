#include "zkpig/config/Settings.hpp"

#include "zkpig/log/StructuredLogger.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <system_error>
#include <utility>

namespace zkpig::config {

namespace {

const std::vector<SettingDescriptor> kSettingDescriptors{
    {"chain.id", "--chain-id", "ZKPIG_CHAIN_ID", "<id>",
     "Chain identifier (required by prepare/execute when running offline)"},
    {"chain.rpc-url", "--chain-rpc-url", "ZKPIG_CHAIN_RPC_URL", "<url>",
     "JSON-RPC endpoint of an Ethereum Execution Layer node"},
    {"data-dir", "--data-dir", "ZKPIG_DATA_DIR", "<path>",
     "Base directory for preflight data and prover inputs (default data)"},
    {"preflight-data-store.file.dir", "--preflight-dir", "ZKPIG_PREFLIGHT_DATA_STORE_FILE_DIR", "<path>",
     "Directory for preflight data (default <data-dir>/preflight)"},
    {"prover-input-store.file.dir", "--inputs-dir", "ZKPIG_PROVER_INPUT_STORE_FILE_DIR", "<path>",
     "Directory for prover inputs (default <data-dir>/inputs)"},
    {"prover-input-store.content-type", "--inputs-content-type", "ZKPIG_PROVER_INPUT_STORE_CONTENT_TYPE", "<type>",
     "application/json or application/protobuf (default application/json)"},
    {"prover-input-store.content-encoding", "--inputs-content-encoding", "ZKPIG_PROVER_INPUT_STORE_CONTENT_ENCODING",
     "<enc>", "plain, gzip or flate (default plain)"},
    {"prover-input-store.s3.bucket", "--s3-bucket", "ZKPIG_PROVER_INPUT_STORE_S3_BUCKET", "<name>",
     "S3 bucket receiving prover inputs"},
    {"prover-input-store.s3.bucket-key-prefix", "--s3-bucket-key-prefix",
     "ZKPIG_PROVER_INPUT_STORE_S3_BUCKET_KEY_PREFIX", "<prefix>", "Optional key prefix inside the S3 bucket"},
    {"prover-input-store.s3.aws-provider.region", "--s3-region", "ZKPIG_PROVER_INPUT_STORE_S3_AWS_PROVIDER_REGION",
     "<region>", "AWS region of the S3 bucket"},
    {"prover-input-store.s3.aws-provider.credentials.access-key", "--s3-access-key",
     "ZKPIG_PROVER_INPUT_STORE_S3_AWS_PROVIDER_CREDENTIALS_ACCESS_KEY", "<key>", "AWS access key"},
    {"prover-input-store.s3.aws-provider.credentials.secret-key", "--s3-secret-key",
     "ZKPIG_PROVER_INPUT_STORE_S3_AWS_PROVIDER_CREDENTIALS_SECRET_KEY", "<key>", "AWS secret key"},
    {"log.level", "--log-level", "ZKPIG_LOG_LEVEL", "<level>", "debug, info, warn or error (default info)"},
    {"log.format", "--log-format", "ZKPIG_LOG_FORMAT", "<format>", "text or json (default text)"},
};

constexpr std::string_view kContentTypes[] = {"application/json", "application/protobuf"};
constexpr std::string_view kContentEncodings[] = {"plain", "gzip", "flate"};

std::optional<std::string> lookup_process_environment(std::string_view name) {
    const std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string read_string(const Settings& settings, std::string_view key) {
    return settings.get(key).value_or(std::string{});
}

template <std::size_t N>
std::string read_choice(const Settings& settings,
                        std::string_view key,
                        const std::string_view (&choices)[N]) {
    auto value = settings.get(key);
    if (!value || value->empty()) {
        return {};
    }
    if (std::find(std::begin(choices), std::end(choices), *value) == std::end(choices)) {
        std::string allowed;
        for (std::size_t i = 0; i < N; ++i) {
            if (i > 0) {
                allowed += ", ";
            }
            allowed += choices[i];
        }
        throw ConfigError("E_CONFIG_VALUE",
                          std::string(key) + " has unsupported value '" + *value + "'",
                          "Use one of: " + allowed);
    }
    return *value;
}

std::optional<std::uint64_t> read_chain_id(const Settings& settings) {
    auto value = settings.get("chain.id");
    if (!value || value->empty()) {
        return std::nullopt;
    }
    std::uint64_t parsed{};
    const char* begin = value->data();
    const char* end = begin + value->size();
    const auto result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc{} || result.ptr != end || parsed == 0 ||
        parsed > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw ConfigError("E_CONFIG_VALUE",
                          "chain.id must be a positive integer",
                          "For example: --chain-id 1");
    }
    return parsed;
}

}  // namespace

const std::vector<SettingDescriptor>& setting_descriptors() {
    return kSettingDescriptors;
}

const SettingDescriptor* find_setting_by_flag(std::string_view flag) {
    const auto it = std::find_if(kSettingDescriptors.begin(), kSettingDescriptors.end(),
                                 [&](const SettingDescriptor& descriptor) { return descriptor.flag == flag; });
    return it == kSettingDescriptors.end() ? nullptr : &*it;
}

Settings Settings::from_environment() {
    return from_environment(lookup_process_environment);
}

Settings Settings::from_environment(const EnvironmentLookup& lookup) {
    Settings settings;
    for (const auto& descriptor : kSettingDescriptors) {
        if (auto value = lookup(descriptor.env)) {
            settings.set(descriptor.key, std::move(*value));
        }
    }
    return settings;
}

void Settings::set(std::string_view key, std::string value) {
    set_path(root_, split_path(key), Value(std::move(value)));
}

bool Settings::contains(std::string_view key) const {
    return find_path(root_, split_path(key)) != nullptr;
}

std::optional<std::string> Settings::get(std::string_view key) const {
    return get_string(root_, split_path(key));
}

void Settings::merge(const Settings& overlay) {
    root_ = merge_objects(root_, overlay.root_);
}

Config resolve_config(const Settings& settings) {
    Config config;

    config.chain.id = read_chain_id(settings);
    config.chain.rpc_url = read_string(settings, "chain.rpc-url");

    if (settings.contains("data-dir")) {
        config.data_dir = read_string(settings, "data-dir");
        if (config.data_dir.empty()) {
            throw ConfigError("E_CONFIG_VALUE",
                              "data-dir cannot be empty",
                              "Provide a directory path or omit --data-dir to use the default");
        }
    }

    config.preflight_data_store.file.dir = read_string(settings, "preflight-data-store.file.dir");

    auto& inputs = config.prover_input_store;
    inputs.content_type = read_choice(settings, "prover-input-store.content-type", kContentTypes);
    inputs.content_encoding = read_choice(settings, "prover-input-store.content-encoding", kContentEncodings);
    inputs.file.dir = read_string(settings, "prover-input-store.file.dir");
    inputs.s3.bucket = read_string(settings, "prover-input-store.s3.bucket");
    inputs.s3.bucket_key_prefix = read_string(settings, "prover-input-store.s3.bucket-key-prefix");
    inputs.s3.aws_provider.region = read_string(settings, "prover-input-store.s3.aws-provider.region");
    inputs.s3.aws_provider.credentials.access_key =
        read_string(settings, "prover-input-store.s3.aws-provider.credentials.access-key");
    inputs.s3.aws_provider.credentials.secret_key =
        read_string(settings, "prover-input-store.s3.aws-provider.credentials.secret-key");

    if (auto level = settings.get("log.level"); level && !level->empty()) {
        if (!log::StructuredLogger::parse_level(*level)) {
            throw ConfigError("E_CONFIG_VALUE",
                              "log.level has unsupported value '" + *level + "'",
                              "Use one of: debug, info, warn, error");
        }
        config.log.level = *level;
    }
    if (auto format = settings.get("log.format"); format && !format->empty()) {
        if (!log::StructuredLogger::parse_format(*format)) {
            throw ConfigError("E_CONFIG_VALUE",
                              "log.format has unsupported value '" + *format + "'",
                              "Use one of: text, json");
        }
        config.log.format = *format;
    }

    return config;
}

Config prepare_config(const Settings& settings) {
    Config config = resolve_config(settings);
    config.set_defaults();
    return config;
}

Value to_value(const Config& config) {
    Value root = Value::make_object();
    const auto put = [&root](std::string_view key, Value value) {
        set_path(root, split_path(key), std::move(value));
    };

    put("chain.id", config.chain.id ? Value(static_cast<std::int64_t>(*config.chain.id)) : Value());
    put("chain.rpc-url", Value(config.chain.rpc_url));
    put("data-dir", Value(config.data_dir));
    put("preflight-data-store.file.dir", Value(config.preflight_data_store.file.dir));

    const auto& inputs = config.prover_input_store;
    put("prover-input-store.content-type", Value(inputs.content_type));
    put("prover-input-store.content-encoding", Value(inputs.content_encoding));
    put("prover-input-store.file.dir", Value(inputs.file.dir));
    put("prover-input-store.s3.bucket", Value(inputs.s3.bucket));
    put("prover-input-store.s3.bucket-key-prefix", Value(inputs.s3.bucket_key_prefix));
    put("prover-input-store.s3.aws-provider.region", Value(inputs.s3.aws_provider.region));
    put("prover-input-store.s3.aws-provider.credentials.access-key",
        Value(inputs.s3.aws_provider.credentials.access_key));
    put("prover-input-store.s3.aws-provider.credentials.secret-key",
        Value(inputs.s3.aws_provider.credentials.secret_key));

    put("log.level", Value(config.log.level));
    put("log.format", Value(config.log.format));
    return root;
}

}  // namespace zkpig::config
