#include "zkpig/commands/Command.hpp"
#include "zkpig/config/Settings.hpp"
#include "zkpig/config/Value.hpp"

#include <cassert>
#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <string>

using zkpig::Config;
using zkpig::commands::CommandError;
using zkpig::commands::Stage;
using zkpig::config::ConfigError;
using zkpig::config::Settings;
using zkpig::config::Value;

namespace {

std::optional<ConfigError> resolve_error(const Settings& settings) {
    try {
        (void)zkpig::config::prepare_config(settings);
    } catch (const ConfigError& ex) {
        return ex;
    }
    return std::nullopt;
}

}  // namespace

int main() {
    // Defaults derive store directories from data-dir.
    {
        const auto config = zkpig::config::prepare_config(Settings{});
        assert(!config.chain.id);
        assert(config.chain.rpc_url.empty());
        assert(config.data_dir == "data");
        assert(config.preflight_data_store.file.dir == "data/preflight");
        assert(config.prover_input_store.file.dir == "data/inputs");
        assert(config.prover_input_store.content_type == "application/json");
        assert(config.prover_input_store.content_encoding == "plain");
        assert(config.log.level == "info");
        assert(config.log.format == "text");
    }

    {
        Settings settings;
        settings.set("data-dir", "/var/lib/zkpig");
        settings.set("prover-input-store.file.dir", "/mnt/inputs");
        const auto config = zkpig::config::prepare_config(settings);
        assert(config.preflight_data_store.file.dir == "/var/lib/zkpig/preflight");
        assert(config.prover_input_store.file.dir == "/mnt/inputs");
    }

    // resolve_config leaves defaults to set_defaults.
    {
        const auto config = zkpig::config::resolve_config(Settings{});
        assert(config.data_dir.empty());
        assert(config.prover_input_store.content_type.empty());
    }

    // Environment values are read through the descriptor table and flags override them.
    {
        const std::map<std::string, std::string> environment{
            {"ZKPIG_CHAIN_ID", "10"},
            {"ZKPIG_CHAIN_RPC_URL", "http://env:8545"},
            {"ZKPIG_PROVER_INPUT_STORE_S3_BUCKET", "env-bucket"},
            {"UNRELATED", "ignored"},
        };
        auto settings = Settings::from_environment([&](std::string_view name) -> std::optional<std::string> {
            const auto it = environment.find(std::string(name));
            if (it == environment.end()) {
                return std::nullopt;
            }
            return it->second;
        });
        assert(settings.get("chain.id") == "10");
        assert(settings.get("prover-input-store.s3.bucket") == "env-bucket");

        Settings flags;
        flags.set("chain.rpc-url", "http://flag:8545");
        settings.merge(flags);

        const auto config = zkpig::config::prepare_config(settings);
        assert(config.chain.id == 10u);
        assert(config.chain.rpc_url == "http://flag:8545");
        assert(config.prover_input_store.s3.bucket == "env-bucket");
    }

    // Descriptor lookups.
    {
        const auto* by_flag = zkpig::config::find_setting_by_flag("--s3-access-key");
        assert(by_flag != nullptr);
        assert(by_flag->key == "prover-input-store.s3.aws-provider.credentials.access-key");
        assert(by_flag->env == "ZKPIG_PROVER_INPUT_STORE_S3_AWS_PROVIDER_CREDENTIALS_ACCESS_KEY");
        assert(zkpig::config::find_setting_by_flag("--log-format")->key == "log.format");
        assert(zkpig::config::find_setting_by_flag("--block-number") == nullptr);
    }

    // Invalid values.
    {
        Settings settings;
        settings.set("chain.id", "0");
        const auto error = resolve_error(settings);
        assert(error);
        assert(error->code == "E_CONFIG_VALUE");
        assert(error->message == "chain.id must be a positive integer");
    }
    {
        Settings settings;
        settings.set("chain.id", "-4");
        assert(resolve_error(settings));
    }
    {
        Settings settings;
        settings.set("data-dir", "");
        const auto error = resolve_error(settings);
        assert(error);
        assert(error->message == "data-dir cannot be empty");
    }
    {
        Settings settings;
        settings.set("prover-input-store.content-type", "text/plain");
        const auto error = resolve_error(settings);
        assert(error);
        assert(error->message == "prover-input-store.content-type has unsupported value 'text/plain'");
        assert(!error->hint.empty());
    }
    {
        Settings settings;
        settings.set("prover-input-store.content-encoding", "gzip");
        settings.set("prover-input-store.content-type", "application/protobuf");
        settings.set("log.level", "warn");
        settings.set("log.format", "json");
        assert(!resolve_error(settings));
    }
    {
        Settings settings;
        settings.set("log.level", "verbose");
        assert(resolve_error(settings));
    }

    // to_value mirrors the settings keys.
    {
        Settings settings;
        settings.set("chain.id", "1");
        settings.set("prover-input-store.s3.aws-provider.credentials.secret-key", "s3cr3t");
        const auto tree = zkpig::config::to_value(zkpig::config::prepare_config(settings));
        const auto* id = zkpig::config::find_path(tree, {"chain", "id"});
        assert(id != nullptr && id->is_integer() && id->integer_value == 1);
        assert(zkpig::config::get_string(tree, {"prover-input-store", "s3", "aws-provider", "credentials",
                                                "secret-key"}) == "s3cr3t");
        assert(zkpig::config::get_string(tree, {"data-dir"}) == "data");

        const auto unset = zkpig::config::to_value(zkpig::config::prepare_config(Settings{}));
        assert(zkpig::config::find_path(unset, {"chain", "id"})->is_null());
    }

    // The config command prints the resolved configuration as JSON.
    {
        Settings settings;
        settings.set("chain.rpc-url", "http://localhost:8545");
        settings.set("data-dir", "/tmp/zkpig \"quoted\"");
        std::ostringstream out;
        zkpig::commands::run_config_command(settings, out);
        const auto text = out.str();
        assert(!text.empty() && text.back() == '\n');
        assert(text == zkpig::config::to_json(zkpig::config::to_value(zkpig::config::prepare_config(settings)), 2) + "\n");
        assert(text.find("\"data-dir\": \"/tmp/zkpig \\\"quoted\\\"\"") != std::string::npos);
        assert(text.find("\"rpc-url\": \"http://localhost:8545\"") != std::string::npos);
        assert(text.find("\"id\": null") != std::string::npos);
        assert(text.find("\"dir\": \"/tmp/zkpig \\\"quoted\\\"/inputs\"") != std::string::npos);
    }

    // Configuration errors from the config command carry the config stage.
    {
        Settings settings;
        settings.set("log.format", "xml");
        std::ostringstream out;
        bool failed = false;
        try {
            zkpig::commands::run_config_command(settings, out);
        } catch (const CommandError& ex) {
            failed = true;
            assert(ex.stage() == Stage::Config);
            assert(ex.code() == "E_CONFIG_VALUE");
        }
        assert(failed);
        assert(out.str().empty());
    }

    // Output failures are reported.
    {
        std::ostringstream out;
        out.setstate(std::ios::badbit);
        bool failed = false;
        try {
            zkpig::commands::run_config_command(Settings{}, out);
        } catch (const CommandError& ex) {
            failed = true;
            assert(ex.stage() == Stage::Output);
            assert(ex.code() == "E_CONFIG_OUTPUT");
        }
        assert(failed);
    }

    // JSON writer.
    {
        Value root = Value::make_object();
        zkpig::config::set_path(root, zkpig::config::split_path("a.b.c"), Value("x\ny"));
        zkpig::config::set_path(root, {"n"}, Value(std::int64_t{7}));
        zkpig::config::set_path(root, {"unset"}, Value());
        assert(zkpig::config::to_json(root) == "{\"a\":{\"b\":{\"c\":\"x\\ny\"}},\"n\":7,\"unset\":null}");
        assert(zkpig::config::to_json(Value::make_object(), 2) == "{}");

        Value flat = Value::make_object();
        zkpig::config::set_path(flat, {"k"}, Value("v"));
        assert(zkpig::config::to_json(flat, 2) == "{\n  \"k\": \"v\"\n}");
        assert(zkpig::config::join_path({"a", "b"}) == "a.b");

        bool rejected = false;
        try {
            (void)zkpig::config::get_string(root, {"n"});
        } catch (const ConfigError& ex) {
            rejected = ex.code == "E_CONFIG_TYPE";
        }
        assert(rejected);
    }

    return 0;
}
