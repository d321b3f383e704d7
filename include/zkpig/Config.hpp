#pragma once

#include "zkpig/Export.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace zkpig {

struct ZKPIG_API Config {
    struct Chain {
        std::optional<std::uint64_t> id{};
        std::string rpc_url;
    };

    struct FileStore {
        std::string dir;
    };

    struct S3Store {
        struct AwsProvider {
            struct Credentials {
                std::string access_key;
                std::string secret_key;
            };

            std::string region;
            Credentials credentials;
        };

        std::string bucket;
        std::string bucket_key_prefix;
        AwsProvider aws_provider;
    };

    struct PreflightDataStore {
        FileStore file;
    };

    struct ProverInputStore {
        std::string content_type;
        std::string content_encoding;
        FileStore file;
        S3Store s3;
    };

    struct Log {
        std::string level;
        std::string format;
    };

    Chain chain;
    std::string data_dir;
    PreflightDataStore preflight_data_store;
    ProverInputStore prover_input_store;
    Log log;

    // Fills every unset field; store directories derive from data_dir.
    void set_defaults();
};

inline constexpr const char* kDefaultDataDir = "data";
inline constexpr const char* kDefaultContentType = "application/json";
inline constexpr const char* kDefaultContentEncoding = "plain";
inline constexpr const char* kDefaultLogLevel = "info";
inline constexpr const char* kDefaultLogFormat = "text";

}  // namespace zkpig
