#include "zkpig/Config.hpp"

#include <filesystem>

namespace zkpig {

namespace {

std::string child_dir(const std::string& base, const char* name) {
    return (std::filesystem::path(base) / name).generic_string();
}

}  // namespace

void Config::set_defaults() {
    if (data_dir.empty()) {
        data_dir = kDefaultDataDir;
    }
    if (preflight_data_store.file.dir.empty()) {
        preflight_data_store.file.dir = child_dir(data_dir, "preflight");
    }
    if (prover_input_store.file.dir.empty()) {
        prover_input_store.file.dir = child_dir(data_dir, "inputs");
    }
    if (prover_input_store.content_type.empty()) {
        prover_input_store.content_type = kDefaultContentType;
    }
    if (prover_input_store.content_encoding.empty()) {
        prover_input_store.content_encoding = kDefaultContentEncoding;
    }
    if (log.level.empty()) {
        log.level = kDefaultLogLevel;
    }
    if (log.format.empty()) {
        log.format = kDefaultLogFormat;
    }
}

}  // namespace zkpig
