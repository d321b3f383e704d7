#pragma once

#include "zkpig/Config.hpp"
#include "zkpig/Export.hpp"
#include "zkpig/config/Value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zkpig::config {

struct SettingDescriptor {
    std::string_view key;
    std::string_view flag;
    std::string_view env;
    std::string_view placeholder;
    std::string_view description;
};

// Every global setting, in the order usage text lists them.
ZKPIG_API const std::vector<SettingDescriptor>& setting_descriptors();
ZKPIG_API const SettingDescriptor* find_setting_by_flag(std::string_view flag);

// Merged process-wide settings, keyed by dotted path (e.g. "chain.rpc-url").
class ZKPIG_API Settings {
public:
    using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view)>;

    Settings() = default;

    static Settings from_environment();
    static Settings from_environment(const EnvironmentLookup& lookup);

    void set(std::string_view key, std::string value);
    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    // Values present in `overlay` win.
    void merge(const Settings& overlay);

    [[nodiscard]] const Value& tree() const noexcept { return root_; }

private:
    Value root_{Value::make_object()};
};

// Converts settings into a typed configuration. Throws ConfigError on invalid values.
ZKPIG_API Config resolve_config(const Settings& settings);

// resolve_config followed by Config::set_defaults.
ZKPIG_API Config prepare_config(const Settings& settings);

ZKPIG_API Value to_value(const Config& config);

}  // namespace zkpig::config
