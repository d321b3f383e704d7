#include "zkpig/validation/RequiredTogether.hpp"

#include <algorithm>
#include <utility>

namespace zkpig::validation {

std::string GroupViolation::message() const {
    std::string names;
    for (std::size_t i = 0; i < missing_fields.size(); ++i) {
        if (i > 0) {
            names += ", ";
        }
        names += missing_fields[i];
    }
    return names + " must be specified when using " + group + " storage";
}

RequiredTogetherRule::RequiredTogetherRule(std::string group, std::vector<GroupField> fields)
    : group_(std::move(group)), fields_(std::move(fields)) {}

bool RequiredTogetherRule::in_use(const Config& config) const {
    return std::any_of(fields_.begin(), fields_.end(), [&](const GroupField& field) {
        return !field.read(config).empty();
    });
}

std::optional<GroupViolation> RequiredTogetherRule::check(const Config& config) const {
    if (!in_use(config)) {
        return std::nullopt;
    }

    GroupViolation violation{group_, {}};
    for (const auto& field : fields_) {
        if (field.required && field.read(config).empty()) {
            violation.missing_fields.emplace_back(field.name);
        }
    }
    if (violation.missing_fields.empty()) {
        return std::nullopt;
    }
    return violation;
}

const RequiredTogetherRule& s3_storage_rule() {
    static const RequiredTogetherRule rule{
        "s3",
        {
            {"s3-bucket", true,
             [](const Config& config) -> const std::string& { return config.prover_input_store.s3.bucket; }},
            {"s3-bucket-key-prefix", false,
             [](const Config& config) -> const std::string& {
                 return config.prover_input_store.s3.bucket_key_prefix;
             }},
            {"access-key", true,
             [](const Config& config) -> const std::string& {
                 return config.prover_input_store.s3.aws_provider.credentials.access_key;
             }},
            {"secret-key", true,
             [](const Config& config) -> const std::string& {
                 return config.prover_input_store.s3.aws_provider.credentials.secret_key;
             }},
            {"region", true,
             [](const Config& config) -> const std::string& {
                 return config.prover_input_store.s3.aws_provider.region;
             }},
        }};
    return rule;
}

std::optional<GroupViolation> validate_s3_config(const Config& config) {
    return s3_storage_rule().check(config);
}

}  // namespace zkpig::validation
