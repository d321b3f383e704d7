#pragma once

#include "zkpig/Config.hpp"
#include "zkpig/Export.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zkpig::validation {

struct GroupField {
    std::string_view name;
    // Optional fields switch the group on but are never reported missing.
    bool required{true};
    const std::string& (*read)(const Config& config);
};

struct ZKPIG_API GroupViolation {
    std::string group;
    std::vector<std::string> missing_fields;

    [[nodiscard]] std::string message() const;
};

// Fields that are either all unset or, once any of them is set, all required ones present.
class ZKPIG_API RequiredTogetherRule {
public:
    RequiredTogetherRule(std::string group, std::vector<GroupField> fields);

    [[nodiscard]] bool in_use(const Config& config) const;
    [[nodiscard]] std::optional<GroupViolation> check(const Config& config) const;

    [[nodiscard]] const std::string& group() const noexcept { return group_; }
    [[nodiscard]] const std::vector<GroupField>& fields() const noexcept { return fields_; }

private:
    std::string group_;
    std::vector<GroupField> fields_;
};

// Bucket, key prefix, region, access key and secret key of the S3 prover-input store.
ZKPIG_API const RequiredTogetherRule& s3_storage_rule();

ZKPIG_API std::optional<GroupViolation> validate_s3_config(const Config& config);

}  // namespace zkpig::validation
