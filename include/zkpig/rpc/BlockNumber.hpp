#pragma once

#include "zkpig/Export.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace zkpig::rpc {

enum class BlockTag {
    Latest,
    Earliest,
    Pending,
    Safe,
    Finalized
};

ZKPIG_API std::string_view block_tag_to_string(BlockTag tag);
ZKPIG_API std::optional<BlockTag> block_tag_from_string(std::string_view text);

// Either a concrete block height or a named tag understood by JSON-RPC nodes.
class ZKPIG_API BlockNumber {
public:
    BlockNumber() : value_(BlockTag::Latest) {}

    static BlockNumber from_height(std::uint64_t height) { return BlockNumber(height); }
    static BlockNumber from_tag(BlockTag tag) { return BlockNumber(tag); }

    [[nodiscard]] bool is_tag() const noexcept { return std::holds_alternative<BlockTag>(value_); }
    [[nodiscard]] std::optional<std::uint64_t> height() const;
    [[nodiscard]] std::optional<BlockTag> tag() const;

    // JSON-RPC block argument: "0x7b" for heights, the tag name otherwise.
    [[nodiscard]] std::string to_rpc_argument() const;

    // Human readable form: decimal height or the tag name.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const BlockNumber& other) const { return value_ == other.value_; }

private:
    explicit BlockNumber(std::uint64_t height) : value_(height) {}
    explicit BlockNumber(BlockTag tag) : value_(tag) {}

    std::variant<std::uint64_t, BlockTag> value_;
};

// Accepts decimal and 0x-prefixed hexadecimal heights, or a tag name.
// On failure returns std::nullopt and describes the problem in error_message.
ZKPIG_API std::optional<BlockNumber> parse_block_number(std::string_view text, std::string& error_message);

}  // namespace zkpig::rpc
