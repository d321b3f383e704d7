#include "zkpig/rpc/BlockNumber.hpp"

#include <array>
#include <charconv>
#include <system_error>
#include <utility>

namespace zkpig::rpc {

namespace {

constexpr std::array<std::pair<BlockTag, std::string_view>, 5> kBlockTags{{
    {BlockTag::Latest, "latest"},
    {BlockTag::Earliest, "earliest"},
    {BlockTag::Pending, "pending"},
    {BlockTag::Safe, "safe"},
    {BlockTag::Finalized, "finalized"},
}};

bool parse_digits(std::string_view digits, int base, std::uint64_t& value, std::string& error_message) {
    if (digits.empty()) {
        error_message = "missing digits";
        return false;
    }
    const char* begin = digits.data();
    const char* end = begin + digits.size();
    const auto result = std::from_chars(begin, end, value, base);
    if (result.ec == std::errc::result_out_of_range) {
        error_message = "value exceeds 64 bits";
        return false;
    }
    if (result.ec != std::errc{} || result.ptr != end) {
        error_message = base == 16 ? "invalid hexadecimal digit" : "invalid decimal digit";
        return false;
    }
    return true;
}

}  // namespace

std::string_view block_tag_to_string(BlockTag tag) {
    for (const auto& [candidate, name] : kBlockTags) {
        if (candidate == tag) {
            return name;
        }
    }
    return "latest";
}

std::optional<BlockTag> block_tag_from_string(std::string_view text) {
    for (const auto& [tag, name] : kBlockTags) {
        if (name == text) {
            return tag;
        }
    }
    return std::nullopt;
}

std::optional<std::uint64_t> BlockNumber::height() const {
    if (const auto* height = std::get_if<std::uint64_t>(&value_)) {
        return *height;
    }
    return std::nullopt;
}

std::optional<BlockTag> BlockNumber::tag() const {
    if (const auto* tag = std::get_if<BlockTag>(&value_)) {
        return *tag;
    }
    return std::nullopt;
}

std::string BlockNumber::to_rpc_argument() const {
    if (const auto* tag = std::get_if<BlockTag>(&value_)) {
        return std::string(block_tag_to_string(*tag));
    }
    std::array<char, 16> buffer{};
    const auto value = std::get<std::uint64_t>(value_);
    const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, 16);
    return "0x" + std::string(buffer.data(), result.ptr);
}

std::string BlockNumber::to_string() const {
    if (const auto* tag = std::get_if<BlockTag>(&value_)) {
        return std::string(block_tag_to_string(*tag));
    }
    return std::to_string(std::get<std::uint64_t>(value_));
}

std::optional<BlockNumber> parse_block_number(std::string_view text, std::string& error_message) {
    if (text.empty()) {
        error_message = "empty block number";
        return std::nullopt;
    }

    if (const auto tag = block_tag_from_string(text)) {
        return BlockNumber::from_tag(*tag);
    }

    std::uint64_t height{};
    std::string detail;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        if (!parse_digits(text.substr(2), 16, height, detail)) {
            error_message = "'" + std::string(text) + "': " + detail;
            return std::nullopt;
        }
        return BlockNumber::from_height(height);
    }

    if (!parse_digits(text, 10, height, detail)) {
        if (detail == "value exceeds 64 bits") {
            error_message = "'" + std::string(text) + "': " + detail;
        } else {
            error_message = "'" + std::string(text) + "' is neither a block height nor one of "
                            "latest, earliest, pending, safe, finalized";
        }
        return std::nullopt;
    }
    return BlockNumber::from_height(height);
}

}  // namespace zkpig::rpc
