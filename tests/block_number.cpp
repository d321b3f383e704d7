#include "zkpig/rpc/BlockNumber.hpp"

#include <cassert>
#include <string>

using zkpig::rpc::BlockNumber;
using zkpig::rpc::BlockTag;
using zkpig::rpc::parse_block_number;

namespace {

BlockNumber parse_ok(const std::string& text) {
    std::string error;
    const auto parsed = parse_block_number(text, error);
    assert(parsed.has_value());
    assert(error.empty());
    return *parsed;
}

std::string parse_error(const std::string& text) {
    std::string error;
    const auto parsed = parse_block_number(text, error);
    assert(!parsed.has_value());
    assert(!error.empty());
    return error;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

int main() {
    const auto decimal = parse_ok("123");
    assert(!decimal.is_tag());
    assert(decimal.height() == 123u);
    assert(decimal.to_string() == "123");
    assert(decimal.to_rpc_argument() == "0x7b");

    const auto hex = parse_ok("0x7b");
    assert(hex == decimal);
    assert(parse_ok("0X7B") == decimal);
    assert(parse_ok("0") == BlockNumber::from_height(0));
    assert(parse_ok("0").to_rpc_argument() == "0x0");
    assert(parse_ok("18446744073709551615").height() == 18446744073709551615ull);
    assert(parse_ok("0xffffffffffffffff").to_rpc_argument() == "0xffffffffffffffff");

    const auto latest = parse_ok("latest");
    assert(latest.is_tag());
    assert(latest.tag() == BlockTag::Latest);
    assert(!latest.height().has_value());
    assert(latest.to_rpc_argument() == "latest");
    assert(latest == BlockNumber{});

    assert(parse_ok("earliest").tag() == BlockTag::Earliest);
    assert(parse_ok("pending").tag() == BlockTag::Pending);
    assert(parse_ok("safe").tag() == BlockTag::Safe);
    assert(parse_ok("finalized").to_string() == "finalized");

    assert(parse_error("") == "empty block number");
    assert(contains(parse_error("abc"), "'abc' is neither a block height"));
    assert(contains(parse_error("Latest"), "neither a block height"));
    assert(contains(parse_error("-1"), "neither a block height"));
    assert(contains(parse_error("+1"), "neither a block height"));
    assert(contains(parse_error("12 "), "neither a block height"));
    assert(parse_error("0x") == "'0x': missing digits");
    assert(parse_error("0xzz") == "'0xzz': invalid hexadecimal digit");
    assert(parse_error("18446744073709551616") == "'18446744073709551616': value exceeds 64 bits");
    assert(parse_error("0x10000000000000000") == "'0x10000000000000000': value exceeds 64 bits");

    return 0;
}
