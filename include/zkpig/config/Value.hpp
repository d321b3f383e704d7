#pragma once

#include "zkpig/Export.hpp"

#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace zkpig::config {

enum class ValueType {
    Null,
    Integer,
    String,
    Object
};

// Configuration tree: nested objects with string or integer leaves, null marking unset values.
struct ZKPIG_API Value {
    ValueType type{ValueType::Null};
    std::int64_t integer_value{0};
    std::string string_value;
    std::map<std::string, Value> object_value;

    Value() = default;
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}
    Value(const char* value) : Value(std::string(value)) {}

    static Value make_object() {
        Value value;
        value.type = ValueType::Object;
        return value;
    }

    bool is_null() const { return type == ValueType::Null; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }

    std::map<std::string, Value>& ensure_object();

    const std::map<std::string, Value>& as_object() const;
    std::map<std::string, Value>& as_object() { return ensure_object(); }

    bool operator==(const Value& other) const;
};

struct ZKPIG_API ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {})
        : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
        if (!code.empty()) {
            formatted = "[" + code + "] " + message;
        } else {
            formatted = message;
        }
    }

    const char* what() const noexcept override { return formatted.c_str(); }
};

// Serializes `value` as JSON. indent == 0 yields a single line.
ZKPIG_API std::string to_json(const Value& value, int indent = 0);

ZKPIG_API Value merge_objects(const Value& base, const Value& overlay);
ZKPIG_API const Value* find_path(const Value& root, const std::vector<std::string>& path);
ZKPIG_API std::vector<std::string> split_path(std::string_view dotted);
ZKPIG_API std::string join_path(const std::vector<std::string>& path);
ZKPIG_API std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path);

// Creates intermediate objects as needed.
ZKPIG_API void set_path(Value& root, const std::vector<std::string>& path, Value value);

}  // namespace zkpig::config
