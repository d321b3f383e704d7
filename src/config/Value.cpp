#include "zkpig/config/Value.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace zkpig::config {

namespace {

void write_escaped(std::ostringstream& out, std::string_view text) {
    out << '"';
    for (const unsigned char ch : text) {
        switch (ch) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\b':
                out << "\\b";
                break;
            case '\f':
                out << "\\f";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\r':
                out << "\\r";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                if (ch < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(ch)
                        << std::dec << std::setfill(' ');
                } else {
                    out << static_cast<char>(ch);
                }
                break;
        }
    }
    out << '"';
}

void write_value(std::ostringstream& out, const Value& value, int indent, int depth) {
    const auto newline = [&](int level) {
        if (indent > 0) {
            out << '\n' << std::string(static_cast<std::size_t>(indent * level), ' ');
        }
    };

    switch (value.type) {
        case ValueType::Null:
            out << "null";
            return;
        case ValueType::Integer:
            out << value.integer_value;
            return;
        case ValueType::String:
            write_escaped(out, value.string_value);
            return;
        case ValueType::Object: {
            const auto& fields = value.as_object();
            if (fields.empty()) {
                out << "{}";
                return;
            }
            out << '{';
            bool first = true;
            for (const auto& [key, child] : fields) {
                if (!first) {
                    out << ',';
                }
                first = false;
                newline(depth + 1);
                write_escaped(out, key);
                out << (indent > 0 ? ": " : ":");
                write_value(out, child, indent, depth + 1);
            }
            newline(depth);
            out << '}';
            return;
        }
    }
}

}  // namespace

std::map<std::string, Value>& Value::ensure_object() {
    if (type != ValueType::Object) {
        type = ValueType::Object;
        object_value.clear();
        string_value.clear();
    }
    return object_value;
}

const std::map<std::string, Value>& Value::as_object() const {
    static const std::map<std::string, Value> empty{};
    return type == ValueType::Object ? object_value : empty;
}

bool Value::operator==(const Value& other) const {
    if (type != other.type) {
        return false;
    }
    switch (type) {
        case ValueType::Null:
            return true;
        case ValueType::Integer:
            return integer_value == other.integer_value;
        case ValueType::String:
            return string_value == other.string_value;
        case ValueType::Object:
            return object_value == other.object_value;
    }
    return false;
}

std::string to_json(const Value& value, int indent) {
    std::ostringstream out;
    write_value(out, value, indent, 0);
    return out.str();
}

Value merge_objects(const Value& base, const Value& overlay) {
    if (!overlay.is_object()) {
        return overlay;
    }
    Value result = base;
    if (!result.is_object()) {
        result = Value::make_object();
    }
    for (const auto& [key, value] : overlay.as_object()) {
        if (value.is_object() && result.as_object().contains(key) && result.as_object()[key].is_object()) {
            result.as_object()[key] = merge_objects(result.as_object()[key], value);
        } else {
            result.as_object()[key] = value;
        }
    }
    return result;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->as_object().find(segment);
        if (it == node->as_object().end()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node;
}

std::vector<std::string> split_path(std::string_view dotted) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= dotted.size()) {
        const auto dot = dotted.find('.', start);
        const auto end = dot == std::string_view::npos ? dotted.size() : dot;
        if (end > start) {
            segments.emplace_back(dotted.substr(start, end - start));
        }
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return segments;
}

std::string join_path(const std::vector<std::string>& path) {
    if (path.empty()) {
        return "<root>";
    }
    std::string combined;
    for (std::size_t i = 0; i < path.size(); ++i) {
        combined += path[i];
        if (i + 1 < path.size()) {
            combined += '.';
        }
    }
    return combined;
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

void set_path(Value& root, const std::vector<std::string>& path, Value value) {
    if (path.empty()) {
        root = std::move(value);
        return;
    }
    Value* node = &root;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        auto& child = node->ensure_object()[path[i]];
        if (!child.is_object()) {
            child = Value::make_object();
        }
        node = &child;
    }
    node->ensure_object()[path.back()] = std::move(value);
}

}  // namespace zkpig::config
