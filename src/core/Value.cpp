#include "cortexnet/Value.hpp"

#include <iomanip>
#include <sstream>

namespace cortexnet {

namespace {

void write_escaped(std::ostringstream& oss, const std::string& text) {
    oss << '"';
    for (const unsigned char ch : text) {
        switch (ch) {
            case '"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\t':
                oss << "\\t";
                break;
            default:
                if (ch < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(ch)
                        << std::dec;
                } else {
                    oss << static_cast<char>(ch);
                }
                break;
        }
    }
    oss << '"';
}

void render(std::ostringstream& oss, const Value& value) {
    switch (value.type) {
        case ValueType::Null:
            oss << "null";
            break;
        case ValueType::Boolean:
            oss << (value.boolean_value ? "true" : "false");
            break;
        case ValueType::Integer:
            oss << value.integer_value;
            break;
        case ValueType::Double:
            oss << value.double_value;
            break;
        case ValueType::String:
            write_escaped(oss, value.string_value);
            break;
        case ValueType::Array: {
            oss << '[';
            bool first = true;
            for (const auto& item : value.array_value) {
                if (!first) {
                    oss << ',';
                }
                first = false;
                render(oss, item);
            }
            oss << ']';
            break;
        }
        case ValueType::Object: {
            oss << '{';
            bool first = true;
            for (const auto& [key, item] : value.object_value) {
                if (!first) {
                    oss << ',';
                }
                first = false;
                write_escaped(oss, key);
                oss << ':';
                render(oss, item);
            }
            oss << '}';
            break;
        }
    }
}

}  // namespace

double Value::as_number() const {
    if (type == ValueType::Integer) {
        return static_cast<double>(integer_value);
    }
    if (type == ValueType::Double) {
        return double_value;
    }
    return 0.0;
}

Value::Array& Value::ensure_array() {
    if (type != ValueType::Array) {
        *this = make_array();
    }
    return array_value;
}

Value::Object& Value::ensure_object() {
    if (type != ValueType::Object) {
        *this = make_object();
    }
    return object_value;
}

const Value* Value::find(const std::string& key) const {
    if (type != ValueType::Object) {
        return nullptr;
    }
    const auto it = object_value.find(key);
    return it == object_value.end() ? nullptr : &it->second;
}

std::size_t Value::size() const {
    switch (type) {
        case ValueType::Array:
            return array_value.size();
        case ValueType::Object:
            return object_value.size();
        case ValueType::String:
            return string_value.size();
        default:
            return 0;
    }
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.type != rhs.type) {
        return false;
    }
    switch (lhs.type) {
        case ValueType::Null:
            return true;
        case ValueType::Boolean:
            return lhs.boolean_value == rhs.boolean_value;
        case ValueType::Integer:
            return lhs.integer_value == rhs.integer_value;
        case ValueType::Double:
            return lhs.double_value == rhs.double_value;
        case ValueType::String:
            return lhs.string_value == rhs.string_value;
        case ValueType::Array:
            return lhs.array_value == rhs.array_value;
        case ValueType::Object:
            return lhs.object_value == rhs.object_value;
    }
    return false;
}

std::string to_string(ValueType type) {
    switch (type) {
        case ValueType::Null:
            return "null";
        case ValueType::Boolean:
            return "boolean";
        case ValueType::Integer:
            return "integer";
        case ValueType::Double:
            return "double";
        case ValueType::String:
            return "string";
        case ValueType::Array:
            return "array";
        case ValueType::Object:
            return "object";
    }
    return "null";
}

std::string to_display_string(const Value& value) {
    std::ostringstream oss;
    render(oss, value);
    return oss.str();
}

}  // namespace cortexnet
