#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cortexnet {

enum class ValueType : std::uint8_t {
    Null = 0,
    Boolean = 1,
    Integer = 2,
    Double = 3,
    String = 4,
    Array = 5,
    Object = 6,
};

// Opaque inference payload: inputs, stage outputs and final results all travel as a Value.
struct Value {
    using Array = std::vector<Value>;
    using Object = std::map<std::string, Value>;

    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    Array array_value;
    Object object_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(int value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(double value) : type(ValueType::Double), double_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}
    Value(const char* value) : Value(std::string(value)) {}
    explicit Value(Array values) : type(ValueType::Array), array_value(std::move(values)) {}
    explicit Value(Object fields) : type(ValueType::Object), object_value(std::move(fields)) {}

    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_double() const { return type == ValueType::Double; }
    bool is_number() const { return is_integer() || is_double(); }
    bool is_string() const { return type == ValueType::String; }
    bool is_array() const { return type == ValueType::Array; }
    bool is_object() const { return type == ValueType::Object; }

    // Integers widen to double; non-numeric values read as 0.
    double as_number() const;

    const Array& as_array() const {
        static const Array empty{};
        return type == ValueType::Array ? array_value : empty;
    }

    const Object& as_object() const {
        static const Object empty{};
        return type == ValueType::Object ? object_value : empty;
    }

    Array& ensure_array();
    Object& ensure_object();

    // Object field lookup; nullptr when absent or when this is not an object.
    const Value* find(const std::string& key) const;
    Value& operator[](const std::string& key) { return ensure_object()[key]; }
    void push_back(Value value) { ensure_array().push_back(std::move(value)); }

    std::size_t size() const;
};

// Structural equality; Integer(1) and Double(1.0) are distinct literals.
bool operator==(const Value& lhs, const Value& rhs);
inline bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

std::string to_string(ValueType type);
// Compact JSON-like rendering used by logs and the simulation output.
std::string to_display_string(const Value& value);

}  // namespace cortexnet
