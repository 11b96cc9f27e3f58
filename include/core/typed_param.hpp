#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tablegate {

/**
 * @brief Closed set of value kinds that can be bound into a statement
 */
enum class ParamKind : uint8_t {
    NULL_VALUE,
    BOOLEAN,
    INT64,
    FLOAT64,
    STRING,
    JSON
};

[[nodiscard]] inline constexpr std::string_view param_kind_to_string(ParamKind k) {
    switch (k) {
        case ParamKind::NULL_VALUE: return "null";
        case ParamKind::BOOLEAN:    return "boolean";
        case ParamKind::INT64:      return "int64";
        case ParamKind::FLOAT64:    return "float64";
        case ParamKind::STRING:     return "string";
        case ParamKind::JSON:       return "json";
    }
    return "unknown";
}

// Opaque JSON document kept as its literal text
struct JsonText {
    std::string text;
    bool operator==(const JsonText&) const = default;
};

/**
 * @brief A typed statement parameter
 *
 * numeric_fallback marks a STRING produced from a number literal too large
 * for int64/float64; the text holds the literal digits.
 */
struct TypedParam {
    std::variant<std::monostate, bool, int64_t, double, std::string, JsonText> value;
    bool numeric_fallback = false;

    TypedParam() = default;
    static TypedParam null() { return {}; }
    static TypedParam boolean(bool v) { TypedParam p; p.value = v; return p; }
    static TypedParam int64(int64_t v) { TypedParam p; p.value = v; return p; }
    static TypedParam float64(double v) { TypedParam p; p.value = v; return p; }
    static TypedParam string(std::string v) { TypedParam p; p.value = std::move(v); return p; }
    static TypedParam json(std::string v) { TypedParam p; p.value = JsonText{std::move(v)}; return p; }

    [[nodiscard]] ParamKind kind() const {
        return static_cast<ParamKind>(value.index());
    }

    [[nodiscard]] bool is_null() const { return kind() == ParamKind::NULL_VALUE; }

    bool operator==(const TypedParam&) const = default;
};

/**
 * @brief A named value: one payload field bound to one column
 */
struct FieldValue {
    std::string column;
    TypedParam param;

    bool operator==(const FieldValue&) const = default;
};

} // namespace tablegate
