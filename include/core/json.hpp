#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tablegate {

/**
 * @brief Thin wrapper around glz::json_t for DOM navigation and building
 *
 * Stores json_t by value. Const operator[] returns copies, so lookups on
 * missing keys or wrong node types yield null instead of throwing.
 * Used for catalog documents, token payloads and CLI output.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) { data_ = v; }
    JsonValue(int v) { data_ = static_cast<double>(v); }
    JsonValue(long long v) { data_ = static_cast<double>(v); }
    JsonValue(long v) { data_ = static_cast<double>(v); }
    JsonValue(double v) { data_ = v; }
    JsonValue(const char* v) { data_ = std::string(v); }
    JsonValue(const std::string& v) { data_ = v; }
    JsonValue(std::string&& v) { data_ = std::move(v); }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool is_number_integer() const {
        if (!data_.is_number()) return false;
        double d = data_.get<double>();
        return d == std::floor(d) && std::isfinite(d);
    }

    // ===== Member Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double; cast to target integral type
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    // Typed member lookup; nullopt when the key is absent, null, or of another type
    [[nodiscard]] std::optional<std::string> string_at(std::string_view key) const {
        const JsonValue v = (*this)[key];
        if (!v.is_string()) return std::nullopt;
        return v.get<std::string>();
    }

    [[nodiscard]] std::optional<double> number_at(std::string_view key) const {
        const JsonValue v = (*this)[key];
        if (!v.is_number()) return std::nullopt;
        return v.get<double>();
    }

    // Accepts JSON booleans and the 0/1 integers catalogs commonly emit
    [[nodiscard]] bool flag_at(std::string_view key, bool default_value = false) const {
        const JsonValue v = (*this)[key];
        if (v.is_boolean()) return v.get<bool>();
        if (v.is_number()) return v.get<double>() != 0.0;
        return default_value;
    }

    // ===== Mutation =====

    // Turns a null value into an object on first use
    JsonValue& set(std::string_view key, JsonValue val) {
        if (!data_.is_object()) data_ = object_t{};
        data_.get_object()[std::string(key)] = std::move(val.data_);
        return *this;
    }

    // Turns a null value into an array on first use
    JsonValue& push_back(JsonValue val) {
        if (!data_.is_array()) data_ = array_t{};
        data_.get_array().push_back(std::move(val.data_));
        return *this;
    }

    // ===== Iteration =====

    template <typename Fn>
    void for_each_element(Fn&& fn) const {
        if (!data_.is_array()) return;
        for (const auto& elem : data_.get_array()) {
            fn(JsonValue(elem));
        }
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue object() {
        glz::json_t j;
        j = object_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue array() {
        glz::json_t j;
        j = array_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error(std::string("JSON parse error: ") + glz::format_error(ec, json_str));
        }
        return JsonValue(std::move(result));
    }

    // Non-throwing variant for untrusted input
    [[nodiscard]] static std::optional<JsonValue> try_parse(std::string_view json_str) {
        glz::json_t result;
        if (glz::read_json(result, json_str)) {
            return std::nullopt;
        }
        return JsonValue(std::move(result));
    }

    // ===== Serialization =====

    // Serializing an in-memory json_t cannot fail; "null" covers the impossible branch
    [[nodiscard]] std::string dump() const {
        auto out = data_.dump();
        return out ? std::move(*out) : std::string("null");
    }

private:
    glz::json_t data_{};
};

} // namespace tablegate
