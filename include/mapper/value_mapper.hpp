#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "core/typed_param.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tablegate {

/**
 * @brief Maps untyped payload values to typed statement parameters
 *
 * Mapping rules:
 *   null                 -> NULL_VALUE
 *   true / false         -> BOOLEAN
 *   integral number      -> INT64
 *   non-integral number  -> FLOAT64
 *   oversized number     -> STRING holding the literal digits (numeric_fallback)
 *   string               -> STRING
 *   array / object       -> JSON (literal text, bound as jsonb)
 *
 * Works on raw JSON literal text so oversized numbers keep their digits.
 * No coercion against declared column types happens here; mismatches
 * surface as execution errors from the backend.
 */
class ValueMapper {
public:
    /**
     * @brief Map one JSON literal. Total: text that is not valid JSON maps to
     *        a STRING holding the trimmed text.
     */
    [[nodiscard]] static TypedParam map(std::string_view json_literal);

    /**
     * @brief Map a parsed DOM value (numbers already carry double precision)
     */
    [[nodiscard]] static TypedParam map(const JsonValue& value);

    /**
     * @brief Map every member of a JSON object payload to a field
     * @return Fields ordered by column name; INVALID_PAYLOAD when the text
     *         is not a JSON object
     */
    [[nodiscard]] static Result<std::vector<FieldValue>> map_object(std::string_view json_object);

    /**
     * @brief Serialize a parameter back to a JSON literal
     *
     * Reproduces the original literal for every kind except the oversized
     * number fallback, which comes back as a quoted string.
     */
    [[nodiscard]] static std::string to_json(const TypedParam& param);

    /**
     * @brief Text-format wire value for the backend (nullopt = SQL NULL)
     */
    [[nodiscard]] static std::optional<std::string> to_text(const TypedParam& param);

private:
    static TypedParam map_number(std::string_view literal);
    static bool looks_like_number(std::string_view literal);
    static std::string format_double(double value);
};

} // namespace tablegate
