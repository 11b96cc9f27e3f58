#include "mapper/value_mapper.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <map>

namespace tablegate {

TypedParam ValueMapper::map(std::string_view json_literal) {
    const std::string literal = utils::trim(json_literal);

    if (literal.empty() || literal == "null") return TypedParam::null();
    if (literal == "true") return TypedParam::boolean(true);
    if (literal == "false") return TypedParam::boolean(false);

    switch (literal.front()) {
        case '"': {
            std::string decoded;
            if (!glz::read_json(decoded, literal)) {
                return TypedParam::string(std::move(decoded));
            }
            return TypedParam::string(literal);
        }
        case '[':
        case '{':
            if (JsonValue::try_parse(literal)) {
                return TypedParam::json(literal);
            }
            return TypedParam::string(literal);
        default:
            break;
    }

    if (looks_like_number(literal)) {
        return map_number(literal);
    }
    return TypedParam::string(literal);
}

TypedParam ValueMapper::map(const JsonValue& value) {
    if (value.is_null()) return TypedParam::null();
    if (value.is_boolean()) return TypedParam::boolean(value.get<bool>());
    if (value.is_string()) return TypedParam::string(value.get<std::string>());
    if (value.is_number()) {
        const double d = value.get<double>();
        // Integral doubles inside the exactly-representable range become INT64
        if (value.is_number_integer() && std::fabs(d) <= 9007199254740992.0) {
            return TypedParam::int64(static_cast<int64_t>(d));
        }
        return TypedParam::float64(d);
    }
    return TypedParam::json(value.dump());
}

Result<std::vector<FieldValue>> ValueMapper::map_object(std::string_view json_object) {
    using R = Result<std::vector<FieldValue>>;

    const std::string text = utils::trim(json_object);
    if (text.empty() || text.front() != '{') {
        return R::error(ErrorCategory::INVALID_PAYLOAD, "Payload must be a JSON object");
    }

    // raw_json keeps each member's literal text so numbers are not rounded
    std::map<std::string, glz::raw_json> members;
    if (auto ec = glz::read_json(members, text)) {
        return R::error(ErrorCategory::INVALID_PAYLOAD,
            std::format("Malformed JSON payload: {}", glz::format_error(ec, text)));
    }

    std::vector<FieldValue> fields;
    fields.reserve(members.size());
    for (const auto& [column, raw] : members) {
        fields.push_back(FieldValue{column, map(raw.str)});
    }
    return R::ok(std::move(fields));
}

std::string ValueMapper::to_json(const TypedParam& param) {
    switch (param.kind()) {
        case ParamKind::NULL_VALUE:
            return "null";
        case ParamKind::BOOLEAN:
            return std::get<bool>(param.value) ? "true" : "false";
        case ParamKind::INT64:
            return std::to_string(std::get<int64_t>(param.value));
        case ParamKind::FLOAT64:
            return format_double(std::get<double>(param.value));
        case ParamKind::STRING:
            return JsonValue(std::get<std::string>(param.value)).dump();
        case ParamKind::JSON:
            return std::get<JsonText>(param.value).text;
    }
    return "null";
}

std::optional<std::string> ValueMapper::to_text(const TypedParam& param) {
    switch (param.kind()) {
        case ParamKind::NULL_VALUE:
            return std::nullopt;
        case ParamKind::BOOLEAN:
            return std::string(std::get<bool>(param.value) ? "true" : "false");
        case ParamKind::INT64:
            return std::to_string(std::get<int64_t>(param.value));
        case ParamKind::FLOAT64:
            return std::format("{}", std::get<double>(param.value));
        case ParamKind::STRING:
            return std::get<std::string>(param.value);
        case ParamKind::JSON:
            return std::get<JsonText>(param.value).text;
    }
    return std::nullopt;
}

// ============================================================================
// Numbers
// ============================================================================

bool ValueMapper::looks_like_number(std::string_view literal) {
    // JSON number grammar: -?(0|[1-9]\d*)(\.\d+)?([eE][+-]?\d+)?
    size_t i = 0;
    const auto digit = [&](size_t pos) {
        return pos < literal.size() && literal[pos] >= '0' && literal[pos] <= '9';
    };

    if (i < literal.size() && literal[i] == '-') ++i;
    if (!digit(i)) return false;
    if (literal[i] == '0') {
        ++i;
    } else {
        while (digit(i)) ++i;
    }
    if (i < literal.size() && literal[i] == '.') {
        ++i;
        if (!digit(i)) return false;
        while (digit(i)) ++i;
    }
    if (i < literal.size() && (literal[i] == 'e' || literal[i] == 'E')) {
        ++i;
        if (i < literal.size() && (literal[i] == '+' || literal[i] == '-')) ++i;
        if (!digit(i)) return false;
        while (digit(i)) ++i;
    }
    return i == literal.size();
}

TypedParam ValueMapper::map_number(std::string_view literal) {
    const char* first = literal.data();
    const char* last = literal.data() + literal.size();

    const bool integral = literal.find_first_of(".eE") == std::string_view::npos;
    if (integral) {
        int64_t i = 0;
        const auto [ptr, ec] = std::from_chars(first, last, i);
        if (ec == std::errc{} && ptr == last) {
            return TypedParam::int64(i);
        }
    } else {
        double d = 0.0;
        const auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec == std::errc{} && ptr == last && std::isfinite(d)) {
            return TypedParam::float64(d);
        }
    }

    // Oversized: keep the literal digits
    TypedParam fallback = TypedParam::string(std::string(literal));
    fallback.numeric_fallback = true;
    return fallback;
}

std::string ValueMapper::format_double(double value) {
    // Shortest round-trip form; keep a fractional marker so it reads back as non-integral
    std::string out = std::format("{}", value);
    if (out.find_first_of(".eEn") == std::string::npos) {
        out += ".0";
    }
    return out;
}

} // namespace tablegate
