#pragma once

#include "core/utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tablegate {

// ============================================================================
// Policy Types
// ============================================================================

enum class Operation : uint8_t {
    SELECT,
    INSERT,
    UPDATE,
    DELETE,
    ALL         // Wildcard: applies to every operation (policy side only)
};

enum class PolicyKind : uint8_t {
    PERMISSIVE,     // OR-combined: grants access
    RESTRICTIVE     // AND-combined: narrows access
};

[[nodiscard]] inline constexpr std::string_view operation_to_string(Operation op) {
    switch (op) {
        case Operation::SELECT: return "select";
        case Operation::INSERT: return "insert";
        case Operation::UPDATE: return "update";
        case Operation::DELETE: return "delete";
        case Operation::ALL:    return "all";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Operation> parse_operation(std::string_view str) {
    const std::string lower = utils::to_lower(utils::trim(str));
    if (lower == "select") return Operation::SELECT;
    if (lower == "insert") return Operation::INSERT;
    if (lower == "update") return Operation::UPDATE;
    if (lower == "delete") return Operation::DELETE;
    if (lower == "all")    return Operation::ALL;
    return std::nullopt;
}

[[nodiscard]] inline constexpr std::string_view policy_kind_to_string(PolicyKind kind) {
    return kind == PolicyKind::PERMISSIVE ? "PERMISSIVE" : "RESTRICTIVE";
}

[[nodiscard]] inline std::optional<PolicyKind> parse_policy_kind(std::string_view str) {
    const std::string lower = utils::to_lower(utils::trim(str));
    if (lower == "permissive")  return PolicyKind::PERMISSIVE;
    if (lower == "restrictive") return PolicyKind::RESTRICTIVE;
    return std::nullopt;
}

/**
 * @brief Row-level access policy
 *
 * using_expr and check_expr are opaque boolean SQL fragments, never parsed.
 * At least one of them is present (enforced by the registry table and by
 * the loaders).
 */
struct Policy {
    int64_t id = 0;
    std::string name;
    std::optional<std::string> description;
    bool is_enabled = true;
    std::string table_name;
    Operation operation = Operation::ALL;
    PolicyKind kind = PolicyKind::PERMISSIVE;
    std::optional<std::string> using_expr;     // Which existing rows are visible/affected
    std::optional<std::string> check_expr;     // Which proposed rows may be written

    [[nodiscard]] bool applies_to(Operation op) const {
        return operation == Operation::ALL || operation == op;
    }

    [[nodiscard]] bool has_expression() const {
        return using_expr.has_value() || check_expr.has_value();
    }
};

} // namespace tablegate
