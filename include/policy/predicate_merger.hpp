#pragma once

#include "policy/policy_types.hpp"

#include <string>
#include <vector>

namespace tablegate {

/**
 * @brief Merged policy predicate for one clause of one statement
 */
struct Predicate {
    enum class Kind : uint8_t {
        UNRESTRICTED,   // Table has no policies: add nothing
        DENY,           // Policies exist, none permissive: renders "false"
        CONDITION       // Merged boolean SQL in sql
    };

    Kind kind = Kind::UNRESTRICTED;
    std::string sql;

    [[nodiscard]] static Predicate unrestricted() { return {}; }
    [[nodiscard]] static Predicate deny() { return {Kind::DENY, "false"}; }
    [[nodiscard]] static Predicate condition(std::string sql) {
        return {Kind::CONDITION, std::move(sql)};
    }

    [[nodiscard]] bool is_unrestricted() const { return kind == Kind::UNRESTRICTED; }
    [[nodiscard]] bool is_deny() const { return kind == Kind::DENY; }
};

/**
 * @brief Combines policy expressions into one predicate
 *
 * Permissive expressions are OR-combined, restrictive ones AND-combined with
 * the permissive disjunction: ((p1) OR (p2)) AND (r1) AND (r2). Every
 * fragment is parenthesized; a single permissive fragment renders as (p)
 * and a disjunction is grouped as a whole, so a CONDITION predicate can be
 * AND-ed with further terms without changing its meaning.
 *
 * table_has_policies separates default-allow (no policies on the table at
 * all) from default-deny (policies exist but none permissive contributes).
 *
 * Clause participation:
 * - using: select/update/delete policies with using_expr
 * - check: insert/update policies with check_expr; update and "all"
 *          policies without check_expr contribute their using_expr instead
 *
 * INSERT has no using clause and select/delete no check clause; both
 * merge to unrestricted.
 */
class PredicateMerger {
public:
    [[nodiscard]] static Predicate merge_using(const std::vector<Policy>& policies,
                                               Operation op,
                                               bool table_has_policies);

    [[nodiscard]] static Predicate merge_check(const std::vector<Policy>& policies,
                                               Operation op,
                                               bool table_has_policies);

private:
    static Predicate combine(const std::vector<std::string>& permissive,
                             const std::vector<std::string>& restrictive,
                             bool table_has_policies);
};

} // namespace tablegate
