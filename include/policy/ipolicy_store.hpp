#pragma once

#include "core/error.hpp"
#include "policy/policy_types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tablegate {

/**
 * @brief Read-only source of row-level policies
 *
 * table_name is "table" or "schema.table"; a bare name resolves against the
 * store's default schema. Stores never mutate policies.
 */
class IPolicyStore {
public:
    virtual ~IPolicyStore() = default;

    /**
     * @brief Enabled policies for (table, op), ordered by id
     *
     * A policy matches when its operation equals op or is ALL.
     * Only failure: the store is unreachable (CATALOG_ERROR).
     */
    [[nodiscard]] virtual Result<std::vector<Policy>> policies_for(
        const std::string& table_name, Operation op) = 0;

    /**
     * @brief Whether any enabled policy exists for the table, any operation
     *
     * Separates default-allow (no policies at all) from default-deny
     * (policies exist, none permissive for the operation).
     */
    [[nodiscard]] virtual Result<bool> table_has_policies(const std::string& table_name) = 0;
};

/**
 * @brief Does a policy's table_name designate schema.table
 *
 * Policies name their table bare ("users") or qualified ("public.users").
 */
[[nodiscard]] inline bool policy_targets_table(const Policy& policy,
                                               std::string_view schema,
                                               std::string_view table) {
    const std::string_view target = policy.table_name;
    if (target == table) return true;
    return target.size() == schema.size() + 1 + table.size() &&
           target.substr(0, schema.size()) == schema &&
           target[schema.size()] == '.' &&
           target.substr(schema.size() + 1) == table;
}

} // namespace tablegate
