#pragma once

#include "policy/policy_types.hpp"
#include <string>
#include <vector>

namespace tablegate {

/**
 * @brief Policy loader from TOML
 *
 * Reads [[policies]] tables:
 *
 *   [[policies]]
 *   name = "active_users_select"
 *   table = "users"
 *   operation = "select"            # select|insert|update|delete|all
 *   type = "permissive"             # permissive|restrictive (default permissive)
 *   using = "is_active"
 *   check = "role_id IS NOT NULL"
 *   enabled = true
 *   description = "..."
 *
 * Validates:
 * - Name present and unique
 * - Table name present
 * - Operation and type values
 * - At least one of using/check
 */
class PolicyLoader {
public:
    /**
     * @brief Load result
     */
    struct LoadResult {
        bool success;
        std::string error_message;
        std::vector<Policy> policies;

        static LoadResult ok(std::vector<Policy> policies_vec) {
            LoadResult result;
            result.success = true;
            result.policies = std::move(policies_vec);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load policies from TOML file
     * @param path Path to the policy file
     * @return Load result with policies or error
     */
    static LoadResult load_from_file(const std::string& path);

    /**
     * @brief Load policies from TOML string
     * @param toml_content TOML content
     * @return Load result with policies or error
     */
    static LoadResult load_from_string(const std::string& toml_content);

private:
    /**
     * @brief Validate policy
     */
    static bool validate_policy(const Policy& policy, std::string& error_msg);
};

} // namespace tablegate
