#include "policy/policy_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>
#include <format>
#include <fstream>
#include <unordered_set>

using namespace std::string_literals;

namespace tablegate {

// Constexpr config keys (used 2+ times in policy parsing)
static constexpr std::string_view kPolicies  = "policies";
static constexpr std::string_view kTable     = "table";
static constexpr std::string_view kOperation = "operation";
static constexpr std::string_view kType      = "type";
static constexpr std::string_view kUsing     = "using";
static constexpr std::string_view kCheck     = "check";

// ============================================================================
// Public API - Load from file
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open policy file: {}", path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return load_from_string(buffer);
}

// ============================================================================
// Public API - Load from string
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_string(const std::string& toml_content) {
    std::vector<Policy> policies;
    std::unordered_set<std::string> names;

    try {
        auto config = toml::parse(toml_content);

        // No [[policies]] at all is a valid, empty policy set
        const auto* policies_array = config[kPolicies].as_array();
        if (!policies_array) {
            return LoadResult::ok({});
        }

        int64_t next_id = 1;
        for (const auto& elem : *policies_array) {
            const auto* node = elem.as_table();
            if (!node) continue;
            const auto& tbl = *node;

            Policy policy;
            policy.id = tbl["id"].value_or(next_id);
            next_id = std::max(next_id, policy.id) + 1;

            policy.name = tbl["name"].value_or(""s);
            policy.table_name = tbl[kTable].value_or(""s);
            policy.is_enabled = tbl["enabled"].value_or(true);

            if (auto v = tbl["description"].value<std::string>()) policy.description = *v;
            if (auto v = tbl[kUsing].value<std::string>()) policy.using_expr = *v;
            if (auto v = tbl[kCheck].value<std::string>()) policy.check_expr = *v;

            const std::string op_str = tbl[kOperation].value_or("all"s);
            const auto op = parse_operation(op_str);
            if (!op) {
                return LoadResult::error(
                    std::format("Policy '{}': Invalid operation '{}'", policy.name, op_str));
            }
            policy.operation = *op;

            const std::string type_str = tbl[kType].value_or("permissive"s);
            const auto kind = parse_policy_kind(type_str);
            if (!kind) {
                return LoadResult::error(
                    std::format("Policy '{}': Invalid type '{}'", policy.name, type_str));
            }
            policy.kind = *kind;

            std::string error_msg;
            if (!validate_policy(policy, error_msg)) {
                return LoadResult::error(std::format("Policy '{}': {}", policy.name, error_msg));
            }
            if (!names.insert(policy.name).second) {
                return LoadResult::error(std::format("Duplicate policy name '{}'", policy.name));
            }

            policies.emplace_back(std::move(policy));
        }

        return LoadResult::ok(std::move(policies));

    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    }
}

// ============================================================================
// Private Helpers
// ============================================================================

bool PolicyLoader::validate_policy(const Policy& policy, std::string& error_msg) {
    if (policy.name.empty()) {
        error_msg = "Policy must have a name";
        return false;
    }

    if (policy.table_name.empty()) {
        error_msg = "Policy must name a table";
        return false;
    }

    if (!policy.has_expression()) {
        error_msg = "Policy must specify 'using', 'check', or both";
        return false;
    }

    if ((policy.using_expr && utils::trim(*policy.using_expr).empty()) ||
        (policy.check_expr && utils::trim(*policy.check_expr).empty())) {
        error_msg = "Policy expressions must not be empty";
        return false;
    }

    return true;
}

} // namespace tablegate
