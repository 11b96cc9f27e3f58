#include "db/postgresql/pg_policy_store.hpp"
#include "catalog/descriptor_parser.hpp"
#include "catalog/table_descriptor.hpp"
#include "core/utils.hpp"

#include <format>

namespace tablegate {

namespace {

constexpr const char* kPolicyRowSelect =
    "SELECT json_build_object("
    "'id', p.id, "
    "'name', p.name, "
    "'description', p.description, "
    "'is_enabled', p.is_enabled, "
    "'table_name', p.table_name, "
    "'operation', p.operation, "
    "'policy_type', p.policy_type, "
    "'using_expr', p.using_expr, "
    "'check_expr', p.check_expr"
    ") FROM {} p WHERE p.is_enabled{} ORDER BY p.id";

} // anonymous namespace

PgPolicyStore::PgPolicyStore(IDbConnection& conn, CatalogReaderOptions options)
    : conn_(conn), options_(std::move(options)) {}

Result<std::vector<Policy>> PgPolicyStore::policies_for(const std::string& table_name, Operation op) {
    const auto name = QualifiedName::parse(table_name, options_.default_schema);
    return query_policies(
        " AND p.table_name IN ($1, $2) AND lower(p.operation) IN ($3, 'all')",
        {TypedParam::string(name.table),
         TypedParam::string(std::format("{}.{}", name.schema, name.table)),
         TypedParam::string(std::string(operation_to_string(op)))});
}

Result<bool> PgPolicyStore::table_has_policies(const std::string& table_name) {
    using R = Result<bool>;

    const auto exists = registry_exists();
    if (exists.is_error() || !exists.value()) {
        return exists;
    }

    const auto name = QualifiedName::parse(table_name, options_.default_schema);
    const auto result = conn_.execute_params(
        std::format("SELECT EXISTS (SELECT 1 FROM {} p "
                    "WHERE p.is_enabled AND p.table_name IN ($1, $2))", registry_name()),
        {TypedParam::string(name.table),
         TypedParam::string(std::format("{}.{}", name.schema, name.table))});

    if (!result.success || result.rows.empty()) {
        return R::error(ErrorCategory::CATALOG_ERROR,
            std::format("Policy registry query failed: {}", result.error_message));
    }
    return R::ok(result.rows[0][0] == "t");
}

Result<std::vector<Policy>> PgPolicyStore::load_all() {
    return query_policies("", {});
}

Result<bool> PgPolicyStore::registry_exists() {
    if (registry_exists_) {
        return Result<bool>::ok(*registry_exists_);
    }
    const auto probe = PgCatalogReader::relation_exists(
        conn_, options_.policy_schema, options_.policy_table);
    if (probe.is_ok()) {
        registry_exists_ = probe.value();
    }
    return probe;
}

Result<std::vector<Policy>> PgPolicyStore::query_policies(const std::string& where_clause,
                                                          const std::vector<TypedParam>& params) {
    using R = Result<std::vector<Policy>>;

    const auto exists = registry_exists();
    if (exists.is_error()) {
        return R::error_from(exists);
    }
    if (!exists.value()) {
        return R::ok({});
    }

    const std::string registry = registry_name();
    const auto result = conn_.execute_params(
        std::vformat(kPolicyRowSelect, std::make_format_args(registry, where_clause)),
        params);

    if (!result.success) {
        utils::log::error(std::format("Policy registry query failed: {}", result.error_message));
        return R::error(ErrorCategory::CATALOG_ERROR,
            std::format("Policy registry query failed: {}", result.error_message));
    }

    std::vector<Policy> policies;
    policies.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        const auto doc = JsonValue::try_parse(row[0]);
        if (!doc) {
            return R::error(ErrorCategory::CATALOG_ERROR, "Malformed policy row");
        }
        auto policy = DescriptorParser::parse_policy(*doc);
        if (policy.is_error()) {
            return R::error_from(policy);
        }
        policies.push_back(std::move(policy.value()));
    }
    return R::ok(std::move(policies));
}

std::string PgPolicyStore::registry_name() const {
    return std::format("{}.{}",
        utils::quote_identifier(options_.policy_schema),
        utils::quote_identifier(options_.policy_table));
}

} // namespace tablegate
