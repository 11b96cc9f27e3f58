#include "engine/table_access_engine.hpp"
#include "core/utils.hpp"
#include "mapper/value_mapper.hpp"
#include "query/query_builder.hpp"

#include <format>

namespace tablegate {

TableAccessEngine::TableAccessEngine(ICatalogReader& catalog,
                                     IPolicyStore& policies,
                                     const ClaimsService& claims,
                                     StatementExecutor* executor,
                                     std::string default_schema)
    : catalog_(catalog),
      policies_(policies),
      claims_(claims),
      executor_(executor),
      default_schema_(std::move(default_schema)) {}

// ============================================================================
// Catalog
// ============================================================================

Result<TableDescriptor> TableAccessEngine::describe(const std::string& table) {
    return catalog_.describe(table);
}

Result<std::vector<std::string>> TableAccessEngine::list_tables(const std::string& schema) {
    return catalog_.list_tables(schema.empty() ? default_schema_ : schema);
}

Result<std::vector<Policy>> TableAccessEngine::policies_for(const std::string& table, Operation op) {
    return policies_.policies_for(table, op);
}

// ============================================================================
// Statements
// ============================================================================

Result<BuildRequest> TableAccessEngine::resolve(BuildRequest request) const {
    if (request.schema.empty()) {
        auto name = QualifiedName::parse(request.table, default_schema_);
        request.schema = std::move(name.schema);
        request.table = std::move(name.table);
    }
    // Reject bad identifiers before they reach the catalog
    if (!utils::is_simple_identifier(request.schema) || !utils::is_simple_identifier(request.table)) {
        return Result<BuildRequest>::error(ErrorCategory::INVALID_COLUMN_SET,
            std::format("Invalid table name '{}.{}'", request.schema, request.table));
    }
    return Result<BuildRequest>::ok(std::move(request));
}

Result<Statement> TableAccessEngine::build(BuildRequest request) {
    using R = Result<Statement>;

    auto resolved = resolve(std::move(request));
    if (resolved.is_error()) {
        return R::error_from(resolved);
    }
    const BuildRequest& req = resolved.value();
    const std::string qualified = std::format("{}.{}", req.schema, req.table);

    const auto descriptor = catalog_.describe(qualified);
    if (descriptor.is_error()) {
        return R::error_from(descriptor);
    }

    const auto policies = policies_.policies_for(qualified, req.operation);
    if (policies.is_error()) {
        return R::error_from(policies);
    }
    const auto has_policies = policies_.table_has_policies(qualified);
    if (has_policies.is_error()) {
        return R::error_from(has_policies);
    }

    return QueryBuilder::build(req, policies.value(), has_policies.value(), &descriptor.value());
}

Result<Statement> TableAccessEngine::build_json(const std::string& table,
                                                Operation op,
                                                std::string_view values_json,
                                                std::string_view filters_json) {
    BuildRequest request;
    request.table = table;
    request.operation = op;

    if (!utils::trim(values_json).empty()) {
        auto values = ValueMapper::map_object(values_json);
        if (values.is_error()) return Result<Statement>::error_from(values);
        request.values = std::move(values.value());
    }
    if (!utils::trim(filters_json).empty()) {
        auto filters = ValueMapper::map_object(filters_json);
        if (filters.is_error()) return Result<Statement>::error_from(filters);
        request.filters = std::move(filters.value());
    }
    return build(std::move(request));
}

Result<ExecutionResult> TableAccessEngine::execute(BuildRequest request, std::string_view token) {
    using R = Result<ExecutionResult>;

    if (!executor_) {
        return R::error(ErrorCategory::EXECUTION_ERROR, "No statement executor attached");
    }

    // Caller is verified before the catalog is touched
    const auto claims = claims_.verify(token);
    if (claims.is_error()) {
        return R::error_from(claims);
    }

    const auto stmt = build(std::move(request));
    if (stmt.is_error()) {
        return R::error_from(stmt);
    }

    return executor_->execute(stmt.value(), &claims.value());
}

// ============================================================================
// Claims
// ============================================================================

Claims TableAccessEngine::issue(const std::string& subject) const {
    return claims_.issue(subject);
}

Claims TableAccessEngine::issue(const std::string& subject, std::chrono::seconds ttl) const {
    const auto& config = claims_.config();
    return claims_.issue(subject, config.issuer, config.audience, ttl);
}

std::string TableAccessEngine::sign(const Claims& claims) const {
    return claims_.sign(claims);
}

Result<Claims> TableAccessEngine::verify(std::string_view token) const {
    return claims_.verify(token);
}

} // namespace tablegate
