#include "db/postgresql/pg_catalog_reader.hpp"
#include "catalog/descriptor_parser.hpp"
#include "core/utils.hpp"

#include <format>

namespace tablegate {

namespace {

// Shared by ON UPDATE and ON DELETE (pg_constraint.confupdtype / confdeltype)
constexpr const char* kFkActionCase =
    "CASE {} WHEN 'a' THEN 'NO ACTION' WHEN 'r' THEN 'RESTRICT' "
    "WHEN 'c' THEN 'CASCADE' WHEN 'n' THEN 'SET NULL' "
    "WHEN 'd' THEN 'SET DEFAULT' END";

std::string fk_action(std::string_view column) {
    return std::vformat(kFkActionCase, std::make_format_args(column));
}

} // anonymous namespace

PgCatalogReader::PgCatalogReader(IDbConnection& conn, CatalogReaderOptions options)
    : conn_(conn), options_(std::move(options)) {}

std::string PgCatalogReader::describe_sql(bool with_policies) const {
    std::string policies = "'[]'::json";
    if (with_policies) {
        policies = std::format(
            "COALESCE(("
            "SELECT json_agg(json_build_object("
            "'id', p.id, "
            "'name', p.name, "
            "'description', p.description, "
            "'is_enabled', p.is_enabled, "
            "'table_name', p.table_name, "
            "'operation', p.operation, "
            "'policy_type', p.policy_type, "
            "'using_expr', p.using_expr, "
            "'check_expr', p.check_expr"
            ") ORDER BY p.id) "
            "FROM {}.{} p "
            "WHERE p.table_name IN (c.relname, n.nspname || '.' || c.relname) "
            "AND p.is_enabled"
            "), '[]'::json)",
            utils::quote_identifier(options_.policy_schema),
            utils::quote_identifier(options_.policy_table));
    }

    return std::format(
        "SELECT json_build_object("
        "'name', c.relname, "
        "'schema', n.nspname, "
        "'type', CASE c.relkind WHEN 'p' THEN 'partitioned table' ELSE 'table' END, "
        // PostgreSQL keeps no CREATE text; rebuild an informational one
        "'sql', ("
        "SELECT 'CREATE TABLE ' || quote_ident(n.nspname) || '.' || quote_ident(c.relname) "
        "|| ' (' || string_agg(quote_ident(ca.attname) || ' ' "
        "|| format_type(ca.atttypid, ca.atttypmod) "
        "|| CASE WHEN ca.attnotnull THEN ' NOT NULL' ELSE '' END, ', ' ORDER BY ca.attnum) || ')' "
        "FROM pg_attribute ca "
        "WHERE ca.attrelid = c.oid AND ca.attnum > 0 AND NOT ca.attisdropped"
        "), "
        "'policies', {}, "
        "'columns', COALESCE(("
        "SELECT json_agg(json_build_object("
        "'column_id', a.attnum, "
        "'column_name', a.attname, "
        "'data_type', format_type(a.atttypid, a.atttypmod), "
        "'is_not_null', a.attnotnull, "
        "'default_value', pg_get_expr(d.adbin, d.adrelid), "
        "'is_primary_key', pk.pk_order IS NOT NULL, "
        "'primary_key_order', pk.pk_order, "
        "'generated_column_type', a.attgenerated, "
        "'is_foreign_key', fk.ref_table IS NOT NULL, "
        "'reference_table', fk.ref_table, "
        "'reference_column', fk.ref_column, "
        "'foreign_key_on_update', fk.on_update, "
        "'foreign_key_on_delete', fk.on_delete, "
        "'part_of_index', ix.index_names"
        ") ORDER BY a.attnum) "
        "FROM pg_attribute a "
        "LEFT JOIN pg_attrdef d ON d.adrelid = a.attrelid AND d.adnum = a.attnum "
        "LEFT JOIN LATERAL ("
        "SELECT array_position(con.conkey, a.attnum) AS pk_order "
        "FROM pg_constraint con "
        "WHERE con.conrelid = c.oid AND con.contype = 'p'"
        ") pk ON true "
        "LEFT JOIN LATERAL ("
        "SELECT rc.relname AS ref_table, "
        "ra.attname AS ref_column, "
        "{} AS on_update, "
        "{} AS on_delete "
        "FROM pg_constraint con "
        "JOIN pg_class rc ON rc.oid = con.confrelid "
        "JOIN pg_attribute ra ON ra.attrelid = con.confrelid "
        "AND ra.attnum = con.confkey[array_position(con.conkey, a.attnum)] "
        "WHERE con.conrelid = c.oid AND con.contype = 'f' AND a.attnum = ANY (con.conkey) "
        "ORDER BY con.conname "
        "LIMIT 1"
        ") fk ON true "
        "LEFT JOIN LATERAL ("
        "SELECT string_agg(ic.relname, ',' ORDER BY ic.relname) AS index_names "
        "FROM pg_index i "
        "JOIN pg_class ic ON ic.oid = i.indexrelid "
        "WHERE i.indrelid = c.oid AND a.attnum = ANY (i.indkey)"
        ") ix ON true "
        "WHERE a.attrelid = c.oid AND a.attnum > 0 AND NOT a.attisdropped"
        "), '[]'::json)"
        ") AS table_details "
        "FROM pg_class c "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "WHERE n.nspname = $1 AND c.relname = $2 AND c.relkind IN ('r', 'p')",
        policies,
        fk_action("con.confupdtype"),
        fk_action("con.confdeltype"));
}

Result<TableDescriptor> PgCatalogReader::describe(const std::string& table_name) {
    using R = Result<TableDescriptor>;

    const auto name = QualifiedName::parse(table_name, options_.default_schema);
    if (name.table.empty()) {
        return R::error(ErrorCategory::NOT_FOUND, "Table name is empty");
    }

    const auto registry = policy_registry_exists();
    if (registry.is_error()) {
        return R::error_from(registry);
    }

    const std::string sql = describe_sql(registry.value());
    const auto result = conn_.execute_params(sql, {
        TypedParam::string(name.schema),
        TypedParam::string(name.table)
    });

    if (!result.success) {
        utils::log::error(std::format("Catalog query for '{}.{}' failed: {}",
                                      name.schema, name.table, result.error_message));
        return R::error(ErrorCategory::CATALOG_ERROR,
            std::format("Catalog query failed: {}", result.error_message));
    }

    if (result.rows.empty()) {
        return R::error(ErrorCategory::NOT_FOUND,
            std::format("Table '{}.{}' does not exist", name.schema, name.table));
    }

    auto descriptor = DescriptorParser::parse(result.rows[0][0]);
    if (descriptor.is_ok()) {
        utils::log::debug(std::format("Described {}: {} columns, {} policies",
            descriptor.value().qualified_name(),
            descriptor.value().columns.size(),
            descriptor.value().policies.size()));
    }
    return descriptor;
}

Result<std::vector<std::string>> PgCatalogReader::list_tables(const std::string& schema) {
    using R = Result<std::vector<std::string>>;

    static constexpr const char* kListQuery =
        "SELECT c.relname "
        "FROM pg_class c "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "WHERE n.nspname = $1 AND c.relkind IN ('r', 'p') "
        "AND NOT (n.nspname = $2 AND c.relname = $3) "
        "ORDER BY c.relname";

    const auto result = conn_.execute_params(kListQuery, {
        TypedParam::string(schema.empty() ? options_.default_schema : schema),
        TypedParam::string(options_.policy_schema),
        TypedParam::string(options_.policy_table)
    });

    if (!result.success) {
        return R::error(ErrorCategory::CATALOG_ERROR,
            std::format("Catalog query failed: {}", result.error_message));
    }

    std::vector<std::string> tables;
    tables.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        tables.push_back(row[0]);
    }
    return R::ok(std::move(tables));
}

Result<bool> PgCatalogReader::relation_exists(IDbConnection& conn,
                                              const std::string& schema,
                                              const std::string& table) {
    if (!utils::is_simple_identifier(schema) || !utils::is_simple_identifier(table)) {
        return Result<bool>::error(ErrorCategory::CATALOG_ERROR,
            std::format("Invalid relation name '{}.{}'", schema, table));
    }

    const auto result = conn.execute_params(
        "SELECT to_regclass($1) IS NOT NULL",
        {TypedParam::string(std::format("{}.{}",
            utils::quote_identifier(schema), utils::quote_identifier(table)))});

    if (!result.success || result.rows.empty()) {
        return Result<bool>::error(ErrorCategory::CATALOG_ERROR,
            std::format("Cannot probe relation {}.{}: {}", schema, table, result.error_message));
    }
    return Result<bool>::ok(result.rows[0][0] == "t");
}

Result<bool> PgCatalogReader::policy_registry_exists() {
    if (registry_exists_) {
        return Result<bool>::ok(*registry_exists_);
    }

    const auto probe = relation_exists(conn_, options_.policy_schema, options_.policy_table);
    if (probe.is_error()) {
        return probe;
    }

    registry_exists_ = probe.value();
    if (!*registry_exists_) {
        utils::log::warn(std::format("Policy registry {}.{} not found; tables are unrestricted",
                                     options_.policy_schema, options_.policy_table));
    }
    return probe;
}

} // namespace tablegate
