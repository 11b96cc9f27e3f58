#pragma once

#include "catalog/table_descriptor.hpp"
#include "core/error.hpp"
#include "core/json.hpp"

#include <string_view>

namespace tablegate {

/**
 * @brief Converts the catalog's aggregated table document to and from
 *        TableDescriptor
 *
 * Document shape (one JSON object per table):
 *   { "name", "schema", "type", "sql",
 *     "policies": [ { "id", "name", "description", "is_enabled", "table_name",
 *                     "operation", "policy_type", "using_expr", "check_expr" } ],
 *     "columns":  [ { "column_id", "column_name", "data_type", "is_not_null",
 *                     "default_value", "is_primary_key", "primary_key_order",
 *                     "generated_column_type", "is_foreign_key",
 *                     "reference_table", "reference_column",
 *                     "foreign_key_on_update", "foreign_key_on_delete",
 *                     "part_of_index" } ] }
 *
 * Parsing normalizes the descriptor invariants: columns sorted by position,
 * primary_key_order only on key columns, foreign keys all-or-nothing,
 * disabled policies dropped.
 */
class DescriptorParser {
public:
    /**
     * @brief Parse a table document
     * @return Descriptor, or CATALOG_ERROR when the document is malformed
     */
    [[nodiscard]] static Result<TableDescriptor> parse(std::string_view document);

    [[nodiscard]] static Result<TableDescriptor> parse(const JsonValue& document);

    /**
     * @brief Parse one policy row (shared with the registry-backed store)
     */
    [[nodiscard]] static Result<Policy> parse_policy(const JsonValue& row);

    [[nodiscard]] static JsonValue to_json(const TableDescriptor& table);
    [[nodiscard]] static JsonValue to_json(const Policy& policy);

private:
    static Result<ColumnDescriptor> parse_column(const JsonValue& row);
    static GenerationKind parse_generation_kind(const JsonValue& value);
};

} // namespace tablegate
