#include "catalog/descriptor_parser.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace tablegate {

// Document keys (used by both parse and to_json)
static constexpr std::string_view kName        = "name";
static constexpr std::string_view kSchema      = "schema";
static constexpr std::string_view kType        = "type";
static constexpr std::string_view kSql         = "sql";
static constexpr std::string_view kPolicies    = "policies";
static constexpr std::string_view kColumns     = "columns";

static constexpr std::string_view kPolicyId          = "id";
static constexpr std::string_view kPolicyDescription = "description";
static constexpr std::string_view kPolicyEnabled     = "is_enabled";
static constexpr std::string_view kPolicyTable       = "table_name";
static constexpr std::string_view kPolicyOperation   = "operation";
static constexpr std::string_view kPolicyType        = "policy_type";
static constexpr std::string_view kPolicyUsing       = "using_expr";
static constexpr std::string_view kPolicyCheck       = "check_expr";

static constexpr std::string_view kColumnId       = "column_id";
static constexpr std::string_view kColumnName     = "column_name";
static constexpr std::string_view kDataType       = "data_type";
static constexpr std::string_view kNotNull        = "is_not_null";
static constexpr std::string_view kDefault        = "default_value";
static constexpr std::string_view kIsPrimaryKey   = "is_primary_key";
static constexpr std::string_view kPkOrder        = "primary_key_order";
static constexpr std::string_view kGenerated      = "generated_column_type";
static constexpr std::string_view kIsForeignKey   = "is_foreign_key";
static constexpr std::string_view kRefTable       = "reference_table";
static constexpr std::string_view kRefColumn      = "reference_column";
static constexpr std::string_view kFkOnUpdate     = "foreign_key_on_update";
static constexpr std::string_view kFkOnDelete     = "foreign_key_on_delete";
static constexpr std::string_view kPartOfIndex    = "part_of_index";

namespace {

JsonValue optional_string(const std::optional<std::string>& value) {
    return value ? JsonValue(*value) : JsonValue(nullptr);
}

} // anonymous namespace

std::vector<const ColumnDescriptor*> TableDescriptor::primary_key() const {
    std::vector<const ColumnDescriptor*> keys;
    for (const auto& col : columns) {
        if (col.is_primary_key) keys.push_back(&col);
    }
    std::stable_sort(keys.begin(), keys.end(),
        [](const ColumnDescriptor* a, const ColumnDescriptor* b) {
            return a->primary_key_order.value_or(0) < b->primary_key_order.value_or(0);
        });
    return keys;
}

// ============================================================================
// Parse
// ============================================================================

Result<TableDescriptor> DescriptorParser::parse(std::string_view document) {
    auto parsed = JsonValue::try_parse(document);
    if (!parsed) {
        return Result<TableDescriptor>::error(
            ErrorCategory::CATALOG_ERROR, "Catalog returned a malformed table document");
    }
    return parse(*parsed);
}

Result<TableDescriptor> DescriptorParser::parse(const JsonValue& document) {
    using R = Result<TableDescriptor>;

    if (!document.is_object()) {
        return R::error(ErrorCategory::CATALOG_ERROR, "Table document is not an object");
    }

    TableDescriptor table;
    table.name = document.string_at(kName).value_or("");
    if (table.name.empty()) {
        return R::error(ErrorCategory::CATALOG_ERROR, "Table document has no name");
    }
    table.schema = document.string_at(kSchema).value_or("");
    table.kind = document.string_at(kType).value_or("table");
    table.origin_sql = document.string_at(kSql);

    // Policies: json_agg yields null for an empty set
    std::string policy_error;
    document[kPolicies].for_each_element([&](const JsonValue& row) {
        if (!policy_error.empty() || row.is_null()) return;
        auto policy = parse_policy(row);
        if (policy.is_error()) {
            policy_error = policy.error_message();
            return;
        }
        if (!policy.value().is_enabled) return;
        if (policy.value().table_name.empty()) {
            policy.value().table_name = table.name;
        }
        table.policies.push_back(std::move(policy.value()));
    });
    if (!policy_error.empty()) {
        return R::error(ErrorCategory::CATALOG_ERROR, policy_error);
    }
    std::stable_sort(table.policies.begin(), table.policies.end(),
        [](const Policy& a, const Policy& b) { return a.id < b.id; });

    std::string column_error;
    std::unordered_set<std::string> seen;
    document[kColumns].for_each_element([&](const JsonValue& row) {
        if (!column_error.empty() || row.is_null()) return;
        auto column = parse_column(row);
        if (column.is_error()) {
            column_error = column.error_message();
            return;
        }
        if (!seen.insert(column.value().name).second) {
            column_error = std::format("Duplicate column '{}' in table '{}'",
                                       column.value().name, table.name);
            return;
        }
        table.columns.push_back(std::move(column.value()));
    });
    if (!column_error.empty()) {
        return R::error(ErrorCategory::CATALOG_ERROR, column_error);
    }
    std::stable_sort(table.columns.begin(), table.columns.end(),
        [](const ColumnDescriptor& a, const ColumnDescriptor& b) {
            return a.position < b.position;
        });

    return R::ok(std::move(table));
}

Result<Policy> DescriptorParser::parse_policy(const JsonValue& row) {
    using R = Result<Policy>;

    if (!row.is_object()) {
        return R::error(ErrorCategory::CATALOG_ERROR, "Policy row is not an object");
    }

    Policy policy;
    policy.id = static_cast<int64_t>(row.number_at(kPolicyId).value_or(0));
    policy.name = row.string_at(kName).value_or("");
    policy.description = row.string_at(kPolicyDescription);
    policy.is_enabled = row.flag_at(kPolicyEnabled, true);
    policy.table_name = row.string_at(kPolicyTable).value_or("");
    policy.using_expr = row.string_at(kPolicyUsing);
    policy.check_expr = row.string_at(kPolicyCheck);

    const std::string op_str = row.string_at(kPolicyOperation).value_or("");
    const auto op = parse_operation(op_str);
    if (!op) {
        return R::error(ErrorCategory::CATALOG_ERROR,
            std::format("Policy '{}': invalid operation '{}'", policy.name, op_str));
    }
    policy.operation = *op;

    // Registry default is PERMISSIVE
    const std::string kind_str = row.string_at(kPolicyType).value_or("PERMISSIVE");
    const auto kind = parse_policy_kind(kind_str);
    if (!kind) {
        return R::error(ErrorCategory::CATALOG_ERROR,
            std::format("Policy '{}': invalid policy type '{}'", policy.name, kind_str));
    }
    policy.kind = *kind;

    if (!policy.has_expression()) {
        return R::error(ErrorCategory::CATALOG_ERROR,
            std::format("Policy '{}' has neither using_expr nor check_expr", policy.name));
    }

    return R::ok(std::move(policy));
}

Result<ColumnDescriptor> DescriptorParser::parse_column(const JsonValue& row) {
    using R = Result<ColumnDescriptor>;

    if (!row.is_object()) {
        return R::error(ErrorCategory::CATALOG_ERROR, "Column row is not an object");
    }

    ColumnDescriptor col;
    col.name = row.string_at(kColumnName).value_or("");
    if (col.name.empty()) {
        return R::error(ErrorCategory::CATALOG_ERROR, "Column row has no name");
    }
    col.position = static_cast<int>(row.number_at(kColumnId).value_or(0));
    col.declared_type = row.string_at(kDataType).value_or("");
    col.is_not_null = row.flag_at(kNotNull);
    col.default_value = row.string_at(kDefault);
    col.generation_kind = parse_generation_kind(row[kGenerated]);

    col.is_primary_key = row.flag_at(kIsPrimaryKey);
    if (col.is_primary_key) {
        const auto order = row.number_at(kPkOrder);
        col.primary_key_order = (order && *order > 0) ? static_cast<int>(*order) : 1;
    }

    const auto ref_table = row.string_at(kRefTable);
    const auto ref_column = row.string_at(kRefColumn);
    if (row.flag_at(kIsForeignKey) && ref_table && ref_column) {
        ForeignKeyRef fk;
        fk.references_table = *ref_table;
        fk.references_column = *ref_column;
        fk.on_update = row.string_at(kFkOnUpdate).value_or("NO ACTION");
        fk.on_delete = row.string_at(kFkOnDelete).value_or("NO ACTION");
        col.foreign_key = std::move(fk);
    }

    if (const auto indexes = row.string_at(kPartOfIndex)) {
        for (const auto& name : utils::split(*indexes, ',')) {
            std::string trimmed = utils::trim(name);
            if (!trimmed.empty()) col.index_membership.insert(std::move(trimmed));
        }
    }

    return R::ok(std::move(col));
}

GenerationKind DescriptorParser::parse_generation_kind(const JsonValue& value) {
    // PostgreSQL attgenerated: '' normal, 's' stored, 'v' virtual
    if (value.is_string()) {
        const std::string code = utils::to_lower(value.get<std::string>());
        if (code == "s" || code == "stored") return GenerationKind::STORED;
        if (code == "v" || code == "virtual") return GenerationKind::VIRTUAL;
        return GenerationKind::NORMAL;
    }
    // SQLite-style hidden codes: 1/2 virtual, 3 stored
    if (value.is_number()) {
        const int code = value.get<int>();
        if (code == 3) return GenerationKind::STORED;
        if (code == 1 || code == 2) return GenerationKind::VIRTUAL;
    }
    return GenerationKind::NORMAL;
}

// ============================================================================
// Serialize
// ============================================================================

JsonValue DescriptorParser::to_json(const Policy& policy) {
    JsonValue out = JsonValue::object();
    out.set(kPolicyId, JsonValue(static_cast<long long>(policy.id)));
    out.set(kName, JsonValue(policy.name));
    out.set(kPolicyDescription, optional_string(policy.description));
    out.set(kPolicyEnabled, JsonValue(policy.is_enabled));
    out.set(kPolicyTable, JsonValue(policy.table_name));
    out.set(kPolicyOperation, JsonValue(std::string(operation_to_string(policy.operation))));
    out.set(kPolicyType, JsonValue(std::string(policy_kind_to_string(policy.kind))));
    out.set(kPolicyUsing, optional_string(policy.using_expr));
    out.set(kPolicyCheck, optional_string(policy.check_expr));
    return out;
}

JsonValue DescriptorParser::to_json(const TableDescriptor& table) {
    JsonValue out = JsonValue::object();
    out.set(kName, JsonValue(table.name));
    out.set(kSchema, JsonValue(table.schema));
    out.set(kType, JsonValue(table.kind));
    out.set(kSql, optional_string(table.origin_sql));

    JsonValue policies = JsonValue::array();
    for (const auto& policy : table.policies) {
        policies.push_back(to_json(policy));
    }
    out.set(kPolicies, std::move(policies));

    JsonValue columns = JsonValue::array();
    for (const auto& col : table.columns) {
        JsonValue c = JsonValue::object();
        c.set(kColumnId, JsonValue(col.position));
        c.set(kColumnName, JsonValue(col.name));
        c.set(kDataType, JsonValue(col.declared_type));
        c.set(kNotNull, JsonValue(col.is_not_null));
        c.set(kDefault, optional_string(col.default_value));
        c.set(kIsPrimaryKey, JsonValue(col.is_primary_key));
        c.set(kPkOrder, col.primary_key_order ? JsonValue(*col.primary_key_order) : JsonValue(nullptr));
        c.set(kGenerated, JsonValue(std::string(generation_kind_to_string(col.generation_kind))));
        c.set(kIsForeignKey, JsonValue(col.foreign_key.has_value()));
        if (col.foreign_key) {
            c.set(kRefTable, JsonValue(col.foreign_key->references_table));
            c.set(kRefColumn, JsonValue(col.foreign_key->references_column));
            c.set(kFkOnUpdate, JsonValue(col.foreign_key->on_update));
            c.set(kFkOnDelete, JsonValue(col.foreign_key->on_delete));
        } else {
            c.set(kRefTable, JsonValue(nullptr));
            c.set(kRefColumn, JsonValue(nullptr));
            c.set(kFkOnUpdate, JsonValue(nullptr));
            c.set(kFkOnDelete, JsonValue(nullptr));
        }
        std::string indexes;
        for (const auto& idx : col.index_membership) {
            if (!indexes.empty()) indexes += ',';
            indexes += idx;
        }
        c.set(kPartOfIndex, indexes.empty() ? JsonValue(nullptr) : JsonValue(indexes));
        columns.push_back(std::move(c));
    }
    out.set(kColumns, std::move(columns));

    return out;
}

} // namespace tablegate
