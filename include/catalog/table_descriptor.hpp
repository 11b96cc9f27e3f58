#pragma once

#include "policy/policy_types.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tablegate {

// ============================================================================
// Table Descriptor - canonical, backend-agnostic shape of one table
// ============================================================================

enum class GenerationKind : uint8_t {
    NORMAL,
    VIRTUAL,
    STORED
};

[[nodiscard]] inline constexpr std::string_view generation_kind_to_string(GenerationKind k) {
    switch (k) {
        case GenerationKind::NORMAL:  return "normal";
        case GenerationKind::VIRTUAL: return "virtual";
        case GenerationKind::STORED:  return "stored";
    }
    return "normal";
}

// Single-column foreign key edge; all four fields exist together or not at all
struct ForeignKeyRef {
    std::string references_table;
    std::string references_column;
    std::string on_update;
    std::string on_delete;
};

struct ColumnDescriptor {
    int position = 0;                           // Catalog-assigned ordinal
    std::string name;
    std::string declared_type;                  // Raw catalog type string
    bool is_not_null = false;
    std::optional<std::string> default_value;
    bool is_primary_key = false;
    std::optional<int> primary_key_order;       // 1-based; only when is_primary_key
    GenerationKind generation_kind = GenerationKind::NORMAL;
    std::optional<ForeignKeyRef> foreign_key;
    std::set<std::string> index_membership;

    [[nodiscard]] bool is_generated() const {
        return generation_kind != GenerationKind::NORMAL;
    }
};

struct TableDescriptor {
    std::string name;
    std::string schema;
    std::string kind = "table";                 // Catalog relation kind
    std::optional<std::string> origin_sql;      // Informational only
    std::vector<ColumnDescriptor> columns;      // Ordered by position
    std::vector<Policy> policies;               // Enabled only

    [[nodiscard]] std::string qualified_name() const {
        return schema.empty() ? name : schema + "." + name;
    }

    [[nodiscard]] const ColumnDescriptor* find_column(std::string_view column) const {
        for (const auto& col : columns) {
            if (col.name == column) return &col;
        }
        return nullptr;
    }

    // Primary key columns in key order
    [[nodiscard]] std::vector<const ColumnDescriptor*> primary_key() const;
};

// "schema.table" or bare "table" resolved against a default schema
struct QualifiedName {
    std::string schema;
    std::string table;

    [[nodiscard]] static QualifiedName parse(std::string_view name, std::string_view default_schema) {
        const auto dot = name.find('.');
        if (dot == std::string_view::npos) {
            return {std::string(default_schema), std::string(name)};
        }
        return {std::string(name.substr(0, dot)), std::string(name.substr(dot + 1))};
    }
};

} // namespace tablegate
