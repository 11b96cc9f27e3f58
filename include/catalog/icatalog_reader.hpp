#pragma once

#include "catalog/table_descriptor.hpp"
#include "core/error.hpp"

#include <string>
#include <vector>

namespace tablegate {

/**
 * @brief Abstract schema catalog reader
 *
 * Each backend queries its own catalog (pg_catalog for PostgreSQL) and
 * normalizes the answer into a TableDescriptor.
 */
class ICatalogReader {
public:
    virtual ~ICatalogReader() = default;

    /**
     * @brief Describe one table
     * @param table_name "table" or "schema.table"
     * @return Descriptor; NOT_FOUND for unknown tables, CATALOG_ERROR when
     *         the metadata query fails
     */
    [[nodiscard]] virtual Result<TableDescriptor> describe(const std::string& table_name) = 0;

    /**
     * @brief List table names of a schema, sorted
     */
    [[nodiscard]] virtual Result<std::vector<std::string>> list_tables(const std::string& schema) = 0;
};

} // namespace tablegate
