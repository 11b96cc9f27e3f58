#pragma once

#include "catalog/icatalog_reader.hpp"
#include "db/idb_connection.hpp"

#include <optional>
#include <string>

namespace tablegate {

struct CatalogReaderOptions {
    std::string default_schema = "public";
    std::string policy_schema = "public";
    std::string policy_table = "_policies";
};

/**
 * @brief PostgreSQL catalog reader
 *
 * describe() issues one query against pg_class/pg_attribute/pg_constraint/
 * pg_index plus the policy registry, assembled server-side with
 * json_build_object/json_agg into one table document, which
 * DescriptorParser turns into a TableDescriptor.
 *
 * Foreign keys: a column takes the first foreign key constraint (by name)
 * that lists it; composite keys are reduced to that column's edge.
 *
 * Borrows the connection; not thread-safe (one reader per connection).
 */
class PgCatalogReader : public ICatalogReader {
public:
    PgCatalogReader(IDbConnection& conn, CatalogReaderOptions options);
    ~PgCatalogReader() override = default;

    [[nodiscard]] Result<TableDescriptor> describe(const std::string& table_name) override;
    [[nodiscard]] Result<std::vector<std::string>> list_tables(const std::string& schema) override;

    /**
     * @brief Build the describe query text
     * @param with_policies false when the registry table does not exist
     */
    [[nodiscard]] std::string describe_sql(bool with_policies) const;

    /**
     * @brief Probe for a relation by schema and name (to_regclass)
     * @return CATALOG_ERROR for names that are not simple identifiers
     */
    [[nodiscard]] static Result<bool> relation_exists(IDbConnection& conn,
                                                      const std::string& schema,
                                                      const std::string& table);

private:
    // Memoized: the registry may be absent on databases with no policies
    Result<bool> policy_registry_exists();

    IDbConnection& conn_;
    CatalogReaderOptions options_;
    std::optional<bool> registry_exists_;
};

} // namespace tablegate
