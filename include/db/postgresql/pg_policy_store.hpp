#pragma once

#include "db/idb_connection.hpp"
#include "db/postgresql/pg_catalog_reader.hpp"
#include "policy/ipolicy_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tablegate {

/**
 * @brief Policy store backed by the registry table
 *
 * Every call is a bound, read-only query against the registry, so policy
 * changes made by administrative statements are visible on the next build.
 * A database without the registry table has no policies (default allow).
 *
 * Borrows the connection; not thread-safe (one store per connection).
 */
class PgPolicyStore : public IPolicyStore {
public:
    PgPolicyStore(IDbConnection& conn, CatalogReaderOptions options);
    ~PgPolicyStore() override = default;

    [[nodiscard]] Result<std::vector<Policy>> policies_for(
        const std::string& table_name, Operation op) override;

    [[nodiscard]] Result<bool> table_has_policies(const std::string& table_name) override;

    /**
     * @brief Every enabled policy, ordered by id (feeds PolicyStore)
     */
    [[nodiscard]] Result<std::vector<Policy>> load_all();

private:
    Result<bool> registry_exists();
    Result<std::vector<Policy>> query_policies(const std::string& where_clause,
                                               const std::vector<TypedParam>& params);
    [[nodiscard]] std::string registry_name() const;

    IDbConnection& conn_;
    CatalogReaderOptions options_;
    std::optional<bool> registry_exists_;
};

} // namespace tablegate
