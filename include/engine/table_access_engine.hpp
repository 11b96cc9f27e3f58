#pragma once

#include "auth/claims_service.hpp"
#include "catalog/icatalog_reader.hpp"
#include "executor/statement_executor.hpp"
#include "policy/ipolicy_store.hpp"
#include "query/statement.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tablegate {

/**
 * @brief Dynamic Table Access Engine
 *
 * Control flow for one request:
 *   token -> ClaimsService::verify -> subject
 *   table -> ICatalogReader::describe -> TableDescriptor
 *   (table, op) -> IPolicyStore -> policies
 *   payload -> ValueMapper -> typed fields
 *   QueryBuilder -> Statement -> StatementExecutor
 *
 * Borrows its collaborators; the caller owns them and keeps them alive.
 * The executor is optional: without one the engine only describes and builds.
 */
class TableAccessEngine {
public:
    TableAccessEngine(ICatalogReader& catalog,
                      IPolicyStore& policies,
                      const ClaimsService& claims,
                      StatementExecutor* executor = nullptr,
                      std::string default_schema = "public");

    // ===== Catalog =====

    [[nodiscard]] Result<TableDescriptor> describe(const std::string& table);
    [[nodiscard]] Result<std::vector<std::string>> list_tables(const std::string& schema);
    [[nodiscard]] Result<std::vector<Policy>> policies_for(const std::string& table, Operation op);

    // ===== Statements =====

    /**
     * @brief Build a statement for a described table with its policies merged in
     *
     * An empty request.schema takes the schema from "schema.table" or the
     * default schema.
     */
    [[nodiscard]] Result<Statement> build(BuildRequest request);

    /**
     * @brief Build from JSON object payloads ("" = none)
     */
    [[nodiscard]] Result<Statement> build_json(const std::string& table,
                                               Operation op,
                                               std::string_view values_json,
                                               std::string_view filters_json);

    /**
     * @brief Verify the caller, build and execute in one transaction
     */
    [[nodiscard]] Result<ExecutionResult> execute(BuildRequest request, std::string_view token);

    // ===== Claims =====

    [[nodiscard]] Claims issue(const std::string& subject) const;
    [[nodiscard]] Claims issue(const std::string& subject, std::chrono::seconds ttl) const;
    [[nodiscard]] std::string sign(const Claims& claims) const;
    [[nodiscard]] Result<Claims> verify(std::string_view token) const;

private:
    Result<BuildRequest> resolve(BuildRequest request) const;

    ICatalogReader& catalog_;
    IPolicyStore& policies_;
    const ClaimsService& claims_;
    StatementExecutor* executor_;
    std::string default_schema_;
};

} // namespace tablegate
