#pragma once

#include "catalog/table_descriptor.hpp"
#include "core/error.hpp"
#include "query/statement.hpp"

#include <string>
#include <vector>

namespace tablegate {

/**
 * @brief Builds policy-gated, parameterized CRUD statements
 *
 * Identifiers (schema, table, columns) must match [A-Za-z_][A-Za-z0-9_]*
 * and are double-quoted into the SQL; values are always bound as $n.
 * Policy predicates come from PredicateMerger:
 *
 *   select: SELECT row_to_json("t".*) AS data FROM "s"."t" WHERE <using> AND <filters>
 *   insert: INSERT INTO "s"."t" (...) VALUES (...) RETURNING row_to_json("t".*) AS data
 *           [, COALESCE((<check>), false) AS check_passed]
 *   update: UPDATE "s"."t" SET ... WHERE <using> AND <filters> RETURNING ... [check]
 *   delete: DELETE FROM "s"."t" WHERE <using> AND <filters> RETURNING ...
 *
 * A deny predicate renders "false": reads come back empty and writes are
 * rejected by the check guard, indistinguishable from "no rows matched".
 *
 * Pure function of its inputs; safe to call concurrently.
 */
class QueryBuilder {
public:
    /**
     * @brief Build one statement
     * @param request Target table, operation and payload
     * @param policies Enabled policies for (table, operation)
     * @param table_has_policies Whether the table has any enabled policy
     * @param descriptor When given, columns must exist in it, generated
     *        columns cannot be written, and selects order by primary key
     * @return Statement, or INVALID_COLUMN_SET / EMPTY_WRITE_SET / INVALID_PAYLOAD
     */
    [[nodiscard]] static Result<Statement> build(const BuildRequest& request,
                                                 const std::vector<Policy>& policies,
                                                 bool table_has_policies,
                                                 const TableDescriptor* descriptor = nullptr);

private:
    static Result<bool> validate(const BuildRequest& request, const TableDescriptor* descriptor);
};

} // namespace tablegate
