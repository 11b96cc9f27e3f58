#pragma once

#include "auth/claims.hpp"
#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include "query/statement.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tablegate {

/**
 * @brief Rows produced by one statement
 *
 * rows holds one JSON document per row, as the backend rendered it
 * (numbers keep their full precision).
 */
struct ExecutionResult {
    std::vector<std::string> rows;
    uint64_t affected_rows = 0;
};

/**
 * @brief Runs built statements inside one transaction each
 *
 * Per call:
 *   BEGIN
 *   set_config('request.jwt.claim.sub', sub, true)
 *   set_config('request.jwt.claims', payload, true)
 *   <statement>
 *   COMMIT, or ROLLBACK when the statement fails or any written row
 *   reports check_passed = false
 *
 * The claim settings are transaction-local, so policy fragments can use
 * current_setting('request.jwt.claim.sub', true). A failed check guard
 * yields POLICY_DENIED with a generic message.
 *
 * Borrows the connection; one executor per connection.
 */
class StatementExecutor {
public:
    struct Config {
        uint32_t statement_timeout_ms = 0;  // 0 = backend default
    };

    explicit StatementExecutor(IDbConnection& conn);
    StatementExecutor(IDbConnection& conn, Config config);

    /**
     * @brief Execute a statement
     * @param claims Verified caller identity, or nullptr for an anonymous session
     */
    [[nodiscard]] Result<ExecutionResult> execute(const Statement& stmt, const Claims* claims);

private:
    IDbConnection& conn_;
    Config config_;
    bool timeout_applied_ = false;
};

} // namespace tablegate
