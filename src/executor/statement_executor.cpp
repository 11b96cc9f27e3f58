#include "executor/statement_executor.hpp"
#include "auth/claims_service.hpp"
#include "core/utils.hpp"

#include <format>

namespace tablegate {

namespace {

constexpr const char* kSetClaims =
    "SELECT set_config('request.jwt.claim.sub', $1, true), "
    "set_config('request.jwt.claims', $2, true)";

constexpr const char* kDataColumn = "data";
constexpr const char* kCheckColumn = "check_passed";

// Rolls back on scope exit unless committed
class TransactionScope {
public:
    explicit TransactionScope(IDbConnection& conn) : conn_(conn) {}

    ~TransactionScope() {
        if (open_ && !conn_.rollback()) {
            utils::log::warn("Rollback failed");
        }
    }

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    [[nodiscard]] bool begin() {
        open_ = conn_.begin();
        return open_;
    }

    [[nodiscard]] bool commit() {
        const bool ok = conn_.commit();
        // A failed COMMIT still ends the transaction on the server
        open_ = false;
        return ok;
    }

private:
    IDbConnection& conn_;
    bool open_ = false;
};

} // anonymous namespace

StatementExecutor::StatementExecutor(IDbConnection& conn)
    : conn_(conn) {}

StatementExecutor::StatementExecutor(IDbConnection& conn, Config config)
    : conn_(conn), config_(config) {}

Result<ExecutionResult> StatementExecutor::execute(const Statement& stmt, const Claims* claims) {
    using R = Result<ExecutionResult>;
    utils::Timer timer;

    if (config_.statement_timeout_ms > 0 && !timeout_applied_) {
        if (!conn_.set_query_timeout(config_.statement_timeout_ms)) {
            return R::error(ErrorCategory::EXECUTION_ERROR, "Cannot set statement timeout");
        }
        timeout_applied_ = true;
    }

    TransactionScope txn(conn_);
    if (!txn.begin()) {
        return R::error(ErrorCategory::EXECUTION_ERROR, "Cannot begin transaction");
    }

    if (claims) {
        const auto session = conn_.execute_params(kSetClaims, {
            TypedParam::string(claims->subject),
            TypedParam::string(ClaimsService::to_json(*claims))
        });
        if (!session.success) {
            return R::error(ErrorCategory::EXECUTION_ERROR,
                std::format("Cannot set session claims: {}", session.error_message));
        }
    }

    const auto result = conn_.execute_params(stmt.sql, stmt.params);
    if (!result.success) {
        utils::log::warn(std::format("{} on {} failed: {}",
            operation_to_string(stmt.operation), stmt.target, result.error_message));
        return R::error(ErrorCategory::EXECUTION_ERROR, result.error_message);
    }

    if (stmt.has_check_guard) {
        const int check_idx = result.column_index(kCheckColumn);
        if (check_idx < 0) {
            return R::error(ErrorCategory::EXECUTION_ERROR, "Check guard column missing");
        }
        for (size_t r = 0; r < result.rows.size(); ++r) {
            if (result.is_null(r, check_idx) || result.rows[r][check_idx] != "t") {
                utils::log::debug(std::format("{} on {} rejected by check guard",
                    operation_to_string(stmt.operation), stmt.target));
                return R::error(ErrorCategory::POLICY_DENIED, "Write rejected");
            }
        }
    }

    ExecutionResult out;
    const int data_idx = result.column_index(kDataColumn);
    if (data_idx >= 0) {
        out.rows.reserve(result.rows.size());
        for (size_t r = 0; r < result.rows.size(); ++r) {
            out.rows.push_back(result.is_null(r, data_idx) ? "null" : result.rows[r][data_idx]);
        }
    }
    out.affected_rows = stmt.operation == Operation::SELECT ? 0 : result.rows.size();

    if (!txn.commit()) {
        return R::error(ErrorCategory::EXECUTION_ERROR, "Commit failed");
    }

    utils::log::debug(std::format("{} on {}: {} rows in {}us",
        operation_to_string(stmt.operation), stmt.target, out.rows.size(),
        timer.elapsed_us().count()));
    return R::ok(std::move(out));
}

} // namespace tablegate
