#include "db/postgresql/pg_connection.hpp"
#include "mapper/value_mapper.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>
#include <optional>

namespace tablegate {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return {false, "Connection is null", {}, {}, {}, 0, false};
    }
    return consume_result(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute_params(const std::string& sql,
                                         const std::vector<TypedParam>& params) {
    if (!conn_) {
        return {false, "Connection is null", {}, {}, {}, 0, false};
    }

    // Text values must outlive PQexecParams; keep them alongside the pointer array
    std::vector<std::optional<std::string>> texts;
    texts.reserve(params.size());
    for (const auto& p : params) {
        texts.push_back(ValueMapper::to_text(p));
    }

    std::vector<const char*> values;
    values.reserve(texts.size());
    for (const auto& t : texts) {
        values.push_back(t ? t->c_str() : nullptr);
    }

    PGresult* res = PQexecParams(conn_, sql.c_str(),
                                 static_cast<int>(values.size()),
                                 nullptr,            // let the server infer types
                                 values.data(),
                                 nullptr,            // text format: lengths unused
                                 nullptr,
                                 0);                 // text results
    return consume_result(res);
}

bool PgConnection::begin() {
    return run_command("BEGIN");
}

bool PgConnection::commit() {
    return run_command("COMMIT");
}

bool PgConnection::rollback() {
    return run_command("ROLLBACK");
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);
    return run_command(timeout_sql.c_str());
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PgConnection::run_command(const char* sql) {
    if (!conn_) {
        return false;
    }

    PGresult* res = PQexec(conn_, sql);
    if (!res) {
        return false;
    }

    const bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    if (!success) {
        utils::log::warn(std::format("'{}' failed: {}", sql, PQresultErrorMessage(res)));
    }
    PQclear(res);
    return success;
}

DbResultSet PgConnection::consume_result(PGresult* res) {
    if (!res) {
        return {false, PQerrorMessage(conn_), {}, {}, {}, 0, false};
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    // Error case
    std::string error = PQresultErrorMessage(res);
    PQclear(res);
    return {false, utils::trim(error), {}, {}, {}, 0, false};
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.push_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);
    result.nulls.reserve(nrows);
    result.affected_rows = static_cast<uint64_t>(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::string> row;
        std::vector<bool> null_flags;
        row.reserve(ncols);
        null_flags.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            const bool is_null = PQgetisnull(res, i, j) != 0;
            const char* val = PQgetvalue(res, i, j);
            row.push_back((!is_null && val) ? val : "");
            null_flags.push_back(is_null);
        }
        result.rows.push_back(std::move(row));
        result.nulls.push_back(std::move(null_flags));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::try_parse_int<uint64_t>(affected).value_or(0);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", utils::trim(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace tablegate
