#pragma once

#include "core/typed_param.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tablegate {

/**
 * @brief Result set from a statement execution
 *
 * Owns the result data (copied from native result handles).
 * NULL cells are flagged in `nulls` with the same shape as `rows`.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT and RETURNING
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::vector<bool>> nulls;

    // For DML
    uint64_t affected_rows = 0;

    bool has_rows = false;

    [[nodiscard]] int column_index(const std::string& name) const {
        for (size_t i = 0; i < column_names.size(); ++i) {
            if (column_names[i] == name) return static_cast<int>(i);
        }
        return -1;
    }

    [[nodiscard]] bool is_null(size_t row, size_t col) const {
        return row < nulls.size() && col < nulls[row].size() && nulls[row][col];
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle.
 * Implementations are not thread-safe; each request owns its connection.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement without parameters
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a statement with positional parameters ($1..$n)
     *
     * Values travel out-of-band from the SQL text; identifiers cannot be
     * bound and must already be part of `sql`.
     */
    [[nodiscard]] virtual DbResultSet execute_params(
        const std::string& sql,
        const std::vector<TypedParam>& params) = 0;

    // Transaction scoping
    [[nodiscard]] virtual bool begin() = 0;
    [[nodiscard]] virtual bool commit() = 0;
    virtual bool rollback() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set statement timeout for subsequent statements
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    virtual void close() = 0;
};

} // namespace tablegate
