#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace tablegate {

/**
 * @brief Abstract factory for creating database connections
 *
 * Connection management (pooling, reconnects) belongs to the caller;
 * the engine only asks for one connection per request.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string Backend-specific connection string
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace tablegate
