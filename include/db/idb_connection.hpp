#pragma once

#include "core/column_type.hpp"
#include <optional>
#include <string>
#include <vector>

namespace logictest {

/** @brief One result cell; std::nullopt is SQL NULL */
using DbValue = std::optional<std::string>;

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // Empty for DML/DDL
    std::vector<GenericColumnType> column_types;
    std::vector<std::vector<DbValue>> rows;

    static DbResultSet failure(std::string message) {
        DbResultSet r;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*).
 * Not thread-safe; the runner is single-threaded.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL query or statement
     * @param sql SQL text
     * @return Result set, with rows for a SELECT
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace logictest
