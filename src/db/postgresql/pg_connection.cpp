#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <format>

namespace logictest {

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
        return DbResultSet::failure("Connection is null");
    }

    PGresult* res = PQexec(conn_, sql.c_str());

    if (!res) {
        return DbResultSet::failure(PQerrorMessage(conn_));
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        PQclear(res);
        DbResultSet result;
        result.success = true;
        return result;
    }

    // Error case
    std::string error = PQresultErrorMessage(res);
    PQclear(res);
    return DbResultSet::failure(std::move(error));
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_types.push_back(
            PgTypeMap::oid_to_generic_type(static_cast<uint32_t>(PQftype(res, i))));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<DbValue> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                    static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
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
        utils::log::error(std::format("Failed to connect: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    // Keep NOTICE chatter from DROP ... IF EXISTS off stderr
    PQsetNoticeProcessor(conn, [](void*, const char*) {}, nullptr);

    return std::make_unique<PgConnection>(conn);
}

} // namespace logictest
