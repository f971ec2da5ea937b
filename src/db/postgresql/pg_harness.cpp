#include "db/postgresql/pg_harness.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "core/database_type.hpp"

namespace logictest {

PgHarness::PgHarness(std::string connection_string)
    : ConnectionHarness(std::string(keys::POSTGRESQL),
                        std::make_shared<PgConnectionFactory>(),
                        std::move(connection_string)) {}

std::vector<std::string> PgHarness::reset_statements() const {
    return {
        "DROP SCHEMA IF EXISTS public CASCADE",
        "CREATE SCHEMA public",
    };
}

} // namespace logictest
