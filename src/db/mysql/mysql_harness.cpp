#include "db/mysql/mysql_harness.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "core/database_type.hpp"

#include <format>

namespace logictest {

namespace {
constexpr const char* kDefaultDatabase = "sqllogictest";
}

MysqlHarness::MysqlHarness(std::string connection_string)
    : ConnectionHarness(std::string(keys::MYSQL),
                        std::make_shared<MysqlConnectionFactory>(),
                        connection_string),
      database_(parse_mysql_connection_string(connection_string).database) {
    if (database_.empty()) {
        database_ = kDefaultDatabase;
    }
}

std::vector<std::string> MysqlHarness::reset_statements() const {
    return {
        std::format("DROP DATABASE IF EXISTS `{}`", database_),
        std::format("CREATE DATABASE `{}`", database_),
        std::format("USE `{}`", database_),
    };
}

} // namespace logictest
