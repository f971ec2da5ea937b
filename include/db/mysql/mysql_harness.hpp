#pragma once

#include "harness/connection_harness.hpp"

namespace logictest {

/**
 * @brief MySQL harness (engine id "mysql")
 *
 * Resets by dropping and recreating the database named in the connection
 * string, or "sqllogictest" when none is given.
 */
class MysqlHarness : public ConnectionHarness {
public:
    explicit MysqlHarness(std::string connection_string);

    [[nodiscard]] const std::string& database() const { return database_; }

protected:
    [[nodiscard]] std::vector<std::string> reset_statements() const override;

private:
    std::string database_;
};

} // namespace logictest
