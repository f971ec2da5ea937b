#pragma once

#include "harness/connection_harness.hpp"

namespace logictest {

/**
 * @brief PostgreSQL harness (engine id "postgresql")
 *
 * Resets the database by dropping and recreating the public schema.
 */
class PgHarness : public ConnectionHarness {
public:
    explicit PgHarness(std::string connection_string);

protected:
    [[nodiscard]] std::vector<std::string> reset_statements() const override;
};

} // namespace logictest
