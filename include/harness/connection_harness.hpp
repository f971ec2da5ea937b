#pragma once

#include "harness/iharness.hpp"
#include "db/iconnection_factory.hpp"

#include <memory>
#include <string>
#include <vector>

namespace logictest {

/**
 * @brief Harness that runs records over an IDbConnection
 *
 * Converts DbResultSet into the sqllogictest value format:
 *   - NULL renders as "NULL"
 *   - an empty string renders as "(empty)"
 *   - 'R' columns render with three decimals ("1.500")
 *   - everything else renders verbatim
 *
 * init() connects on first use (reconnecting if the connection dropped) and
 * runs the dialect's reset statements so each file starts from an empty
 * database.
 */
class ConnectionHarness : public IHarness {
public:
    ConnectionHarness(std::string engine,
                      std::shared_ptr<IConnectionFactory> factory,
                      std::string connection_string);

    [[nodiscard]] std::string engine_str() const override { return engine_; }

    [[nodiscard]] HarnessResult init() override;
    [[nodiscard]] HarnessResult execute_statement(const std::string& statement) override;
    [[nodiscard]] HarnessResult execute_query(const std::string& query) override;

    /** @brief Render a single cell for a column with the given type tag */
    [[nodiscard]] static std::string render_value(const DbValue& value, char type_tag);

    /** @brief Convert a successful result set into schema tags and flat values */
    [[nodiscard]] static HarnessResult to_harness_result(const DbResultSet& result_set);

protected:
    /** @brief SQL run by init() to drop everything left by the previous file */
    [[nodiscard]] virtual std::vector<std::string> reset_statements() const = 0;

private:
    std::string engine_;
    std::shared_ptr<IConnectionFactory> factory_;
    std::string connection_string_;
    std::unique_ptr<IDbConnection> conn_;
};

} // namespace logictest
