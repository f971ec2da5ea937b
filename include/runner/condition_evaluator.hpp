#pragma once

#include "parser/record.hpp"

#include <string>
#include <vector>

namespace logictest {

/**
 * @brief Decide whether a record runs for the given engine
 *
 * skipif and onlyif don't combine symmetrically: an onlyif is honored only
 * when it is the record's single condition. With two or more conditions,
 * only the skipif entries are consulted and onlyif entries are ignored.
 *
 *   [onlyif mysql]               → runs only on "mysql"
 *   [skipif mysql]               → runs everywhere except "mysql"
 *   [onlyif mysql, skipif oracle]→ runs everywhere except "oracle"
 */
[[nodiscard]] bool should_execute_for_engine(
    const std::vector<Condition>& conditions, const std::string& engine);

[[nodiscard]] inline bool should_execute_for_engine(
    const Record& record, const std::string& engine) {
    return should_execute_for_engine(record.conditions(), engine);
}

} // namespace logictest
