#pragma once

#include <string>
#include <vector>

namespace logictest {

/**
 * @brief Outcome of one harness call
 *
 * For queries, schema holds one type tag per column ('I' integer,
 * 'R' floating point, 'T' anything else) and values holds the result
 * rendered row by row, left to right.
 */
struct HarnessResult {
    bool success = false;
    std::string error_message;

    // For queries
    std::string schema;
    std::vector<std::string> values;

    static HarnessResult ok() {
        HarnessResult r;
        r.success = true;
        return r;
    }

    static HarnessResult rows(std::string schema, std::vector<std::string> values) {
        HarnessResult r;
        r.success = true;
        r.schema = std::move(schema);
        r.values = std::move(values);
        return r;
    }

    static HarnessResult error(std::string message) {
        HarnessResult r;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @brief The database engine under test
 *
 * The runner calls init() once per test file, then executes that file's
 * records one at a time. Implementations may throw; the runner isolates
 * any exception to the record being executed.
 */
class IHarness {
public:
    virtual ~IHarness() = default;

    /** @brief Engine name matched against skipif/onlyif conditions */
    [[nodiscard]] virtual std::string engine_str() const = 0;

    /** @brief Prepare a clean database before a test file runs */
    [[nodiscard]] virtual HarnessResult init() = 0;

    /** @brief Execute a statement; only success/error_message are meaningful */
    [[nodiscard]] virtual HarnessResult execute_statement(const std::string& statement) = 0;

    /** @brief Execute a query and return its schema and flat values */
    [[nodiscard]] virtual HarnessResult execute_query(const std::string& query) = 0;
};

} // namespace logictest
