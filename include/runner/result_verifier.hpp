#pragma once

#include "parser/record.hpp"

#include <string>
#include <vector>

namespace logictest {

enum class VerifyStatus {
    PASS,
    SCHEMA_MISMATCH,
    COUNT_MISMATCH,
    VALUE_MISMATCH,
    HASH_MISMATCH
};

[[nodiscard]] const char* verify_status_to_string(VerifyStatus status);

/**
 * @brief Outcome of comparing observed query results to a record
 */
struct VerifyOutcome {
    VerifyStatus status = VerifyStatus::PASS;
    std::string message;  // empty on PASS

    [[nodiscard]] bool passed() const { return status == VerifyStatus::PASS; }
};

/**
 * @brief Reorder observed values according to the record's sort mode
 *
 * nosort leaves the input alone. rowsort reshapes the flat list into rows of
 * num_cols() values, orders rows by plain string comparison column by
 * column, and moves whole rows. valuesort orders every value on its own.
 *
 * @throws std::invalid_argument on rowsort with a zero-width schema or a
 *         value count that is not a multiple of the column count
 */
[[nodiscard]] std::vector<std::string> sort_results(
    const Record& record, std::vector<std::string> values);

/**
 * @brief MD5 over each value followed by '\n', as lowercase hex
 * @throws std::runtime_error if the digest cannot be computed
 */
[[nodiscard]] std::string hash_results(const std::vector<std::string>& values);

/**
 * @brief Compare a query's observed results against a record
 *
 * Checks, in order: value count, schema, then (after sorting) either the
 * digest for hash-mode records or each literal value. Stops at the first
 * mismatch. Whether hashing is used comes from the record's own expected
 * block, not from its hash threshold.
 */
[[nodiscard]] VerifyOutcome verify_results(
    const Record& record,
    const std::string& observed_schema,
    const std::vector<std::string>& observed_values);

/**
 * @brief Schema comparison including the empty-result allowance
 *
 * Old test files declare all-integer schemas for empty result sets even
 * when the columns are floating point, following an earlier MySQL. When no
 * values are expected, an all-'I' expected schema accepts an observed
 * schema of the same length made only of 'I' and 'R'.
 */
[[nodiscard]] bool schema_matches(
    const std::string& expected, const std::string& observed, size_t expected_count);

} // namespace logictest
