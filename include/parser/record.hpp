#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logictest {

inline constexpr int kDefaultHashThreshold = 8;
inline constexpr std::string_view kSeparator = "----";

enum class RecordType {
    STATEMENT,  // execute, no results to validate (CREATE, INSERT, ...)
    QUERY,      // execute and validate results
    HALT        // stop executing the current file
};

enum class SortMode {
    NO_SORT,
    ROW_SORT,
    VALUE_SORT
};

[[nodiscard]] const char* record_type_to_string(RecordType type);

[[nodiscard]] std::string_view sort_mode_to_string(SortMode mode);

/**
 * @brief Parse "nosort" / "rowsort" / "valuesort"
 * @return std::nullopt for anything else
 */
[[nodiscard]] std::optional<SortMode> parse_sort_mode(std::string_view token);

/**
 * @brief Decides whether a record runs for a given engine
 */
struct Condition {
    bool is_only = false;
    bool is_skip = false;
    std::string engine;

    static Condition only(std::string engine) { return {true, false, std::move(engine)}; }
    static Condition skip(std::string engine) { return {false, true, std::move(engine)}; }

    bool operator==(const Condition&) const = default;
};

/**
 * @brief Parsed form of "<N> values hashing to <hex>"
 */
struct HashSummary {
    size_t value_count = 0;
    std::string digest;
};

/**
 * @brief Parse a hash summary line
 *
 * The whole line (surrounding whitespace ignored) must match
 * "<digits> values hashing to <lowercase hex>".
 */
[[nodiscard]] std::optional<HashSummary> parse_hash_summary(std::string_view line);

/**
 * @brief One unit of work from a test script
 *
 * Built once by the DirectiveParser and never modified afterwards. All
 * verification works on copies of observed values, never on the record.
 */
class Record {
public:
    struct Data {
        RecordType type = RecordType::STATEMENT;
        bool expect_error = false;
        std::vector<Condition> conditions;
        std::string schema;
        SortMode sort_mode = SortMode::NO_SORT;
        std::string query;
        int line_num = 0;
        std::vector<std::string> result;
        std::string label;
        int hash_threshold = kDefaultHashThreshold;

        // Source positions used when rewriting a file
        int directive_line = 0;
        int separator_line = 0;
        int last_line = 0;
    };

    explicit Record(Data data);

    [[nodiscard]] RecordType type() const { return data_.type; }
    [[nodiscard]] bool expect_error() const { return data_.expect_error; }
    [[nodiscard]] const std::vector<Condition>& conditions() const { return data_.conditions; }

    /** @brief Result column type tags, e.g. "ITTR" */
    [[nodiscard]] const std::string& schema() const { return data_.schema; }
    [[nodiscard]] SortMode sort_mode() const { return data_.sort_mode; }

    /** @brief Statement or query text, comments removed and lines joined */
    [[nodiscard]] const std::string& query() const { return data_.query; }

    /**
     * @brief Canonical line number: the first line of the SQL text,
     * excluding comments and conditions. For halt, the directive line.
     */
    [[nodiscard]] int line_num() const { return data_.line_num; }

    /** @brief Expected results; a single hash summary or literal values */
    [[nodiscard]] const std::vector<std::string>& result() const { return data_.result; }
    [[nodiscard]] const std::string& label() const { return data_.label; }
    [[nodiscard]] int hash_threshold() const { return data_.hash_threshold; }

    [[nodiscard]] int directive_line() const { return data_.directive_line; }
    [[nodiscard]] int separator_line() const { return data_.separator_line; }
    [[nodiscard]] int last_line() const { return data_.last_line; }

    /** @brief True if the expected block is a single hash summary */
    [[nodiscard]] bool is_hash_result() const;

    /**
     * @brief Expected digest of a hash-mode record
     * @throws std::logic_error if the record is not hash-mode
     */
    [[nodiscard]] std::string hash_result() const;

    /**
     * @brief Number of expected values (not rows)
     * @throws std::logic_error for non-query records
     */
    [[nodiscard]] size_t num_results() const;

    /**
     * @brief Number of result columns
     * @throws std::logic_error for non-query records
     */
    [[nodiscard]] size_t num_cols() const;

private:
    Data data_;
};

} // namespace logictest
