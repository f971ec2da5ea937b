#pragma once

#include "core/error.hpp"
#include "parser/line_source.hpp"
#include "parser/record.hpp"

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logictest {

/**
 * @brief What a single DirectiveParser::next() call produced
 */
enum class ParseStep {
    RECORD,        // a statement, query or halt record
    DIRECTIVE,     // consumed a directive that yields no record (hash-threshold)
    END_OF_INPUT
};

struct ParseOutcome {
    ParseStep step = ParseStep::END_OF_INPUT;
    std::optional<Record> record;
};

/**
 * @brief Line-oriented scanner for sqllogictest scripts
 *
 * Format reference: https://www.sqlite.org/sqllogictest/doc/trunk/about.wiki
 *
 *   query III rowsort
 *   SELECT a, c-d, d
 *     FROM t1
 *    WHERE c>d
 *   ----
 *   131
 *   1
 *   133
 *
 * Each call to next() runs the Start → body → results state machine for
 * exactly one record. The hash threshold set by "hash-threshold" lines and
 * any skipif/onlyif conditions seen before the record's directive are state
 * of the parse and survive across calls.
 *
 * Errors (unknown directive, malformed arguments, empty bodies) are
 * reported as PARSE_ERROR with the offending line number. After an error
 * the parser should not be used further.
 */
class DirectiveParser {
public:
    explicit DirectiveParser(LineSource& source);

    [[nodiscard]] Result<ParseOutcome> next();

    /** @brief Threshold that the next emitted record will carry */
    [[nodiscard]] int hash_threshold() const { return hash_threshold_; }

private:
    enum class State {
        START,
        STATEMENT_BODY,
        QUERY_BODY,
        RESULTS_BODY
    };

    enum class Directive {
        HALT,
        SKIP_IF,
        ONLY_IF,
        HASH_THRESHOLD,
        STATEMENT,
        QUERY
    };

    /**
     * @brief Dispatch table lookup for the first token of a directive line
     */
    [[nodiscard]] static std::optional<Directive> lookup_directive(std::string_view token);

    /** @brief Attach pending conditions and the current threshold, then build */
    Record emit(Record::Data& data);

    LineSource& source_;
    int hash_threshold_ = kDefaultHashThreshold;
    std::vector<Condition> pending_conditions_;
};

/**
 * @brief Strip an inline comment: truncate at the first unescaped '#'
 */
[[nodiscard]] std::string strip_comment(std::string_view line);

/**
 * @brief True if the first non-whitespace character is '#'
 */
[[nodiscard]] bool is_comment_line(std::string_view line);

/**
 * @brief Parse every record from a stream
 * @return All records (halt records included, in file order), or the first parse error
 */
[[nodiscard]] Result<std::vector<Record>> parse_records(std::istream& input);

/**
 * @brief Parse every record in a test file
 * @param path Path to a .test file
 * @return Records, or IO_ERROR / PARSE_ERROR prefixed with the path
 */
[[nodiscard]] Result<std::vector<Record>> parse_test_file(const std::string& path);

} // namespace logictest
