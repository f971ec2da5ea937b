#pragma once

#include "core/error.hpp"
#include "harness/iharness.hpp"
#include "parser/record.hpp"
#include "runner/test_runner.hpp"

#include <string>
#include <vector>

namespace logictest {

inline constexpr std::string_view kGeneratedSuffix = ".generated";

struct GenerateSummary {
    std::string output_path;
    size_t rewritten = 0;   // query records whose results were replaced
    bool halted = false;
};

/**
 * @brief Regenerates expected results from what the engine actually returns
 *
 * Writes "<file>.generated". Every source line is copied verbatim except
 * for queries that ran successfully on this engine: their directive line is
 * rewritten with the observed schema and their result block is replaced by
 * the observed values (sorted per the record's sort mode, hashed when there
 * are more values than the record's hash threshold). Statements, skipped
 * records and failed queries keep their original text. An applicable halt
 * copies the rest of the file without running it. The output keeps the
 * source's line ending (LF or CRLF, judged from its first line).
 */
class ResultGenerator {
public:
    ResultGenerator(IHarness& harness, TestRunner& runner);

    [[nodiscard]] Result<GenerateSummary> generate_file(const std::string& path);

    /**
     * @brief Rewrite a file's lines given its parsed records
     * @param lines Source lines, without terminators
     * @param records Records parsed from those lines
     * @param[out] summary rewritten/halted are updated
     */
    [[nodiscard]] std::vector<std::string> rewrite(
        const std::vector<std::string>& lines,
        const std::vector<Record>& records,
        GenerateSummary& summary);

    /** @brief Result block lines for the given (already sorted) values */
    [[nodiscard]] static std::vector<std::string> render_results(
        const Record& record, const std::vector<std::string>& sorted_values);

    /** @brief "query <schema> <sortmode>[ <label>]" */
    [[nodiscard]] static std::string render_query_directive(
        const Record& record, const std::string& observed_schema);

private:
    IHarness& harness_;
    TestRunner& runner_;
};

} // namespace logictest
