#include "runner/result_generator.hpp"
#include "core/utils.hpp"
#include "parser/directive_parser.hpp"
#include "runner/result_verifier.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <fstream>
#include <string_view>

namespace logictest {

namespace {

Result<std::vector<std::string>> read_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<std::vector<std::string>>::error(
            ErrorCategory::IO_ERROR, std::format("{}: cannot open file", path));
    }

    std::vector<std::string> lines;
    LineSource source(file);
    std::string line;
    while (source.next_line(line)) {
        lines.push_back(line);
    }
    if (source.has_error()) {
        return Result<std::vector<std::string>>::error(
            ErrorCategory::IO_ERROR,
            std::format("{}: read failed after line {}", path, source.line_number()));
    }
    return Result<std::vector<std::string>>::ok(std::move(lines));
}

// "\r\n" when the first line of the file ends that way
std::string_view line_ending_of(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::string first;
    if (std::getline(file, first) && !first.empty() && first.back() == '\r') {
        return "\r\n";
    }
    return "\n";
}

// Copies source lines [from, to] (1-based, inclusive) to out
void copy_range(const std::vector<std::string>& lines, int from, int to,
                std::vector<std::string>& out) {
    const int last = std::min(to, static_cast<int>(lines.size()));
    for (int i = std::max(from, 1); i <= last; ++i) {
        out.push_back(lines[static_cast<size_t>(i - 1)]);
    }
}

} // anonymous namespace

ResultGenerator::ResultGenerator(IHarness& harness, TestRunner& runner)
    : harness_(harness), runner_(runner) {}

// ============================================================================
// Rendering
// ============================================================================

std::vector<std::string> ResultGenerator::render_results(
    const Record& record, const std::vector<std::string>& sorted_values) {

    if (sorted_values.size() > static_cast<size_t>(record.hash_threshold())) {
        return {std::format("{} values hashing to {}",
            sorted_values.size(), hash_results(sorted_values))};
    }
    return sorted_values;
}

std::string ResultGenerator::render_query_directive(
    const Record& record, const std::string& observed_schema) {

    std::string line = std::format("query {} {}",
        observed_schema, sort_mode_to_string(record.sort_mode()));
    if (!record.label().empty()) {
        line += ' ';
        line += record.label();
    }
    return line;
}

// ============================================================================
// Rewriting
// ============================================================================

std::vector<std::string> ResultGenerator::rewrite(
    const std::vector<std::string>& lines,
    const std::vector<Record>& records,
    GenerateSummary& summary) {

    std::vector<std::string> out;
    out.reserve(lines.size());
    int next_line = 1;  // first source line not yet copied

    for (const auto& record : records) {
        const auto execution = runner_.execute_record(record);
        if (execution.outcome == RecordOutcome::HALTED) {
            summary.halted = true;
            break;
        }
        if (record.type() != RecordType::QUERY || !execution.observed) {
            continue;
        }

        std::vector<std::string> block;
        try {
            block = render_results(record,
                sort_results(record, execution.observed->values));
        } catch (const std::exception& e) {
            utils::log::warn(std::format("line {}: keeping original results: {}",
                record.directive_line(), e.what()));
            continue;
        }

        copy_range(lines, next_line, record.directive_line() - 1, out);
        out.push_back(render_query_directive(record, execution.observed->schema));
        if (record.separator_line() > 0) {
            copy_range(lines, record.directive_line() + 1, record.separator_line(), out);
        } else {
            copy_range(lines, record.directive_line() + 1, record.last_line(), out);
            out.emplace_back(kSeparator);
        }
        out.insert(out.end(), block.begin(), block.end());

        next_line = record.last_line() + 1;
        ++summary.rewritten;
    }

    copy_range(lines, next_line, static_cast<int>(lines.size()), out);
    return out;
}

Result<GenerateSummary> ResultGenerator::generate_file(const std::string& path) {
    using R = Result<GenerateSummary>;

    auto records = parse_test_file(path);
    if (records.is_error()) {
        return R::error(records.error_category(), records.error_message());
    }

    auto lines = read_lines(path);
    if (lines.is_error()) {
        return R::error(lines.error_category(), lines.error_message());
    }

    HarnessResult init;
    try {
        init = harness_.init();
    } catch (const std::exception& e) {
        init = HarnessResult::error(e.what());
    }
    if (!init.success) {
        return R::error(ErrorCategory::EXECUTION_ERROR,
            std::format("{}: harness init failed: {}", path, init.error_message));
    }

    GenerateSummary summary;
    summary.output_path = path + std::string(kGeneratedSuffix);

    runner_.set_current_file(path);
    const auto output = rewrite(lines.value(), records.value(), summary);
    const auto eol = line_ending_of(path);

    std::ofstream file(summary.output_path, std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        return R::error(ErrorCategory::IO_ERROR,
            std::format("{}: cannot open for writing", summary.output_path));
    }
    for (const auto& line : output) {
        file << line << eol;
    }
    file.flush();
    if (!file) {
        return R::error(ErrorCategory::IO_ERROR,
            std::format("{}: write failed", summary.output_path));
    }

    utils::log::info(std::format("Wrote {} ({} queries regenerated)",
        summary.output_path, summary.rewritten));
    return R::ok(std::move(summary));
}

} // namespace logictest
