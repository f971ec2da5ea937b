#include "runner/run_logger.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <vector>

namespace logictest {

namespace {
constexpr size_t kMaxPathComponents = 4;
constexpr std::string_view kCorpusRoot = "test";
}

RunLogger::RunLogger(std::ostream& out)
    : RunLogger(out, Options{}) {}

RunLogger::RunLogger(std::ostream& out, Options options)
    : out_(out), options_(std::move(options)) {
    if (!options_.clock) {
        options_.clock = [] { return std::chrono::system_clock::now(); };
    }
}

void RunLogger::set_current_file(const std::string& path) {
    display_path_ = test_file_path(path);
}

void RunLogger::log_success(const Record& record) {
    write_line(prefix(record) + " ok");
}

void RunLogger::log_failure(const Record& record, const std::string& message) {
    write_line(std::format("{} not ok: {}", prefix(record), message));
}

void RunLogger::log_skip(const Record& record) {
    write_line(prefix(record) + " skipped");
}

std::string RunLogger::prefix(const Record& record) const {
    const std::string query = options_.truncate_queries
        ? truncate_query(record.query()) : record.query();
    return std::format("{} {}:{}: {}",
        utils::format_timestamp(options_.clock()), display_path_, record.line_num(), query);
}

void RunLogger::write_line(const std::string& line) {
    out_ << utils::flatten_newlines(line) << '\n';
    out_.flush();
}

std::string RunLogger::test_file_path(const std::string& path) {
    const std::filesystem::path p(path);
    std::vector<std::string> parts;

    for (auto it = p.end(); it != p.begin() && parts.size() < kMaxPathComponents;) {
        --it;
        const std::string name = it->string();
        if (name == kCorpusRoot) {
            break;
        }
        if (name.empty() || name == "/") {
            continue;
        }
        parts.insert(parts.begin(), name);
    }

    std::string result;
    for (const auto& part : parts) {
        if (!result.empty()) result += '/';
        result += part;
    }
    return result;
}

std::string RunLogger::truncate_query(const std::string& query) {
    if (query.size() > kMaxQueryLength) {
        return query.substr(0, kMaxQueryLength - 3) + "...";
    }
    return query;
}

} // namespace logictest
