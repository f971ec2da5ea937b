#pragma once

#include "parser/record.hpp"

#include <chrono>
#include <functional>
#include <ostream>
#include <string>

namespace logictest {

/**
 * @brief Writes one result line per executed record
 *
 *   2026-10-18T09:14:03.123456789Z select1.test:14: SELECT 1 ok
 *   2026-10-18T09:14:03.124000000Z select1.test:20: SELECT 2 not ok: Schemas differ. Expected I, got R
 *   2026-10-18T09:14:03.124100000Z select1.test:26: SELECT 3 skipped
 *
 * Each line is flattened so a message never spans more than one line.
 */
class RunLogger {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct Options {
        bool truncate_queries = false;
        Clock clock;  // defaults to system_clock::now
    };

    static constexpr size_t kMaxQueryLength = 50;

    explicit RunLogger(std::ostream& out);
    RunLogger(std::ostream& out, Options options);

    /** @brief File whose records are reported next */
    void set_current_file(const std::string& path);

    void log_success(const Record& record);
    void log_failure(const Record& record, const std::string& message);
    void log_skip(const Record& record);

    /**
     * @brief Shorten a path for display
     *
     * Keeps at most the last four components and stops early at a
     * directory named "test" (the root of the sqllogictest corpus).
     */
    [[nodiscard]] static std::string test_file_path(const std::string& path);

    /** @brief Queries longer than 50 chars become the first 47 plus "..." */
    [[nodiscard]] static std::string truncate_query(const std::string& query);

private:
    [[nodiscard]] std::string prefix(const Record& record) const;
    void write_line(const std::string& line);

    std::ostream& out_;
    Options options_;
    std::string display_path_;
};

} // namespace logictest
