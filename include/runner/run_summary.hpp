#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace logictest {

struct RecordCounts {
    size_t ok = 0;
    size_t failed = 0;
    size_t skipped = 0;

    [[nodiscard]] size_t total() const { return ok + failed + skipped; }

    RecordCounts& operator+=(const RecordCounts& other) {
        ok += other.ok;
        failed += other.failed;
        skipped += other.skipped;
        return *this;
    }
};

/**
 * @brief Outcome of running one test file
 */
struct FileSummary {
    std::string path;
    RecordCounts counts;
    bool halted = false;
    bool aborted = false;          // parse error or harness init failure
    std::string error_message;     // set when aborted
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Outcome of a whole run, in file order
 */
struct RunSummary {
    std::vector<FileSummary> files;

    [[nodiscard]] RecordCounts totals() const;
    [[nodiscard]] size_t aborted_files() const;

    /** @brief No failed records and no aborted files */
    [[nodiscard]] bool all_passed() const;

    /**
     * @brief JSON form:
     *   {"files": [{"path", "ok", "failed", "skipped", "halted",
     *               "aborted", "error", "elapsed_ms"}...],
     *    "totals": {"ok", "failed", "skipped", "aborted_files"}}
     */
    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Write the JSON summary to a file
 * @return false (after logging the reason) if the file cannot be written
 */
bool write_summary_file(const RunSummary& summary, const std::string& path);

} // namespace logictest
