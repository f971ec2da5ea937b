#include "runner/run_summary.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <fstream>

namespace logictest {

RecordCounts RunSummary::totals() const {
    RecordCounts totals;
    for (const auto& file : files) {
        totals += file.counts;
    }
    return totals;
}

size_t RunSummary::aborted_files() const {
    return static_cast<size_t>(std::count_if(files.begin(), files.end(),
        [](const FileSummary& f) { return f.aborted; }));
}

bool RunSummary::all_passed() const {
    return totals().failed == 0 && aborted_files() == 0;
}

nlohmann::json RunSummary::to_json() const {
    nlohmann::json files_json = nlohmann::json::array();
    for (const auto& file : files) {
        nlohmann::json entry = {
            {"path", file.path},
            {"ok", file.counts.ok},
            {"failed", file.counts.failed},
            {"skipped", file.counts.skipped},
            {"halted", file.halted},
            {"aborted", file.aborted},
            {"elapsed_ms", file.elapsed.count()},
        };
        if (file.aborted) {
            entry["error"] = file.error_message;
        }
        files_json.push_back(std::move(entry));
    }

    const auto sums = totals();
    return {
        {"files", std::move(files_json)},
        {"totals", {
            {"ok", sums.ok},
            {"failed", sums.failed},
            {"skipped", sums.skipped},
            {"aborted_files", aborted_files()},
        }},
    };
}

bool write_summary_file(const RunSummary& summary, const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        utils::log::error(std::format("Cannot open summary file {}", path));
        return false;
    }

    out << summary.to_json().dump(2) << '\n';
    if (!out) {
        utils::log::error(std::format("Failed writing summary file {}", path));
        return false;
    }
    return true;
}

} // namespace logictest
