#pragma once

#include "config/config_loader.hpp"
#include "core/error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace logictest {

/**
 * @brief Command-line arguments
 *
 *   logictest [--config FILE] [--engine NAME] [--connection STR]
 *             [--generate] [--truncate-queries] [--summary FILE]
 *             [--log-level LEVEL] PATH...
 *
 * Every flag left unset here falls back to the config file.
 */
struct CliOptions {
    std::optional<std::string> config_file;
    std::optional<std::string> engine;
    std::optional<std::string> connection_string;
    std::optional<std::string> summary_file;
    std::optional<std::string> log_level;
    bool generate = false;
    bool truncate_queries = false;
    bool show_help = false;
    std::vector<std::string> paths;
};

[[nodiscard]] Result<CliOptions> parse_cli_args(const std::vector<std::string>& args);

/** @brief Flags that were given override the file's values; paths replace the file's list */
void apply_cli_overrides(RunnerConfig& config, const CliOptions& cli);

[[nodiscard]] std::string usage_text(const std::string& program);

} // namespace logictest
