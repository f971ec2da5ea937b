#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace logictest {

/** @brief Setting this environment variable (to anything) turns on query truncation */
inline constexpr const char* kTruncateQueriesEnv = "SQLLOGICTEST_TRUNCATE_QUERIES";

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// RunnerConfig - Complete parsed configuration
// ============================================================================

struct RunnerConfig {
    std::string engine;                 // harness registry key ("postgresql", "mysql", ...)
    std::string connection_string;
    bool truncate_queries = false;
    bool generate = false;              // write <file>.generated instead of verifying
    std::string summary_file;           // JSON run summary, empty = none
    std::vector<std::string> paths;     // test files and directories
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RunnerConfig config;

        static LoadResult ok(RunnerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to logictest.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from a TOML string
     *
     * ${VAR} references inside string values are replaced with the
     * environment variable's value (empty if unset). An unclosed "${" is
     * an error.
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Apply environment overrides (SQLLOGICTEST_TRUNCATE_QUERIES)
     */
    static void apply_env_overrides(RunnerConfig& config);

    /**
     * @brief Check a merged config (file + CLI) is runnable
     * @return One message per problem; empty if valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RunnerConfig& config);

    /**
     * @brief Expand ${VAR_NAME} patterns from the environment
     * @throws std::runtime_error on an unclosed "${"
     */
    [[nodiscard]] static std::string expand_env_vars(std::string_view input);
};

} // namespace logictest
