#include "config/config_loader.hpp"
#include "core/database_type.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>

using namespace std::string_literals;

namespace logictest {

static constexpr std::string_view kRunner  = "runner";
static constexpr std::string_view kLogging = "logging";

// ============================================================================
// TOML Helpers
// ============================================================================

namespace {

std::string expanded_string(const toml::table& tbl, std::string_view key, std::string fallback) {
    if (const auto* s = tbl[key].as_string()) {
        return ConfigLoader::expand_env_vars(s->get());
    }
    return fallback;
}

std::vector<std::string> expanded_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string(); s && !s->get().empty()) {
                result.push_back(ConfigLoader::expand_env_vars(s->get()));
            }
        }
    }
    return result;
}

RunnerConfig extract_config(const toml::table& root) {
    RunnerConfig config;

    if (const auto* r = root[kRunner].as_table()) {
        const auto& tbl = *r;
        config.engine = expanded_string(tbl, "engine", ""s);
        config.connection_string = expanded_string(tbl, "connection_string", ""s);
        config.truncate_queries = tbl["truncate_queries"].value_or(false);
        config.generate = tbl["generate"].value_or(false);
        config.summary_file = expanded_string(tbl, "summary_file", ""s);
        config.paths = expanded_string_array(tbl, "paths");
    }

    if (const auto* l = root[kLogging].as_table()) {
        config.logging.level = expanded_string(*l, "level", "info"s);
    }

    return config;
}

} // anonymous namespace

// ============================================================================
// Environment
// ============================================================================

std::string ConfigLoader::expand_env_vars(std::string_view input) {
    if (input.find("${") == std::string_view::npos) return std::string(input);

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string_view::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name(input.substr(i + 2, close - i - 2));
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void ConfigLoader::apply_env_overrides(RunnerConfig& config) {
    if (std::getenv(kTruncateQueriesEnv) != nullptr) {
        config.truncate_queries = true;
    }
}

// ============================================================================
// Public API
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open config file: {}", config_path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return load_from_string(buffer);
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = toml::parse(toml_content);
        return LoadResult::ok(extract_config(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RunnerConfig& config) {
    std::vector<std::string> errors;

    if (config.engine.empty()) {
        errors.emplace_back("runner.engine is required");
    } else if (!parse_database_type(config.engine)) {
        errors.push_back(std::format("runner.engine '{}' is not a supported engine", config.engine));
    }

    if (config.paths.empty()) {
        errors.emplace_back("no test files or directories given");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of info, warn, error",
            config.logging.level));
    }

    return errors;
}

} // namespace logictest
