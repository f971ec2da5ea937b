#include "config/cli_options.hpp"
#include "config/config_loader.hpp"
#include "core/database_type.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "harness/harness_registry.hpp"
#include "runner/result_generator.hpp"
#include "runner/run_logger.hpp"
#include "runner/test_file_collector.hpp"
#include "runner/test_runner.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_harness.hpp"
#endif
#ifdef ENABLE_MYSQL
#include "db/mysql/mysql_harness.hpp"
#endif

#include <cstdlib>
#include <exception>
#include <format>
#include <iostream>
#include <memory>

using namespace logictest;

namespace {

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

// =========================================================================
// Explicit Harness Registration
// =========================================================================

void register_harnesses() {
    #ifdef ENABLE_POSTGRESQL
    HarnessRegistry::instance().register_harness(
        DatabaseType::POSTGRESQL,
        [](const std::string& conn) { return std::make_unique<PgHarness>(conn); });
    #endif

    #ifdef ENABLE_MYSQL
    HarnessRegistry::instance().register_harness(
        DatabaseType::MYSQL,
        [](const std::string& conn) { return std::make_unique<MysqlHarness>(conn); });
    #endif
}

int run_generate(IHarness& harness, TestRunner& runner, const std::vector<std::string>& files) {
    ResultGenerator generator(harness, runner);
    int exit_code = kExitPassed;
    for (const auto& file : files) {
        const auto result = generator.generate_file(file);
        if (result.is_error()) {
            utils::log::error(result.error_message());
            exit_code = kExitFailed;
        }
    }
    return exit_code;
}

int run_verify(TestRunner& runner, const RunnerConfig& config,
               const std::vector<std::string>& files) {
    const auto summary = runner.run_files(files);
    const auto totals = summary.totals();

    utils::log::info(std::format("{} files: {} ok, {} not ok, {} skipped, {} aborted",
        summary.files.size(), totals.ok, totals.failed, totals.skipped,
        summary.aborted_files()));

    if (!config.summary_file.empty() && !write_summary_file(summary, config.summary_file)) {
        utils::log::error(std::format("Failed to write summary to {}", config.summary_file));
        return kExitFailed;
    }
    return summary.all_passed() ? kExitPassed : kExitFailed;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const std::string program = argc > 0 ? argv[0] : "logictest";
        const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

        const auto cli = parse_cli_args(args);
        if (cli.is_error()) {
            std::cerr << cli.error_message() << "\n\n" << usage_text(program);
            return kExitUsage;
        }
        if (cli.value().show_help) {
            std::cout << usage_text(program);
            return kExitPassed;
        }

        // Configuration: file, then environment, then command line
        RunnerConfig config;
        if (cli.value().config_file) {
            auto loaded = ConfigLoader::load_from_file(*cli.value().config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return kExitUsage;
            }
            config = std::move(loaded.config);
        }
        ConfigLoader::apply_env_overrides(config);
        apply_cli_overrides(config, cli.value());

        const auto errors = ConfigLoader::validate_config(config);
        if (!errors.empty()) {
            for (const auto& err : errors) {
                utils::log::error(err);
            }
            std::cerr << '\n' << usage_text(program);
            return kExitUsage;
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        register_harnesses();
        const auto type = *parse_database_type(config.engine);
        if (!HarnessRegistry::instance().has_harness(type)) {
            utils::log::error(std::format("Engine '{}' was not compiled into this build",
                database_type_to_string(type)));
            return kExitUsage;
        }

        const auto files = collect_test_files(config.paths);
        if (files.is_error()) {
            utils::log::error(std::format("{}: {}",
                error_category_to_string(files.error_category()), files.error_message()));
            return kExitUsage;
        }
        utils::log::info(std::format("Collected {} test files for {}",
            files.value().size(), database_type_to_string(type)));

        auto harness = HarnessRegistry::instance().create(type, config.connection_string);
        RunLogger logger(std::cout, RunLogger::Options{config.truncate_queries, {}});
        TestRunner runner(*harness, logger);

        if (config.generate) {
            return run_generate(*harness, runner, files.value());
        }
        return run_verify(runner, config, files.value());

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitFailed;
    }
}
