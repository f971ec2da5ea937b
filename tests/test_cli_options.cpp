#include <catch2/catch_test_macros.hpp>
#include "config/cli_options.hpp"

using namespace logictest;

TEST_CASE("CliOptions: flags and paths", "[cli]") {
    const auto result = parse_cli_args({
        "--config", "slt.toml", "--engine", "mysql", "--connection", "host=db",
        "--generate", "--truncate-queries", "--summary", "s.json", "--log-level", "error",
        "test/select1.test", "test/index"});
    REQUIRE(result.is_ok());

    const auto& cli = result.value();
    CHECK(cli.config_file == "slt.toml");
    CHECK(cli.engine == "mysql");
    CHECK(cli.connection_string == "host=db");
    CHECK(cli.generate);
    CHECK(cli.truncate_queries);
    CHECK(cli.summary_file == "s.json");
    CHECK(cli.log_level == "error");
    CHECK(cli.paths == std::vector<std::string>{"test/select1.test", "test/index"});
    CHECK_FALSE(cli.show_help);
}

TEST_CASE("CliOptions: errors", "[cli]") {
    SECTION("flag without value") {
        const auto result = parse_cli_args({"t.test", "--engine"});
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
    }

    SECTION("unknown flag") {
        const auto result = parse_cli_args({"--fast"});
        REQUIRE(result.is_error());
        CHECK(result.error_message().find("--fast") != std::string::npos);
    }
}

TEST_CASE("CliOptions: command line overrides the file", "[cli][config]") {
    RunnerConfig cfg;
    cfg.engine = "postgresql";
    cfg.connection_string = "host=file";
    cfg.paths = {"from_file/"};

    SECTION("given flags win") {
        const auto cli = parse_cli_args({"-e", "mysql", "from_cli.test"});
        REQUIRE(cli.is_ok());
        apply_cli_overrides(cfg, cli.value());
        CHECK(cfg.engine == "mysql");
        CHECK(cfg.connection_string == "host=file");
        CHECK(cfg.paths == std::vector<std::string>{"from_cli.test"});
    }

    SECTION("absent flags keep the file's values") {
        const auto cli = parse_cli_args({});
        REQUIRE(cli.is_ok());
        apply_cli_overrides(cfg, cli.value());
        CHECK(cfg.engine == "postgresql");
        CHECK(cfg.paths == std::vector<std::string>{"from_file/"});
    }
}

TEST_CASE("CliOptions: help", "[cli]") {
    const auto cli = parse_cli_args({"--help"});
    REQUIRE(cli.is_ok());
    CHECK(cli.value().show_help);
    CHECK(usage_text("logictest").find("Usage: logictest") != std::string::npos);
}
