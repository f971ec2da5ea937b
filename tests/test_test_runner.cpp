#include <catch2/catch_test_macros.hpp>
#include "runner/test_runner.hpp"
#include "parser/directive_parser.hpp"
#include "mocks/mock_harness.hpp"
#include "mocks/temp_dir.hpp"

#include <sstream>

using namespace logictest;
using logictest::testing::MockHarness;
using logictest::testing::TmpDir;

namespace {

std::vector<Record> parse(const std::string& text) {
    std::istringstream input(text);
    auto result = parse_records(input);
    REQUIRE(result.is_ok());
    return result.value();
}

size_t count_lines(const std::string& text, const std::string& needle) {
    size_t count = 0;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find(needle) != std::string::npos) ++count;
    }
    return count;
}

} // anonymous namespace

TEST_CASE("TestRunner: statements", "[runner]") {
    MockHarness harness;
    std::ostringstream out;
    RunLogger logger(out);
    TestRunner runner(harness, logger);

    harness.respond("INSERT INTO nope VALUES(1)", HarnessResult::error("relation does not exist"));

    SECTION("expected success") {
        const auto summary = runner.run_records(parse("statement ok\nCREATE TABLE t(a INTEGER)\n"));
        CHECK(summary.counts.ok == 1);
        CHECK(count_lines(out.str(), " ok") == 1);
    }

    SECTION("expected error that occurs") {
        const auto summary = runner.run_records(parse("statement error\nINSERT INTO nope VALUES(1)\n"));
        CHECK(summary.counts.ok == 1);
    }

    SECTION("expected error that does not occur") {
        const auto records = parse("statement error\nSELECT 1\n");
        const auto execution = runner.execute_record(records[0]);
        CHECK(execution.outcome == RecordOutcome::FAILED);
        CHECK(execution.message == "Expected error but didn't get one");
    }

    SECTION("unexpected error") {
        const auto records = parse("statement ok\nINSERT INTO nope VALUES(1)\n");
        const auto execution = runner.execute_record(records[0]);
        CHECK(execution.outcome == RecordOutcome::FAILED);
        CHECK(execution.message == "Unexpected error relation does not exist");
        CHECK(out.str().find("not ok: Unexpected error relation does not exist") != std::string::npos);
    }
}

TEST_CASE("TestRunner: queries", "[runner]") {
    MockHarness harness;
    std::ostringstream out;
    RunLogger logger(out);
    TestRunner runner(harness, logger);

    harness.respond("SELECT a, b FROM t1", HarnessResult::rows("II", {"2", "1", "4", "3"}));

    SECTION("rowsort match") {
        const auto records = parse("query II rowsort\nSELECT a, b FROM t1\n----\n2\n1\n4\n3\n");
        const auto execution = runner.execute_record(records[0]);
        CHECK(execution.outcome == RecordOutcome::OK);
        REQUIRE(execution.observed.has_value());
        CHECK(execution.observed->schema == "II");
    }

    SECTION("valuesort match") {
        const auto records = parse("query II valuesort\nSELECT a, b FROM t1\n----\n1\n2\n3\n4\n");
        CHECK(runner.execute_record(records[0]).outcome == RecordOutcome::OK);
    }

    SECTION("mismatch keeps what was observed") {
        const auto records = parse("query II nosort\nSELECT a, b FROM t1\n----\n1\n2\n3\n4\n");
        const auto execution = runner.execute_record(records[0]);
        CHECK(execution.outcome == RecordOutcome::FAILED);
        CHECK(execution.message == "Incorrect result at position 0. Expected 1, got 2");
        REQUIRE(execution.observed.has_value());
        CHECK(execution.observed->values == std::vector<std::string>{"2", "1", "4", "3"});
    }

    SECTION("query error is a failure") {
        harness.respond("SELECT broken", HarnessResult::error("syntax error"));
        const auto records = parse("query I\nSELECT broken\n----\n1\n");
        const auto execution = runner.execute_record(records[0]);
        CHECK(execution.outcome == RecordOutcome::FAILED);
        CHECK(execution.message == "Unexpected error syntax error");
        CHECK_FALSE(execution.observed.has_value());
    }
}

TEST_CASE("TestRunner: skipped records never reach the engine", "[runner][conditions]") {
    MockHarness harness("postgresql");
    std::ostringstream out;
    RunLogger logger(out);
    TestRunner runner(harness, logger);

    const auto summary = runner.run_records(parse(
        "skipif postgresql\n"
        "statement ok\n"
        "DROP EVERYTHING\n"
        "\n"
        "onlyif mysql\n"
        "query I\n"
        "SELECT mysql_only()\n"
        "----\n"
        "1\n"
        "\n"
        "statement ok\n"
        "SELECT 1\n"));

    CHECK(summary.counts.skipped == 2);
    CHECK(summary.counts.ok == 1);
    CHECK(harness.executed == std::vector<std::string>{"SELECT 1"});
    CHECK(count_lines(out.str(), " skipped") == 2);
}

TEST_CASE("TestRunner: one faulty record does not stop the file", "[runner][isolation]") {
    MockHarness harness;
    std::ostringstream out;
    RunLogger logger(out);
    TestRunner runner(harness, logger);

    harness.throw_on = {"SELECT explode()"};
    // Three values cannot be split into two-column rows, so rowsort throws
    harness.respond("SELECT three_values", HarnessResult::rows("II", {"1", "2", "3"}));

    const auto summary = runner.run_records(parse(
        "statement ok\n"
        "SELECT explode()\n"
        "\n"
        "query II rowsort\n"
        "SELECT three_values\n"
        "----\n"
        "1\n"
        "2\n"
        "3\n"
        "\n"
        "statement ok\n"
        "SELECT 1\n"));

    CHECK(summary.counts.failed == 2);
    CHECK(summary.counts.ok == 1);
    CHECK(harness.executed.back() == "SELECT 1");
    CHECK(out.str().find("Caught exception: harness blew up on SELECT explode()") != std::string::npos);
}

TEST_CASE("TestRunner: halt", "[runner]") {
    MockHarness harness("postgresql");
    std::ostringstream out;
    RunLogger logger(out);
    TestRunner runner(harness, logger);

    SECTION("applicable halt stops the file") {
        const auto summary = runner.run_records(parse(
            "statement ok\nSELECT 1\n\nhalt\n\nstatement ok\nSELECT 2\n"));
        CHECK(summary.halted);
        CHECK(summary.counts.ok == 1);
        CHECK(harness.executed == std::vector<std::string>{"SELECT 1"});
    }

    SECTION("halt for another engine is ignored and not logged") {
        const auto summary = runner.run_records(parse(
            "onlyif mysql\nhalt\n\nstatement ok\nSELECT 2\n"));
        CHECK_FALSE(summary.halted);
        CHECK(summary.counts.ok == 1);
        CHECK(summary.counts.skipped == 0);
        CHECK(count_lines(out.str(), "skipped") == 0);
    }
}

TEST_CASE("TestRunner: run_file", "[runner][files]") {
    TmpDir tmp("test_runner");
    MockHarness harness;
    std::ostringstream out;
    RunLogger logger(out);
    TestRunner runner(harness, logger);

    SECTION("runs records after init") {
        const auto path = tmp.file("ok.test", "statement ok\nSELECT 1\n\nstatement ok\nSELECT 2\n");
        const auto summary = runner.run_file(path);
        CHECK_FALSE(summary.aborted);
        CHECK(summary.counts.ok == 2);
        CHECK(harness.init_count == 1);
        CHECK(out.str().find("ok.test:2: SELECT 1 ok") != std::string::npos);
    }

    SECTION("parse error abandons the file before anything runs") {
        const auto path = tmp.file("bad.test", "statement ok\nSELECT 1\n\nwhatever\n");
        const auto summary = runner.run_file(path);
        CHECK(summary.aborted);
        CHECK(summary.error_message.find("unknown directive") != std::string::npos);
        CHECK(harness.executed.empty());
        CHECK(harness.init_count == 0);
    }

    SECTION("init failure abandons the file") {
        harness.fail_init = true;
        const auto path = tmp.file("ok.test", "statement ok\nSELECT 1\n");
        const auto summary = runner.run_file(path);
        CHECK(summary.aborted);
        CHECK(summary.error_message.find("connection refused") != std::string::npos);
        CHECK(harness.executed.empty());
    }

    SECTION("init that throws abandons the file") {
        harness.throw_on_init = true;
        const auto path = tmp.file("ok.test", "statement ok\nSELECT 1\n");
        CHECK(runner.run_file(path).aborted);
    }

    SECTION("later files still run after an aborted one") {
        const auto bad = tmp.file("bad.test", "nonsense\n");
        const auto good = tmp.file("good.test", "statement ok\nSELECT 1\n");
        const auto summary = runner.run_files({bad, good});
        REQUIRE(summary.files.size() == 2);
        CHECK(summary.aborted_files() == 1);
        CHECK(summary.totals().ok == 1);
        CHECK_FALSE(summary.all_passed());
    }
}

TEST_CASE("TestRunner: outcome names", "[runner]") {
    CHECK(std::string(record_outcome_to_string(RecordOutcome::OK)) == "ok");
    CHECK(std::string(record_outcome_to_string(RecordOutcome::FAILED)) == "not ok");
    CHECK(std::string(record_outcome_to_string(RecordOutcome::SKIPPED)) == "skipped");
}
