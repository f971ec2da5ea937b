#include <catch2/catch_test_macros.hpp>
#include "runner/result_generator.hpp"
#include "mocks/mock_harness.hpp"
#include "mocks/temp_dir.hpp"

#include <sstream>

using namespace logictest;
using logictest::testing::MockHarness;
using logictest::testing::TmpDir;

namespace {

const std::string kSource =
    "# regenerate me\n"
    "statement ok\n"
    "CREATE TABLE t1(a INTEGER)\n"
    "\n"
    "query I rowsort\n"
    "SELECT a FROM t1\n"
    "----\n"
    "99\n"
    "\n"
    "skipif postgresql\n"
    "query I\n"
    "SELECT skipped\n"
    "----\n"
    "7\n"
    "\n"
    "query II nosort label-x\n"
    "SELECT a, b FROM t1\n"
    "\n"
    "query I valuesort\n"
    "SELECT many\n"
    "----\n"
    "old\n"
    "\n"
    "halt\n"
    "\n"
    "query I\n"
    "SELECT after_halt\n"
    "----\n"
    "1";

const std::string kExpected =
    "# regenerate me\n"
    "statement ok\n"
    "CREATE TABLE t1(a INTEGER)\n"
    "\n"
    "query I rowsort\n"
    "SELECT a FROM t1\n"
    "----\n"
    "1\n"
    "2\n"
    "3\n"
    "\n"
    "skipif postgresql\n"
    "query I\n"
    "SELECT skipped\n"
    "----\n"
    "7\n"
    "\n"
    "query IT nosort label-x\n"
    "SELECT a, b FROM t1\n"
    "----\n"
    "1\n"
    "x\n"
    "\n"
    "query I valuesort\n"
    "SELECT many\n"
    "----\n"
    "10 values hashing to ff2650590d3f27ea6644b5573ccc37ba\n"
    "\n"
    "halt\n"
    "\n"
    "query I\n"
    "SELECT after_halt\n"
    "----\n"
    "1\n";

void script_harness(MockHarness& harness) {
    harness.respond("SELECT a FROM t1", HarnessResult::rows("I", {"3", "1", "2"}));
    harness.respond("SELECT a, b FROM t1", HarnessResult::rows("IT", {"1", "x"}));

    std::vector<std::string> many;
    for (int i = 1; i <= 10; ++i) {
        many.push_back(std::to_string(i));
    }
    harness.respond("SELECT many", HarnessResult::rows("I", many));
}

} // anonymous namespace

TEST_CASE("ResultGenerator: writes <file>.generated", "[generator]") {
    TmpDir tmp("result_generator");
    MockHarness harness("postgresql");
    script_harness(harness);

    std::ostringstream out;
    RunLogger logger(out);
    TestRunner runner(harness, logger);
    ResultGenerator generator(harness, runner);

    const auto path = tmp.file("select1.test", kSource);
    const auto result = generator.generate_file(path);

    REQUIRE(result.is_ok());
    CHECK(result.value().output_path == path + ".generated");
    CHECK(result.value().rewritten == 3);
    CHECK(result.value().halted);
    CHECK(harness.init_count == 1);

    CHECK(TmpDir::read(result.value().output_path) == kExpected);

    SECTION("skipped and post-halt records never run") {
        for (const auto& sql : harness.executed) {
            CHECK(sql != "SELECT skipped");
            CHECK(sql != "SELECT after_halt");
        }
    }

    SECTION("the source file is untouched") {
        CHECK(TmpDir::read(path) == kSource);
    }
}

TEST_CASE("ResultGenerator: failed queries keep their original text", "[generator]") {
    MockHarness harness;
    harness.respond("SELECT broken", HarnessResult::error("syntax error"));

    std::ostringstream out;
    RunLogger logger(out);
    TestRunner runner(harness, logger);
    ResultGenerator generator(harness, runner);

    const std::vector<std::string> lines{
        "query I nosort", "SELECT broken", "----", "1", "", "statement ok", "SELECT 1"};

    Record::Data data;
    data.type = RecordType::QUERY;
    data.schema = "I";
    data.query = "SELECT broken";
    data.line_num = 2;
    data.result = {"1"};
    data.directive_line = 1;
    data.separator_line = 3;
    data.last_line = 4;

    GenerateSummary summary;
    const auto output = generator.rewrite(lines, {Record(std::move(data))}, summary);
    CHECK(output == lines);
    CHECK(summary.rewritten == 0);
    CHECK_FALSE(summary.halted);
}

TEST_CASE("ResultGenerator: rendering", "[generator]") {
    Record::Data data;
    data.type = RecordType::QUERY;
    data.schema = "I";
    data.sort_mode = SortMode::ROW_SORT;
    data.hash_threshold = 2;

    SECTION("at or below the threshold values are listed") {
        const Record r(data);
        CHECK(ResultGenerator::render_results(r, {"1", "2"}) == std::vector<std::string>{"1", "2"});
    }

    SECTION("above the threshold values are hashed") {
        const Record r(data);
        CHECK(ResultGenerator::render_results(r, {"1", "2", "3", "4"}) ==
              std::vector<std::string>{"4 values hashing to 302c28003d487124d97c242de94da856"});
    }

    SECTION("directive carries observed schema, sort mode and label") {
        data.label = "join-4-1";
        const Record r(data);
        CHECK(ResultGenerator::render_query_directive(r, "IR") == "query IR rowsort join-4-1");
    }
}

TEST_CASE("ResultGenerator: unreadable input", "[generator]") {
    TmpDir tmp("result_generator_errors");
    MockHarness harness;
    std::ostringstream out;
    RunLogger logger(out);
    TestRunner runner(harness, logger);
    ResultGenerator generator(harness, runner);

    SECTION("parse error") {
        const auto result = generator.generate_file(tmp.file("bad.test", "nonsense\n"));
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::PARSE_ERROR);
    }

    SECTION("init failure") {
        harness.fail_init = true;
        const auto result = generator.generate_file(tmp.file("ok.test", "statement ok\nSELECT 1\n"));
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::EXECUTION_ERROR);
    }
}

TEST_CASE("ResultGenerator: log lines name the source file", "[generator]") {
    TmpDir tmp("result_generator_log");
    MockHarness harness("postgresql");
    script_harness(harness);

    std::ostringstream out;
    RunLogger logger(out);
    TestRunner runner(harness, logger);
    ResultGenerator generator(harness, runner);

    const auto path = tmp.file("select1.test", kSource);
    REQUIRE(generator.generate_file(path).is_ok());

    const auto log = out.str();
    CHECK(log.find("select1.test:3: CREATE TABLE t1(a INTEGER) ok") != std::string::npos);
    CHECK(log.find("select1.test:12: SELECT skipped skipped") != std::string::npos);
    CHECK(log.find(" :") == std::string::npos);
}

TEST_CASE("ResultGenerator: CRLF sources stay CRLF", "[generator]") {
    TmpDir tmp("result_generator_crlf");
    MockHarness harness;
    harness.respond("SELECT a FROM t1", HarnessResult::rows("I", {"2", "1"}));

    std::ostringstream out;
    RunLogger logger(out);
    TestRunner runner(harness, logger);
    ResultGenerator generator(harness, runner);

    const auto path = tmp.file("crlf.test",
        "# windows file\r\n"
        "query I rowsort\r\n"
        "SELECT a FROM t1\r\n"
        "----\r\n"
        "9\r\n"
        "\r\n"
        "statement ok\r\n"
        "SELECT 1\r\n");
    const auto result = generator.generate_file(path);

    REQUIRE(result.is_ok());
    CHECK(TmpDir::read(result.value().output_path) ==
          "# windows file\r\n"
          "query I rowsort\r\n"
          "SELECT a FROM t1\r\n"
          "----\r\n"
          "1\r\n"
          "2\r\n"
          "\r\n"
          "statement ok\r\n"
          "SELECT 1\r\n");
}
