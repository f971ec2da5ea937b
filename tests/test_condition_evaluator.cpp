#include <catch2/catch_test_macros.hpp>
#include "runner/condition_evaluator.hpp"

using namespace logictest;

TEST_CASE("ConditionEvaluator: no conditions always run", "[conditions]") {
    CHECK(should_execute_for_engine({}, "postgresql"));
    CHECK(should_execute_for_engine({}, "mysql"));
}

TEST_CASE("ConditionEvaluator: single onlyif", "[conditions]") {
    const std::vector<Condition> only_mysql{Condition::only("mysql")};
    CHECK(should_execute_for_engine(only_mysql, "mysql"));
    CHECK_FALSE(should_execute_for_engine(only_mysql, "postgresql"));
}

TEST_CASE("ConditionEvaluator: skipif", "[conditions]") {
    const std::vector<Condition> skips{Condition::skip("mssql"), Condition::skip("oracle")};
    CHECK_FALSE(should_execute_for_engine(skips, "mssql"));
    CHECK_FALSE(should_execute_for_engine(skips, "oracle"));
    CHECK(should_execute_for_engine(skips, "postgresql"));
}

TEST_CASE("ConditionEvaluator: onlyif is only decisive when alone", "[conditions]") {
    const std::vector<Condition> mixed{Condition::only("mysql"), Condition::skip("oracle")};

    // With more than one condition only the skips are consulted
    CHECK(should_execute_for_engine(mixed, "mysql"));
    CHECK(should_execute_for_engine(mixed, "postgresql"));
    CHECK_FALSE(should_execute_for_engine(mixed, "oracle"));

    const std::vector<Condition> two_onlys{Condition::only("mysql"), Condition::only("mssql")};
    CHECK(should_execute_for_engine(two_onlys, "postgresql"));
}

TEST_CASE("ConditionEvaluator: engine names match exactly", "[conditions]") {
    const std::vector<Condition> only_mysql{Condition::only("mysql")};
    CHECK_FALSE(should_execute_for_engine(only_mysql, "MySQL"));
}
