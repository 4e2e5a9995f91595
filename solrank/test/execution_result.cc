#include <cmath>
#include <gtest/gtest.h>
#include <solrank/execution_result.hh>
#include <solrank/jsonl.hh>

using solrank::ExecutionResult;
using solrank::TestOutcome;

// NOLINTNEXTLINE
TEST(ExecutionResult, add) {
    ExecutionResult res;
    EXPECT_EQ(res.average_test_score, 0);
    EXPECT_TRUE(std::isinf(res.effective_average_time_taken()));

    res.add(TestOutcome{.passed = true, .stdout_text = "3\n", .elapsed = 0.25});
    res.add(TestOutcome{
        .passed = false,
        .stdout_text = "",
        .stderr_text = "ZeroDivisionError('division by zero')",
        .traceback = "  File \"<string>\", line 2\n",
        .elapsed = 0.75,
    });
    EXPECT_EQ(res.correct_tests, (std::vector<bool>{true, false}));
    EXPECT_EQ(res.average_test_score, 0.5);
    EXPECT_EQ(res.unit_test_stdouts, (std::vector<std::string>{"3\n", ""}));
    EXPECT_EQ(res.unit_test_stderrs[1], "ZeroDivisionError('division by zero')");
    EXPECT_EQ(res.traceback[0], "");
    EXPECT_EQ(res.effective_average_time_taken(), 0.5);

    res.average_time_taken = 2.0;
    EXPECT_EQ(res.effective_average_time_taken(), 2.0);
}

// NOLINTNEXTLINE
TEST(ExecutionResult, json) {
    ExecutionResult res;
    res.add(TestOutcome{.passed = true, .stdout_text = "x", .elapsed = 1.5});
    auto json = res.to_json();
    EXPECT_EQ(
        solrank::to_json_line(json),
        R"({"average_test_score":1.0,"correct_tests":[true],"time_taken":[1.5],)"
        R"("traceback":[""],"unit_test_stderrs":[""],"unit_test_stdouts":["x"]})"
    );

    auto back = ExecutionResult::from_json(json);
    EXPECT_EQ(back.correct_tests, res.correct_tests);
    EXPECT_EQ(back.unit_test_stdouts, res.unit_test_stdouts);
    EXPECT_EQ(back.time_taken, res.time_taken);
    EXPECT_FALSE(back.average_time_taken.has_value());
}

// NOLINTNEXTLINE
TEST(ExecutionResult, from_json_missing_fields) {
    auto res = ExecutionResult::from_json(
        solrank::parse_json(R"({"correct_tests": [true, false, false], "average_time_taken": 0.3})")
    );
    EXPECT_DOUBLE_EQ(res.average_test_score, 1.0 / 3);
    EXPECT_TRUE(res.unit_test_stderrs.empty());
    EXPECT_TRUE(res.time_taken.empty());
    EXPECT_EQ(res.effective_average_time_taken(), 0.3);

    auto empty = ExecutionResult::from_json(solrank::parse_json("{}"));
    EXPECT_EQ(empty.average_test_score, 0);
    EXPECT_TRUE(std::isinf(empty.effective_average_time_taken()));
}

// NOLINTNEXTLINE
TEST(ExecutionResult, from_json_invalid) {
    auto from = [](const char* text) { return ExecutionResult::from_json(solrank::parse_json(text)); };
    EXPECT_THROW(from("[]"), std::runtime_error);
    EXPECT_THROW(from(R"({"correct_tests": 1})"), std::runtime_error);
    EXPECT_THROW(from(R"({"correct_tests": [1]})"), std::runtime_error);
    EXPECT_THROW(from(R"({"unit_test_stderrs": [null]})"), std::runtime_error);
    EXPECT_THROW(from(R"({"time_taken": ["fast"]})"), std::runtime_error);
    EXPECT_THROW(from(R"({"average_test_score": "high"})"), std::runtime_error);
}
