#pragma once

#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace solrank {

// Outcome of running one test against one program
struct TestOutcome {
    bool passed = false;
    std::string stdout_text;
    std::string stderr_text;
    std::string traceback;
    double elapsed = 0; // [s]
};

// Outcome of running one solution against one tier of tests
struct ExecutionResult {
    std::vector<bool> correct_tests;
    double average_test_score = 0;
    std::vector<std::string> unit_test_stdouts;
    std::vector<std::string> unit_test_stderrs;
    std::vector<std::string> traceback;
    std::vector<double> time_taken;
    std::optional<double> average_time_taken;

    void add(TestOutcome outcome);

    // Mean of correct_tests (0.0 if there are no tests)
    void update_average_test_score() noexcept;

    // average_time_taken if present, otherwise mean of time_taken, otherwise +infinity
    [[nodiscard]] double effective_average_time_taken() const noexcept;

    [[nodiscard]] Json::Value to_json() const;

    /**
     * @brief Reads an execution result; missing lists are treated as empty
     *
     * @errors Throws std::runtime_error if a present field has a wrong type
     */
    static ExecutionResult from_json(const Json::Value& json);
};

} // namespace solrank
