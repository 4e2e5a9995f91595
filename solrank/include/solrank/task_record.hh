#pragma once

#include <json/json.h>
#include <solrank/dataset_type.hh>
#include <solrank/jsonl.hh>
#include <string>
#include <string_view>
#include <vector>

namespace solrank {

// Dataset-aware view of one task line. Fields that are not used are carried
// through untouched.
class TaskRecord {
    DatasetType dataset_;
    JsonLine line_;

public:
    /**
     * @brief Wraps @p line
     *
     * @errors Throws std::runtime_error if the line is not an object or lacks
     *   a field required for @p dataset
     */
    TaskRecord(DatasetType dataset, JsonLine line);

    [[nodiscard]] DatasetType dataset() const noexcept { return dataset_; }

    [[nodiscard]] const Json::Value& json() const noexcept { return line_.value; }

    [[nodiscard]] Json::Value& json() noexcept { return line_.value; }

    // Text the Json::Value offsets refer to
    [[nodiscard]] std::string_view source_text() const noexcept { return line_.text; }

    [[nodiscard]] size_t line_no() const noexcept { return line_.line_no; }

    // "task_id" as a string (numbers are converted), empty if absent
    [[nodiscard]] std::string task_id() const;

    [[nodiscard]] std::string entry_point() const;

    // List of argument lists of the given tier (HE, HE_plus, MBPP_plus)
    [[nodiscard]] const Json::Value& inputs(bool plus_tier) const;

    // Assertion statements: test_list followed by challenge_test_list (MBPP)
    [[nodiscard]] std::vector<std::string> assertion_statements() const;

    /**
     * @brief Builds the program the tests are appended to
     * @details MBPP: code + "\n" + test_setup_code + "\n\n"; otherwise
     *   prompt.strip() + "\n" + canonical_solution if @p add_prompt, else
     *   canonical_solution
     */
    [[nodiscard]] std::string program_text(bool add_prompt) const;
};

// Returns the string value of @p field, or throws std::runtime_error naming it
std::string required_string(const Json::Value& record, std::string_view field);

} // namespace solrank
