#pragma once

#include <solrank/dataset_type.hh>
#include <solrank/normalization/input_normalizer.hh>
#include <solrank/task_record.hh>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace solrank {

// print(function_name(arguments...)), optionally preceded by imports
struct CallDescriptor {
    std::string function_name;
    Arguments arguments;
    bool wrap_result_in_bool = false; // print(bool(function_name(...)))
    std::vector<std::string> imports; // statements, e.g. "from math import inf"
};

// Statement executed as is, e.g. "assert f(1) == 2"
struct AssertionStatement {
    std::string statement;
};

using Invocation = std::variant<CallDescriptor, AssertionStatement>;

// Adjustments of the generated test statements needed by particular tasks
struct InvocationQuirks {
    std::vector<std::string> imports;
    bool wrap_result_in_bool = false;
};

// Quirks of task @p task_id (none for datasets other than MBPP_plus)
InvocationQuirks invocation_quirks(DatasetType dataset, std::string_view task_id);

// Python source of the test, appended to the program text
std::string render(const Invocation& invocation);

/**
 * @brief Builds the tests of tier @p plus_tier of @p task
 * @details MBPP: assertion statements (the plus tier is empty). Other
 *   datasets: one call of the entry point per input list; MBPP_plus inputs
 *   are coerced to the shapes the task expects.
 *
 * @errors Throws std::runtime_error if the inputs are malformed
 */
std::vector<Invocation> build_invocations(const TaskRecord& task, bool plus_tier);

} // namespace solrank
