#pragma once

#include <cstdint>
#include <optional>
#include <solrank/execution/filesystem_operations.hh>
#include <solrank/execution/process_runner.hh>
#include <solrank/execution_result.hh>
#include <string>
#include <string_view>
#include <vector>

namespace solrank {

// stderr of a test that exceeded its time limit
constexpr std::string_view TIMEOUT_STDERR = "TimeoutException('Timed out!')";

// The harness enforces the time limit of a test around the executed code. The
// interpreter process is killed only after the time limit plus this [s].
constexpr double INTERPRETER_STARTUP_SLACK = 2.0;

struct WorkerOptions {
    std::string python_executable = "python3";
    std::optional<uint64_t> memory_limit; // [bytes]
    std::optional<uint64_t> output_limit; // [bytes]
};

// Runs a program followed by one test in a disposable directory and a
// separate interpreter process
class Worker {
    FilesystemOperations& fs_;
    ProcessRunner& runner_;
    WorkerOptions opts_;

public:
    Worker(FilesystemOperations& fs, ProcessRunner& runner, WorkerOptions opts);

    /**
     * @brief Runs @p program followed by @p test with time limit
     *   @p time_limit seconds
     * @details The time limit covers only the execution of the code, not the
     *   interpreter startup. The test passes iff it finished in time, the
     *   interpreter exited with status 0 and nothing was written to stderr.
     *   If the code raised an exception, stderr holds only its repr().
     *   Failures of the machinery itself are reported as a failed test with a
     *   diagnostic in stderr and traceback.
     */
    TestOutcome run_test(const std::string& program, std::string_view test, double time_limit) noexcept;

    // Runs @p tests one by one, test i with time limit @p time_limits[i] [s]
    ExecutionResult run_tier(
        const std::string& program,
        const std::vector<std::string>& tests,
        const std::vector<double>& time_limits
    );

private:
    TestOutcome run_test_impl(const std::string& program, std::string_view test, double time_limit);
};

} // namespace solrank
