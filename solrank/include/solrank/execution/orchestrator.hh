#pragma once

#include <atomic>
#include <map>
#include <solrank/config.hh>
#include <solrank/execution/worker.hh>
#include <solrank/jsonl.hh>
#include <solrank/task_record.hh>
#include <solranklib/concurrent/job_processor.hh>
#include <solranklib/concurrent/mutexed_value.hh>
#include <string>
#include <vector>

namespace solrank {

/**
 * @brief Per-test time limits of a tier of @p tests_no tests
 * @details Either config.effective_timeout() for every test or, if
 *   config.timeouts_from_record is set, max(timeout_min, t * timeout_multiple)
 *   where t is the test's time_taken from @p result_field of @p record
 *
 * @errors Throws std::runtime_error if the previous timings are missing or
 *   their number differs from @p tests_no
 */
std::vector<double> tier_time_limits(
    const Config& config, const Json::Value& record, const char* result_field, size_t tests_no
);

/**
 * @brief Runs both tiers of tests of @p task and attaches
 *   base_execution_result and plus_execution_result to its record
 * @details For MBPP, "\n" + test_list[0] + "\n" is appended to "text".
 *
 * @errors Throws std::runtime_error if the record is malformed
 */
void execute_task(const Config& config, Worker& worker, TaskRecord& task);

struct ExecutionSummary {
    size_t executed = 0;
    size_t failed = 0;
};

// Executes records with a pool of config.workers threads. Records that fail
// to be processed are logged and left out of the output.
class Orchestrator : public concurrent::JobProcessor<size_t> {
    const Config& config_;
    Worker& worker_;
    std::vector<JsonLine> lines_;
    // index of the record => the record with results serialized
    concurrent::MutexedValue<std::map<size_t, std::string>> results_;
    std::atomic<size_t> completed_ = 0;
    std::atomic<size_t> failed_ = 0;

public:
    Orchestrator(const Config& config, Worker& worker, std::vector<JsonLine> lines);

    // Serialized output records in the input order
    std::vector<std::string> execute();

    [[nodiscard]] ExecutionSummary summary() const noexcept {
        return {.executed = completed_ - failed_, .failed = failed_};
    }

protected:
    void produce_jobs() override;

    void process_job(size_t idx) noexcept override;
};

/**
 * @brief Executes every record of @p input_file and writes the results to
 *   @p output_file
 *
 * @errors Throws std::runtime_error if the input cannot be read or the output
 *   cannot be written
 */
ExecutionSummary
execute_file(const Config& config, const std::string& input_file, const std::string& output_file);

} // namespace solrank
