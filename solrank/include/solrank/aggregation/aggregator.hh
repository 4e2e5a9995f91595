#pragma once

#include <json/json.h>
#include <solrank/aggregation/ranker.hh>
#include <solrank/config.hh>
#include <solrank/jsonl.hh>
#include <string>
#include <vector>

namespace solrank {

// A solution to a task: the reference (id 0) or one from a run file
struct CandidateSolution {
    unsigned id;
    Json::Value record;
};

// Executed solutions from one run, line i corresponds to task i
struct RunFile {
    std::string path;
    std::vector<JsonLine> lines;
};

/**
 * @brief Whether every stderr of both tiers of @p record is a non-empty text
 *   other than "AssertionError()" (false if there are no stderrs)
 */
bool is_degenerate(const Json::Value& record);

// Fills missing average_time_taken of the execution results of @p record and
// drops the per-test lists from them
void clean_execution_results(Json::Value& record);

// Records written for one task
struct AggregatedTask {
    Json::Value unranked;
    Json::Value ranked;
    Json::Value base_ranked;
    Json::Value plus_ranked;
};

class Aggregator {
    DatasetType dataset_;
    Ranker ranker_;
    size_t tossed_ = 0;

public:
    Aggregator(DatasetType dataset, double time_ratio_threshold) noexcept
    : dataset_(dataset)
    , ranker_(time_ratio_threshold) {}

    /**
     * @brief Builds the candidate pool of task @p task_idx: the reference
     *   @p task and line @p task_idx of every run file that has it
     * @details Ids are assigned in the order of @p runs starting from 1, a run
     *   file without the line still consumes its id. A candidate whose prompt
     *   extends the reference's prompt is truncated to it, other mismatches
     *   are logged.
     */
    [[nodiscard]] std::vector<CandidateSolution>
    candidate_pool(const Json::Value& task, size_t task_idx, const std::vector<RunFile>& runs) const;

    /**
     * @brief Removes degenerate candidates, counting them in tossed()
     *
     * @errors Throws InvariantViolation if the reference is degenerate
     */
    std::vector<CandidateSolution> filter_degenerate(std::vector<CandidateSolution> pool);

    // Builds the output records of @p task from the filtered @p pool
    [[nodiscard]] AggregatedTask
    aggregate(const Json::Value& task, std::vector<CandidateSolution> pool) const;

    // Number of candidates removed by filter_degenerate()
    [[nodiscard]] size_t tossed() const noexcept { return tossed_; }
};

/**
 * @brief Joins @p task_file with the run files in @p runs_dir matching
 *   config.run_file_pattern and writes <dataset>_unranked.jsonl,
 *   <dataset>_ranked.jsonl, <dataset>_base_ranked.jsonl and
 *   <dataset>_plus_ranked.jsonl to @p output_dir
 *
 * @return number of candidates discarded as degenerate
 *
 * @errors Throws std::runtime_error on I/O and format errors and
 *   InvariantViolation if a reference solution is degenerate
 */
size_t combine_files(
    const Config& config,
    const std::string& task_file,
    const std::string& runs_dir,
    const std::string& output_dir
);

} // namespace solrank
