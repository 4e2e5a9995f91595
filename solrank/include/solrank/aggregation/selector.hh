#pragma once

#include <json/json.h>
#include <solrank/config.hh>
#include <string>
#include <vector>

namespace solrank {

// One element of all_solutions of a tier-specific ranked record
struct ScoredSolution {
    unsigned rank;
    double score;
    double time; // +infinity if unknown
    Json::Value entry; // {rank, average_test_score, average_time_taken, solution}
};

class Selector {
    size_t target_pool_size_;
    double soft_floor_upper_bound_;

public:
    Selector(size_t target_pool_size, double soft_floor_upper_bound) noexcept
    : target_pool_size_(target_pool_size)
    , soft_floor_upper_bound_(soft_floor_upper_bound) {}

    /**
     * @brief Keeps one solution per exact score: all rank-1 solutions of a
     *   score if there are any, otherwise the fastest one (the first on ties)
     * @details Groups keep the order of their first appearance.
     */
    [[nodiscard]] static std::vector<ScoredSolution> deduplicate(std::vector<ScoredSolution> pool);

    /**
     * @brief Picks @p k solutions from @p sorted (sorted by score descending)
     *   spread over the range of scores
     * @details The bottom anchor is the lowest score in (0,
     *   soft_floor_upper_bound) or, if there is none, the last solution. For
     *   t = i/k, i = 1..k-1 the unselected solution closest to
     *   1 - t * (1 - anchor) is picked (the first one on ties).
     *
     * @return picked solutions in the order of @p sorted
     */
    [[nodiscard]] std::vector<ScoredSolution>
    pick_spaced(std::vector<ScoredSolution> sorted, size_t k) const;

    /**
     * @brief Deduplicates @p pool, bounds it to target_pool_size solutions
     *   (rank-1 solutions are never dropped) and ranks it again from 1: the
     *   rank-1 solution first, then the rest by score descending
     *
     * @errors Throws InvariantViolation if there is not exactly one rank-1
     *   solution after deduplication
     */
    [[nodiscard]] std::vector<ScoredSolution> select(std::vector<ScoredSolution> pool) const;
};

/**
 * @brief Down-samples all_solutions of a tier-specific ranked record
 * @details Test inputs are moved from the solutions to the record. For
 *   datasets with a prompt the reference's canonical_solution is prefixed
 *   with its prompt.
 *
 * @errors Throws std::runtime_error if the record is malformed and
 *   InvariantViolation (see Selector::select())
 */
Json::Value filter_record(DatasetType dataset, const Selector& selector, Json::Value record);

/**
 * @brief Applies filter_record() to every record of @p input_file and writes
 *   the results to @p output_file
 *
 * @errors Throws std::runtime_error on I/O and format errors and
 *   InvariantViolation (see Selector::select())
 */
void filter_file(const Config& config, const std::string& input_file, const std::string& output_file);

} // namespace solrank
