#pragma once

#include <json/json.h>
#include <map>
#include <vector>

namespace solrank {

enum class Tier {
    BASE,
    PLUS, // blends the plus and base tiers weighted by their numbers of inputs
};

// Id of the reference solution
constexpr unsigned REFERENCE_ID = 0;

// Scores within this distance are treated as tied in the timing tie-break
constexpr double SCORE_TIE_TOLERANCE = 1e-9;

// The reference joins a score group within this distance of the group's score
constexpr double REFERENCE_GROUP_TOLERANCE = 1e-20;

struct RankingEntry {
    unsigned id;
    double score; // effective score of the tier, own_tier_score() for the reference
    double time; // average time taken [s], +infinity if unknown
};

// solution id => rank
using Ranking = std::map<unsigned, unsigned>;

/**
 * @brief Score of a candidate record in @p tier
 * @details BASE: base average_test_score. PLUS: (plus * |plus_input| +
 *   base * |base_input|) / (|plus_input| + |base_input|), 0 if both input
 *   lists are empty.
 *
 * @errors Throws std::runtime_error if an execution result is missing
 */
double tier_score(const Json::Value& record, Tier tier);

// average_test_score of the tier's own execution result of @p record, by
// which the reference joins a score group
double own_tier_score(const Json::Value& record, Tier tier);

// Average time taken of @p record in the tier's own execution result,
// +infinity if unknown
double tier_time(const Json::Value& record, Tier tier);

class Ranker {
    double time_ratio_threshold_;

public:
    explicit Ranker(double time_ratio_threshold) noexcept
    : time_ratio_threshold_(time_ratio_threshold) {}

    /**
     * @brief Ranks @p entries
     * @details Entries are grouped by exact score. Within a group (joined by
     *   the reference if its score is within REFERENCE_GROUP_TOLERANCE), a
     *   pair with scores within SCORE_TIE_TOLERANCE and the ratio of times
     *   below the threshold loses its slower member (the later one on equal
     *   times) unless it is the reference. A pass scans pairs (i, j), i < j,
     *   in order and goes on after an elimination (with the next i if the
     *   first member was eliminated). Passes are repeated until one
     *   eliminates nothing. Survivors are sorted by score
     *   descending (stable) and ranked from 2. The reference always gets 1.
     *
     * @return ranks of the surviving entries, dense and unique
     */
    [[nodiscard]] Ranking rank(const std::vector<RankingEntry>& entries) const;

    [[nodiscard]] double time_ratio_threshold() const noexcept { return time_ratio_threshold_; }
};

} // namespace solrank
