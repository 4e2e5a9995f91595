#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <solrank/aggregation/ranker.hh>
#include <solrank/execution_result.hh>
#include <solranklib/macros/throw.hh>
#include <utility>

namespace solrank {

namespace {

constexpr auto INF = std::numeric_limits<double>::infinity();

const char* result_field(Tier tier) noexcept {
    return tier == Tier::BASE ? "base_execution_result" : "plus_execution_result";
}

ExecutionResult execution_result(const Json::Value& record, Tier tier) {
    const char* field = result_field(tier);
    if (not record.isMember(field)) {
        THROW("field `", field, "` is missing");
    }
    return ExecutionResult::from_json(record[field]);
}

double list_size(const Json::Value& record, const char* field) {
    const auto& list = record[field];
    return list.isArray() ? static_cast<double>(list.size()) : 0.0;
}

double time_ratio(double a, double b) noexcept {
    auto [lo, hi] = std::minmax(a, b);
    if (not(lo > 0) or std::isinf(lo)) {
        return INF;
    }
    return hi / lo;
}

} // namespace

double tier_score(const Json::Value& record, Tier tier) {
    double base = execution_result(record, Tier::BASE).average_test_score;
    if (tier == Tier::BASE) {
        return base;
    }
    double plus = execution_result(record, Tier::PLUS).average_test_score;
    double base_inputs = list_size(record, "base_input");
    double plus_inputs = list_size(record, "plus_input");
    if (base_inputs + plus_inputs == 0) {
        return 0;
    }
    return (plus * plus_inputs + base * base_inputs) / (plus_inputs + base_inputs);
}

double own_tier_score(const Json::Value& record, Tier tier) {
    return execution_result(record, tier).average_test_score;
}

double tier_time(const Json::Value& record, Tier tier) {
    if (not record.isMember(result_field(tier))) {
        return INF;
    }
    return execution_result(record, tier).effective_average_time_taken();
}

Ranking Ranker::rank(const std::vector<RankingEntry>& entries) const {
    std::optional<RankingEntry> reference;
    // Groups of equal scores in the order of first appearance
    std::vector<std::pair<double, std::vector<RankingEntry>>> groups;
    for (const auto& entry : entries) {
        if (entry.id == REFERENCE_ID) {
            reference = entry;
            continue;
        }
        auto it = std::find_if(groups.begin(), groups.end(), [&](const auto& group) {
            return group.first == entry.score;
        });
        if (it == groups.end()) {
            groups.push_back({entry.score, {entry}});
        } else {
            it->second.emplace_back(entry);
        }
    }

    // One pass over the pairs of a group, the scan continues after an
    // elimination. Returns true iff an entry was eliminated.
    auto elimination_pass = [&](std::vector<RankingEntry>& members) {
        bool eliminated = false;
        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size();) {
                const auto& a = members[i];
                const auto& b = members[j];
                if (std::abs(a.score - b.score) >= SCORE_TIE_TOLERANCE or
                    not(time_ratio(a.time, b.time) < time_ratio_threshold_))
                {
                    ++j;
                    continue;
                }
                size_t slower = a.time > b.time ? i : j;
                if (members[slower].id == REFERENCE_ID) {
                    ++j;
                    continue;
                }
                members.erase(members.begin() + static_cast<ptrdiff_t>(slower));
                eliminated = true;
                if (slower == i) {
                    // The next member takes the place of the eliminated one and
                    // is compared starting from the next pass
                    break;
                }
            }
        }
        return eliminated;
    };

    std::vector<RankingEntry> survivors;
    for (auto& [score, members] : groups) {
        if (reference and std::abs(reference->score - score) < REFERENCE_GROUP_TOLERANCE) {
            members.emplace_back(*reference);
        }
        while (elimination_pass(members)) {
        }
        for (const auto& member : members) {
            if (member.id != REFERENCE_ID) {
                survivors.emplace_back(member);
            }
        }
    }

    std::stable_sort(survivors.begin(), survivors.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });

    Ranking ranking;
    ranking[REFERENCE_ID] = 1;
    unsigned next_rank = 2;
    for (const auto& entry : survivors) {
        ranking[entry.id] = next_rank++;
    }
    return ranking;
}

} // namespace solrank
