#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <limits>
#include <optional>
#include <set>
#include <solrank/aggregation/selector.hh>
#include <solrank/errors.hh>
#include <solrank/jsonl.hh>
#include <solrank/task_record.hh>
#include <solranklib/file_contents.hh>
#include <solranklib/logger.hh>
#include <solranklib/macros/throw.hh>

namespace solrank {

namespace {

constexpr double MAX_SCORE = 1.0;

void sort_by_score_desc(std::vector<ScoredSolution>& solutions) {
    std::stable_sort(solutions.begin(), solutions.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });
}

ScoredSolution parse_scored_solution(const Json::Value& entry, size_t idx) {
    if (not entry.isObject()) {
        THROW("all_solutions[", idx, "] is not an object");
    }
    const auto& rank = entry["rank"];
    if (not rank.isUInt()) {
        THROW("all_solutions[", idx, "].rank is not a positive integer");
    }
    const auto& score = entry["average_test_score"];
    if (not score.isNumeric()) {
        THROW("all_solutions[", idx, "].average_test_score is not a number");
    }
    const auto& time = entry["average_time_taken"];
    if (not time.isNull() and not time.isNumeric()) {
        THROW("all_solutions[", idx, "].average_time_taken is not a number");
    }
    if (not entry["solution"].isObject()) {
        THROW("all_solutions[", idx, "].solution is not an object");
    }
    return {
        .rank = rank.asUInt(),
        .score = score.asDouble(),
        .time = time.isNull() ? std::numeric_limits<double>::infinity() : time.asDouble(),
        .entry = entry,
    };
}

} // namespace

std::vector<ScoredSolution> Selector::deduplicate(std::vector<ScoredSolution> pool) {
    std::vector<std::pair<double, std::vector<ScoredSolution>>> groups;
    for (auto& sol : pool) {
        auto it = std::find_if(groups.begin(), groups.end(), [&](const auto& group) {
            return group.first == sol.score;
        });
        if (it == groups.end()) {
            double score = sol.score;
            groups.emplace_back(score, std::vector<ScoredSolution>{});
            it = std::prev(groups.end());
        }
        it->second.emplace_back(std::move(sol));
    }

    std::vector<ScoredSolution> res;
    for (auto& [score, group] : groups) {
        bool has_rank1 = std::any_of(group.begin(), group.end(), [](const auto& sol) {
            return sol.rank == 1;
        });
        if (has_rank1) {
            for (auto& sol : group) {
                if (sol.rank == 1) {
                    res.emplace_back(std::move(sol));
                }
            }
        } else {
            auto fastest = std::min_element(group.begin(), group.end(), [](const auto& a, const auto& b) {
                return a.time < b.time;
            });
            res.emplace_back(std::move(*fastest));
        }
    }
    return res;
}

std::vector<ScoredSolution> Selector::pick_spaced(std::vector<ScoredSolution> sorted, size_t k) const {
    size_t n = sorted.size();
    if (k >= n) {
        return sorted;
    }
    if (k == 0) {
        return {};
    }

    std::set<size_t> selected;
    size_t anchor_idx = n - 1;
    for (size_t i = n; i-- > 0;) {
        if (sorted[i].score > 0 and sorted[i].score < soft_floor_upper_bound_) {
            anchor_idx = i;
            break;
        }
    }
    double min_score = sorted[anchor_idx].score;
    selected.emplace(anchor_idx);

    for (size_t i = 1; i < k; ++i) {
        double t = static_cast<double>(i) / static_cast<double>(k);
        double target = MAX_SCORE - t * (MAX_SCORE - min_score);
        std::optional<size_t> best;
        double best_diff = std::numeric_limits<double>::infinity();
        for (size_t j = 0; j < n; ++j) {
            if (selected.count(j)) {
                continue;
            }
            double diff = std::abs(sorted[j].score - target);
            if (diff < best_diff) {
                best_diff = diff;
                best = j;
            }
        }
        if (best) {
            selected.emplace(*best);
        }
    }

    std::vector<ScoredSolution> res;
    res.reserve(selected.size());
    for (size_t idx : selected) {
        res.emplace_back(std::move(sorted[idx]));
    }
    return res;
}

std::vector<ScoredSolution> Selector::select(std::vector<ScoredSolution> pool) const {
    std::vector<ScoredSolution> rank1;
    std::vector<ScoredSolution> others;
    for (auto& sol : deduplicate(std::move(pool))) {
        (sol.rank == 1 ? rank1 : others).emplace_back(std::move(sol));
    }
    if (rank1.size() > 1) {
        throw InvariantViolation(
            "more than one rank 1 solution found (", rank1.size(), ") after deduplication"
        );
    }
    if (rank1.empty()) {
        throw InvariantViolation("no rank 1 (reference) solution found");
    }

    std::vector<ScoredSolution> res = std::move(rank1);
    if (res.size() < target_pool_size_) {
        sort_by_score_desc(others);
        size_t k = std::min(target_pool_size_ - res.size(), others.size());
        auto picked = pick_spaced(std::move(others), k);
        sort_by_score_desc(picked);
        for (auto& sol : picked) {
            res.emplace_back(std::move(sol));
        }
    }

    unsigned rank = 1;
    for (auto& sol : res) {
        sol.rank = rank++;
        sol.entry["rank"] = sol.rank;
    }
    return res;
}

Json::Value filter_record(DatasetType dataset, const Selector& selector, Json::Value record) {
    if (not record.isObject()) {
        THROW("record is not an object");
    }
    const auto& solutions = record["all_solutions"];
    if (not solutions.isArray() or solutions.empty()) {
        THROW("field `all_solutions` is missing or empty");
    }

    std::vector<ScoredSolution> pool;
    pool.reserve(solutions.size());
    for (Json::ArrayIndex i = 0; i < solutions.size(); ++i) {
        pool.emplace_back(parse_scored_solution(solutions[i], i));
    }

    const auto& first = pool.front().entry["solution"];
    bool has_inputs = first.isMember("base_input");
    auto input_fields = has_inputs ? std::array<const char*, 2>{"base_input", "plus_input"}
                                   : std::array<const char*, 2>{"test_list", "challenge_test_list"};
    for (const char* field : input_fields) {
        if (first.isMember(field) and (has_inputs or not record.isMember(field))) {
            record[field] = first[field];
        }
    }

    auto selected = selector.select(std::move(pool));

    auto& out = record["all_solutions"] = Json::Value{Json::arrayValue};
    for (auto& sol : selected) {
        auto& solution = sol.entry["solution"];
        for (const char* field : input_fields) {
            solution.removeMember(field);
        }
        if (sol.rank == 1 and dataset != DatasetType::MBPP) {
            solution["canonical_solution"] = concat_tostr(
                required_string(solution, "prompt"), required_string(solution, "canonical_solution")
            );
        }
        out.append(std::move(sol.entry));
    }
    return record;
}

void filter_file(const Config& config, const std::string& input_file, const std::string& output_file) {
    Selector selector{config.target_pool_size, config.soft_floor_upper_bound};
    std::string contents;
    size_t records = 0;
    for (auto& line : read_jsonl_file(input_file)) {
        Json::Value filtered;
        try {
            filtered = filter_record(config.dataset, selector, std::move(line.value));
        } catch (const InvariantViolation&) {
            throw;
        } catch (const std::runtime_error& e) {
            THROW(input_file, ':', line.line_no, ": ", e.what());
        }
        back_insert(contents, to_json_line(filtered, {line.text}), '\n');
        ++records;
    }
    put_file_contents(output_file, contents);
    stdlog("Filtered ", records, " records into ", output_file);
}

} // namespace solrank
