#include <algorithm>
#include <optional>
#include <solrank/aggregation/aggregator.hh>
#include <solrank/errors.hh>
#include <solrank/execution_result.hh>
#include <solranklib/file_contents.hh>
#include <solranklib/file_manip.hh>
#include <solranklib/logger.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/string_transform.hh>
#include <utility>

namespace solrank {

namespace {

constexpr const char* RESULT_FIELDS[] = {"base_execution_result", "plus_execution_result"};

constexpr const char* PER_TEST_FIELDS[] = {
    "time_taken",
    "unit_test_stderrs",
    "unit_test_stdouts",
    "correct_tests",
    "traceback",
};

// Python's round(val, 2)
double round2(double val) { return str2num<double>(to_string(val, 2)).value_or(val); }

std::string path_join(const std::string& dir, const std::string& name) {
    if (dir.empty() or dir.back() == '/') {
        return concat_tostr(dir, name);
    }
    return concat_tostr(dir, '/', name);
}

Json::Value without_fields(Json::Value record, std::initializer_list<const char*> fields) {
    for (const char* field : fields) {
        record.removeMember(field);
    }
    return record;
}

Json::Value optional_json(const std::optional<unsigned>& val) {
    return val ? Json::Value{*val} : Json::Value{Json::nullValue};
}

std::optional<unsigned> rank_of(const Ranking& ranking, unsigned id) {
    auto it = ranking.find(id);
    if (it == ranking.end()) {
        return std::nullopt;
    }
    return it->second;
}

Ranking rank_tier(const Ranker& ranker, const std::vector<CandidateSolution>& pool, Tier tier) {
    std::vector<RankingEntry> entries;
    entries.reserve(pool.size());
    for (const auto& c : pool) {
        entries.push_back({
            .id = c.id,
            .score = c.id == REFERENCE_ID ? own_tier_score(c.record, tier) : tier_score(c.record, tier),
            .time = tier_time(c.record, tier),
        });
    }
    return ranker.rank(entries);
}

} // namespace

bool is_degenerate(const Json::Value& record) {
    if (not record.isMember("base_execution_result")) {
        THROW("field `base_execution_result` is missing");
    }
    std::vector<std::string> stderrs =
        ExecutionResult::from_json(record["base_execution_result"]).unit_test_stderrs;
    if (record.isMember("plus_execution_result")) {
        auto plus = ExecutionResult::from_json(record["plus_execution_result"]).unit_test_stderrs;
        stderrs.insert(stderrs.end(), plus.begin(), plus.end());
    }
    if (stderrs.empty()) {
        return false;
    }
    return std::all_of(stderrs.begin(), stderrs.end(), [](const std::string& line) {
        auto text = trim(line);
        return not text.empty() and text != "AssertionError()";
    });
}

void clean_execution_results(Json::Value& record) {
    for (const char* field : RESULT_FIELDS) {
        if (not record.isMember(field)) {
            continue;
        }
        auto& result = record[field];
        if (not result.isObject()) {
            THROW("field `", field, "` is not an object");
        }
        if (not result.isMember("average_time_taken")) {
            result["average_time_taken"] =
                ExecutionResult::from_json(result).effective_average_time_taken();
        }
        for (const char* per_test : PER_TEST_FIELDS) {
            result.removeMember(per_test);
        }
    }
}

std::vector<CandidateSolution> Aggregator::candidate_pool(
    const Json::Value& task, size_t task_idx, const std::vector<RunFile>& runs
) const {
    const std::string field{prompt_field(dataset_)};
    const auto& reference_prompt = task[field];
    if (reference_prompt.isNull()) {
        log_warning("Reference solution at line ", task_idx, " does not contain a `", field, "` key");
    }

    std::vector<CandidateSolution> pool;
    pool.push_back({.id = REFERENCE_ID, .record = task});
    unsigned id = REFERENCE_ID + 1;
    for (const auto& run : runs) {
        if (task_idx < run.lines.size()) {
            Json::Value candidate = run.lines[task_idx].value;
            if (not candidate.isObject()) {
                THROW(run.path, ": line ", run.lines[task_idx].line_no, " is not an object");
            }
            const auto& candidate_prompt = std::as_const(candidate)[field];
            if (candidate_prompt != reference_prompt) {
                if (candidate_prompt.isString() and reference_prompt.isString() and
                    has_prefix(candidate_prompt.asString(), reference_prompt.asString()))
                {
                    candidate[field] = reference_prompt;
                } else {
                    log_warning(
                        "Prompt mismatch in file ",
                        run.path,
                        " at line ",
                        task_idx,
                        " for solution id ",
                        id
                    );
                }
            }
            pool.push_back({.id = id, .record = std::move(candidate)});
        }
        ++id;
    }
    return pool;
}

std::vector<CandidateSolution> Aggregator::filter_degenerate(std::vector<CandidateSolution> pool) {
    std::vector<CandidateSolution> res;
    res.reserve(pool.size());
    for (auto& c : pool) {
        if (not is_degenerate(c.record)) {
            res.emplace_back(std::move(c));
            continue;
        }
        if (c.id == REFERENCE_ID) {
            throw InvariantViolation(
                "reference solution (id 0) of task ",
                std::as_const(c.record)["task_id"].asString(),
                " has all stderr lines non-empty"
            );
        }
        ++tossed_;
    }
    return res;
}

AggregatedTask Aggregator::aggregate(const Json::Value& task, std::vector<CandidateSolution> pool)
    const {
    for (auto& c : pool) {
        clean_execution_results(c.record);
    }

    AggregatedTask res;

    // Unranked
    res.unranked = without_fields(task, {"base_input", "plus_input"});
    clean_execution_results(res.unranked);
    auto& unranked_solutions = res.unranked["all_solutions"] = Json::Value{Json::arrayValue};
    for (const auto& c : pool) {
        Json::Value sol{Json::objectValue};
        sol["id"] = c.id;
        sol["solution"] = c.record;
        unranked_solutions.append(std::move(sol));
    }

    // Ranked
    bool plus_tier = has_plus_tier(dataset_);
    auto base_ranking = rank_tier(ranker_, pool, Tier::BASE);
    auto plus_ranking = plus_tier ? rank_tier(ranker_, pool, Tier::PLUS) : Ranking{};

    res.ranked = without_fields(
        task, {"base_input", "plus_input", "base_execution_result", "plus_execution_result"}
    );
    res.base_ranked = res.ranked;
    res.plus_ranked = res.ranked;

    struct TierEntry {
        unsigned rank;
        double score;
        double time;
        const Json::Value* solution;
    };
    std::vector<TierEntry> base_entries;
    std::vector<TierEntry> plus_entries;

    auto& ranked_solutions = res.ranked["all_solutions"] = Json::Value{Json::arrayValue};
    for (const auto& c : pool) {
        auto base_rank = rank_of(base_ranking, c.id);
        auto plus_rank = rank_of(plus_ranking, c.id);
        double base_score = tier_score(c.record, Tier::BASE);
        double base_time = tier_time(c.record, Tier::BASE);

        Json::Value sol{Json::objectValue};
        sol["rank"]["base_execution"] = optional_json(base_rank);
        sol["rank"]["plus_execution"] = optional_json(plus_rank);
        sol["average_test_score"]["base_execution"] = base_score;
        sol["average_time_taken"]["base_execution"] = base_time;
        if (plus_tier) {
            sol["average_test_score"]["plus_execution"] = tier_score(c.record, Tier::PLUS);
            sol["average_time_taken"]["plus_execution"] = tier_time(c.record, Tier::PLUS);
        } else {
            sol["average_test_score"]["plus_execution"] = Json::Value{Json::nullValue};
            sol["average_time_taken"]["plus_execution"] = Json::Value{Json::nullValue};
        }
        sol["solution"] =
            without_fields(c.record, {"base_execution_result", "plus_execution_result"});
        const auto& appended = ranked_solutions.append(std::move(sol));

        if (base_rank) {
            base_entries.push_back({*base_rank, base_score, base_time, &appended["solution"]});
        }
        if (plus_rank) {
            plus_entries.push_back({
                *plus_rank,
                appended["average_test_score"]["plus_execution"].asDouble(),
                appended["average_time_taken"]["plus_execution"].asDouble(),
                &appended["solution"],
            });
        }
    }

    auto fill_tier = [](Json::Value& out, std::vector<TierEntry>& entries) {
        std::stable_sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
            return a.rank < b.rank;
        });
        auto& solutions = out["all_solutions"] = Json::Value{Json::arrayValue};
        for (const auto& entry : entries) {
            Json::Value sol{Json::objectValue};
            sol["rank"] = entry.rank;
            sol["average_test_score"] = round2(entry.score);
            sol["average_time_taken"] = entry.time;
            sol["solution"] = *entry.solution;
            solutions.append(std::move(sol));
        }
    };
    fill_tier(res.base_ranked, base_entries);
    fill_tier(res.plus_ranked, plus_entries);
    return res;
}

size_t combine_files(
    const Config& config,
    const std::string& task_file,
    const std::string& runs_dir,
    const std::string& output_dir
) {
    auto tasks = read_jsonl_file(task_file);
    std::vector<RunFile> runs;
    for (auto& name : list_matching_files(runs_dir, config.run_file_pattern.c_str())) {
        auto path = path_join(runs_dir, name);
        auto lines = read_jsonl_file(path);
        runs.push_back({.path = std::move(path), .lines = std::move(lines)});
    }
    stdlog("Combining ", tasks.size(), " tasks with ", runs.size(), " run files");

    Aggregator aggregator{config.dataset, config.time_ratio_threshold};
    std::string unranked;
    std::string ranked;
    std::string base_ranked;
    std::string plus_ranked;
    for (size_t i = 0; i < tasks.size(); ++i) {
        if (i % 25 == 0) {
            stdlog("Processing line ", i, "...");
        }
        const auto& task = tasks[i];
        if (not task.value.isObject()) {
            THROW(task_file, ": line ", task.line_no, " is not an object");
        }

        auto pool = aggregator.filter_degenerate(aggregator.candidate_pool(task.value, i, runs));
        auto out = aggregator.aggregate(task.value, std::move(pool));

        std::vector<std::string_view> sources = {task.text};
        for (const auto& run : runs) {
            if (i < run.lines.size()) {
                sources.emplace_back(run.lines[i].text);
            }
        }
        back_insert(unranked, to_json_line(out.unranked, sources), '\n');
        back_insert(ranked, to_json_line(out.ranked, sources), '\n');
        back_insert(base_ranked, to_json_line(out.base_ranked, sources), '\n');
        back_insert(plus_ranked, to_json_line(out.plus_ranked, sources), '\n');
    }

    auto output_path = [&](const char* suffix) {
        return path_join(output_dir, concat_tostr(to_str(config.dataset), suffix));
    };
    put_file_contents(output_path("_unranked.jsonl"), unranked);
    put_file_contents(output_path("_ranked.jsonl"), ranked);
    put_file_contents(output_path("_base_ranked.jsonl"), base_ranked);
    put_file_contents(output_path("_plus_ranked.jsonl"), plus_ranked);

    stdlog("Done! Tossed ", aggregator.tossed(), " solutions due to all non-empty stderrs.");
    return aggregator.tossed();
}

} // namespace solrank
