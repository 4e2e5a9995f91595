#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <solrank/aggregation/ranker.hh>
#include <solrank/jsonl.hh>

using solrank::Ranker;
using solrank::Ranking;
using solrank::RankingEntry;
using solrank::Tier;

namespace {

constexpr auto INF = std::numeric_limits<double>::infinity();

} // namespace

// NOLINTNEXTLINE
TEST(Ranker, scores_then_ids) {
    // Times 0.5 and 0.52 differ by the ratio 1.04, not below 1.0
    Ranker ranker{1.0};
    auto ranking = ranker.rank({
        {.id = 0, .score = 1.0, .time = 0.1},
        {.id = 1, .score = 0.8, .time = 0.5},
        {.id = 2, .score = 0.8, .time = 0.52},
        {.id = 3, .score = 0.4, .time = 0.9},
        {.id = 4, .score = 0.0, .time = 0.05},
    });
    EXPECT_EQ(ranking, (Ranking{{0, 1}, {1, 2}, {2, 3}, {3, 4}, {4, 5}}));
}

// NOLINTNEXTLINE
TEST(Ranker, slower_of_a_tied_pair_is_eliminated) {
    Ranker ranker{1.1};
    auto ranking = ranker.rank({
        {.id = 0, .score = 1.0, .time = 0.1},
        {.id = 1, .score = 0.8, .time = 0.52},
        {.id = 2, .score = 0.8, .time = 0.5},
        {.id = 3, .score = 0.4, .time = 0.9},
    });
    EXPECT_EQ(ranking, (Ranking{{0, 1}, {2, 2}, {3, 3}}));
}

// NOLINTNEXTLINE
TEST(Ranker, equal_times_eliminate_the_later_one) {
    Ranker ranker{1.5};
    auto ranking = ranker.rank({
        {.id = 3, .score = 0.5, .time = 0.2},
        {.id = 1, .score = 0.5, .time = 0.2},
        {.id = 0, .score = 1.0, .time = 0.2},
    });
    EXPECT_EQ(ranking, (Ranking{{0, 1}, {3, 2}}));
}

// NOLINTNEXTLINE
TEST(Ranker, elimination_is_repeated_until_stable) {
    // After 1.05 is gone, 1.0 and 1.1 are too far apart
    Ranker ranker{1.06};
    auto ranking = ranker.rank({
        {.id = 0, .score = 1.0, .time = 1.0},
        {.id = 1, .score = 0.5, .time = 1.05},
        {.id = 2, .score = 0.5, .time = 1.0},
        {.id = 3, .score = 0.5, .time = 1.1},
    });
    EXPECT_EQ(ranking, (Ranking{{0, 1}, {2, 2}, {3, 3}}));
}

// NOLINTNEXTLINE
TEST(Ranker, pass_continues_after_an_elimination) {
    // The first pass goes on after 1.05 loses to 1.0: 1.2 loses to 1.1. The
    // second pass drops 1.1 against 1.0.
    Ranker ranker{1.15};
    auto ranking = ranker.rank({
        {.id = 0, .score = 1.0, .time = 0.1},
        {.id = 1, .score = 0.5, .time = 1.05},
        {.id = 2, .score = 0.5, .time = 1.0},
        {.id = 3, .score = 0.5, .time = 1.2},
        {.id = 4, .score = 0.5, .time = 1.1},
    });
    EXPECT_EQ(ranking, (Ranking{{0, 1}, {2, 2}}));
}

// NOLINTNEXTLINE
TEST(Ranker, reference_is_never_eliminated) {
    Ranker ranker{2.0};
    // The reference is slower than its tied candidate
    auto ranking = ranker.rank({
        {.id = 0, .score = 0.5, .time = 0.3},
        {.id = 1, .score = 0.5, .time = 0.2},
    });
    EXPECT_EQ(ranking, (Ranking{{0, 1}, {1, 2}}));

    // The reference is faster, so its tied candidate goes away
    ranking = ranker.rank({
        {.id = 0, .score = 0.5, .time = 0.1},
        {.id = 1, .score = 0.5, .time = 0.15},
        {.id = 2, .score = 0.25, .time = 0.15},
    });
    EXPECT_EQ(ranking, (Ranking{{0, 1}, {2, 2}}));
}

// NOLINTNEXTLINE
TEST(Ranker, reference_gets_rank_one_regardless_of_score) {
    Ranker ranker{1.0};
    auto ranking = ranker.rank({
        {.id = 1, .score = 1.0, .time = 0.1},
        {.id = 0, .score = 0.0, .time = 0.1},
        {.id = 2, .score = 0.7, .time = 0.1},
    });
    EXPECT_EQ(ranking, (Ranking{{0, 1}, {1, 2}, {2, 3}}));

    EXPECT_EQ(ranker.rank({}), (Ranking{{0, 1}}));
}

// NOLINTNEXTLINE
TEST(Ranker, unknown_times_are_not_compared) {
    Ranker ranker{10.0};
    auto ranking = ranker.rank({
        {.id = 0, .score = 1.0, .time = 0.1},
        {.id = 1, .score = 0.5, .time = INF},
        {.id = 2, .score = 0.5, .time = 0.2},
        {.id = 3, .score = 0.5, .time = 0.0},
    });
    EXPECT_EQ(ranking, (Ranking{{0, 1}, {1, 2}, {2, 3}, {3, 4}}));
}

// NOLINTNEXTLINE
TEST(Ranker, ranks_are_dense) {
    Ranker ranker{1.3};
    std::vector<RankingEntry> entries;
    for (unsigned id = 0; id < 40; ++id) {
        entries.push_back({.id = id, .score = static_cast<double>(id % 7) / 7, .time = 1.0 + id * 0.01});
    }
    auto ranking = ranker.rank(entries);
    EXPECT_EQ(ranking.at(0), 1U);
    std::vector<bool> seen(ranking.size() + 1, false);
    for (const auto& [id, rank] : ranking) {
        ASSERT_GE(rank, 1U);
        ASSERT_LE(rank, ranking.size());
        EXPECT_FALSE(seen[rank]) << rank;
        seen[rank] = true;
    }
}

// NOLINTNEXTLINE
TEST(tier_score, blends_tiers_by_input_counts) {
    auto record = solrank::parse_json(
        R"({"base_input": [[1], [2]], "plus_input": [[3], [4], [5], [6], [7], [8]],)"
        R"( "base_execution_result": {"average_test_score": 0.5, "time_taken": [0.1, 0.3]},)"
        R"( "plus_execution_result": {"average_test_score": 1.0, "average_time_taken": 0.4}})"
    );
    EXPECT_EQ(solrank::tier_score(record, Tier::BASE), 0.5);
    EXPECT_EQ(solrank::tier_score(record, Tier::PLUS), 0.875);
    EXPECT_DOUBLE_EQ(solrank::tier_time(record, Tier::BASE), 0.2);
    EXPECT_EQ(solrank::tier_time(record, Tier::PLUS), 0.4);

    auto no_inputs = solrank::parse_json(
        R"({"base_execution_result": {"average_test_score": 1.0},)"
        R"( "plus_execution_result": {"average_test_score": 1.0}})"
    );
    EXPECT_EQ(solrank::tier_score(no_inputs, Tier::PLUS), 0);
    EXPECT_TRUE(std::isinf(solrank::tier_time(no_inputs, Tier::BASE)));

    auto missing = solrank::parse_json(R"({"base_execution_result": {"average_test_score": 1.0}})");
    EXPECT_THROW(solrank::tier_score(missing, Tier::PLUS), std::runtime_error);
    EXPECT_TRUE(std::isinf(solrank::tier_time(missing, Tier::PLUS)));
}
