#include "execution_fakes.hh"
#include "intercept_logger.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <solrank/execution/orchestrator.hh>
#include <solranklib/file_contents.hh>
#include <solranklib/spawner.hh>
#include <solranklib/temporary_directory.hh>
#include <string>
#include <vector>

using solrank::Config;
using solrank::DatasetType;
using solrank::JsonLine;
using std::string;
using std::vector;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

JsonLine line(const string& text, size_t line_no) {
    return {solrank::parse_json(text), text, line_no};
}

// Tests that raise fail, the others print "ok"
solrank::ProcessStatus simulate(const string& program, const string& dir, FakeFilesystem& fs) {
    fs.write_file(dir + "elapsed.txt", "0.1");
    if (program.find("raise") != string::npos) {
        fs.write_file(dir + "stderr.txt", "ValueError()");
        return exited(0);
    }
    fs.write_file(dir + "stdout.txt", "ok\n");
    return exited(0);
}

const string GOOD_RECORD = R"({"task_id": "HumanEval/0", "prompt": "def f(x):\n",)"
                           R"( "canonical_solution": "    return x\n", "entry_point": "f",)"
                           R"( "base_input": [[1], [2]], "plus_input": [[123456789012345678901234567890]]})";
const string MALFORMED_RECORD = R"({"task_id": "HumanEval/1"})";
const string FAILING_RECORD = R"({"task_id": "HumanEval/2", "prompt": "def f(x):\n",)"
                              R"( "canonical_solution": "    raise ValueError()\n", "entry_point": "f",)"
                              R"( "base_input": [[1]], "plus_input": []})";

} // namespace

// NOLINTNEXTLINE
TEST(tier_time_limits, fixed_timeout) {
    Config config;
    config.timeout = 3;
    EXPECT_THAT(solrank::tier_time_limits(config, Json::Value{}, "base_execution_result", 2), ElementsAre(3, 3));
    config.timeout = std::nullopt;
    config.dataset = DatasetType::MBPP;
    EXPECT_THAT(solrank::tier_time_limits(config, Json::Value{}, "base_execution_result", 1), ElementsAre(10));
}

// NOLINTNEXTLINE
TEST(tier_time_limits, from_record) {
    Config config;
    config.timeouts_from_record = true;
    auto record = solrank::parse_json(
        R"({"base_execution_result": {"time_taken": [0.01, 1.0]}, "plus_execution_result": {}})"
    );
    EXPECT_THAT(solrank::tier_time_limits(config, record, "base_execution_result", 2), ElementsAre(0.1, 4.0));
    EXPECT_TRUE(solrank::tier_time_limits(config, record, "plus_execution_result", 0).empty());

    EXPECT_THROW(solrank::tier_time_limits(config, record, "base_execution_result", 3), std::runtime_error);
    EXPECT_THROW(solrank::tier_time_limits(config, record, "plus_execution_result", 1), std::runtime_error);
    EXPECT_THROW(solrank::tier_time_limits(config, Json::Value{Json::objectValue}, "base_execution_result", 1), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(execute_task, attaches_results) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, simulate};
    solrank::Worker worker{fs, runner, {}};
    Config config;
    config.timeout = 2;

    solrank::TaskRecord task{DatasetType::HE_PLUS, line(GOOD_RECORD, 1)};
    auto logged = intercept_logger(stdlog, [&] { solrank::execute_task(config, worker, task); });
    EXPECT_EQ(logged, "");

    const auto& base = task.json()["base_execution_result"];
    EXPECT_EQ(base["correct_tests"].size(), 2U);
    EXPECT_TRUE(base["correct_tests"][0].asBool());
    EXPECT_EQ(base["average_test_score"].asDouble(), 1.0);
    EXPECT_EQ(base["unit_test_stdouts"][1].asString(), "ok\n");
    EXPECT_EQ(task.json()["plus_execution_result"]["time_taken"][0].asDouble(), 0.1);

    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 3U);
    EXPECT_EQ(calls[0].program, "def f(x):\n    return x\n\nprint(f(1))");
    EXPECT_EQ(calls[2].program, "def f(x):\n    return x\n\nprint(f(123456789012345678901234567890))");
    EXPECT_EQ(calls[2].argv.back(), "2.000000");
}

// NOLINTNEXTLINE
TEST(execute_task, without_prompt) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, simulate};
    solrank::Worker worker{fs, runner, {}};
    Config config;
    config.add_prompt = false;

    solrank::TaskRecord task{DatasetType::HE_PLUS, line(GOOD_RECORD, 1)};
    solrank::execute_task(config, worker, task);
    EXPECT_EQ(runner.calls().at(0).program, "    return x\n\nprint(f(1))");
}

// NOLINTNEXTLINE
TEST(execute_task, failing_solution_is_reported) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, simulate};
    solrank::Worker worker{fs, runner, {}};
    Config config;

    solrank::TaskRecord task{DatasetType::HE_PLUS, line(FAILING_RECORD, 1)};
    auto logged = intercept_logger(stdlog, [&] { solrank::execute_task(config, worker, task); });
    EXPECT_EQ(logged, "Error in task_id: HumanEval/2\n");
    EXPECT_EQ(task.json()["base_execution_result"]["unit_test_stderrs"][0].asString(), "ValueError()");
    EXPECT_EQ(task.json()["base_execution_result"]["average_test_score"].asDouble(), 0);
    EXPECT_EQ(task.json()["plus_execution_result"]["correct_tests"].size(), 0U);
}

// NOLINTNEXTLINE
TEST(execute_task, mbpp) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, simulate};
    solrank::Worker worker{fs, runner, {}};
    Config config;
    config.dataset = DatasetType::MBPP;

    solrank::TaskRecord task{
        DatasetType::MBPP,
        line(
            R"({"task_id": 2, "text": "Write a function.", "code": "def f():\n    return 1",)"
            R"( "test_setup_code": "", "test_list": ["assert f() == 1", "assert f() != 2"]})",
            1
        )
    };
    solrank::execute_task(config, worker, task);
    EXPECT_EQ(task.json()["text"].asString(), "Write a function.\nassert f() == 1\n");
    EXPECT_EQ(task.json()["base_execution_result"]["correct_tests"].size(), 2U);
    EXPECT_EQ(task.json()["plus_execution_result"]["correct_tests"].size(), 0U);

    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 2U);
    EXPECT_EQ(calls[1].program, "def f():\n    return 1\n\n\nassert f() != 2");
}

// NOLINTNEXTLINE
TEST(Orchestrator, keeps_order_and_skips_failed_records) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, simulate};
    solrank::Worker worker{fs, runner, {}};
    Config config;
    config.workers = 3;

    vector<JsonLine> lines;
    for (size_t i = 0; i < 10; ++i) {
        lines.emplace_back(line(i == 4 ? MALFORMED_RECORD : (i % 2 ? FAILING_RECORD : GOOD_RECORD), i + 1));
    }

    solrank::Orchestrator orchestrator{config, worker, std::move(lines)};
    vector<string> results;
    string stdlog_output;
    auto errlog_output = intercept_logger(errlog, [&] {
        stdlog_output = intercept_logger(stdlog, [&] { results = orchestrator.execute(); });
    });

    ASSERT_EQ(results.size(), 9U);
    for (size_t i = 0; i < results.size(); ++i) {
        size_t idx = i < 4 ? i : i + 1;
        auto value = solrank::parse_json(results[i]);
        EXPECT_EQ(value["task_id"].asString(), idx % 2 ? "HumanEval/2" : "HumanEval/0") << i;
        EXPECT_TRUE(value.isMember("base_execution_result"));
        EXPECT_TRUE(value.isMember("plus_execution_result"));
    }
    // Big integers survive the serialization
    EXPECT_THAT(results[0], HasSubstr("[[123456789012345678901234567890]]"));

    auto summary = orchestrator.summary();
    EXPECT_EQ(summary.executed, 9U);
    EXPECT_EQ(summary.failed, 1U);

    EXPECT_THAT(errlog_output, HasSubstr("Error processing line 4: "));
    EXPECT_THAT(stdlog_output, HasSubstr("Executed record 10 in "));
    EXPECT_THAT(stdlog_output, HasSubstr("Error in task_id: HumanEval/2\n"));
    EXPECT_EQ(fs.directories_alive(), 0U);
}

// NOLINTNEXTLINE
TEST(execute_file, runs_python) {
    if (not Spawner::run("sh", {"sh", "-c", "command -v python3 > /dev/null"}).exited_normally()) {
        GTEST_SKIP() << "python3 is not available";
    }

    TemporaryDirectory tmp_dir("/tmp/solrank-execute-test.XXXXXX");
    auto input = tmp_dir.path() + "tasks.jsonl";
    auto output = tmp_dir.path() + "out.jsonl";
    put_file_contents(input, GOOD_RECORD + "\n" + MALFORMED_RECORD + "\n" + FAILING_RECORD + "\n");

    Config config;
    config.workers = 2;
    config.timeout = 10;
    config.sandbox_root = tmp_dir.path();
    solrank::ExecutionSummary summary;
    auto logged = intercept_logger(stdlog, [&] {
        (void)intercept_logger(errlog, [&] { summary = solrank::execute_file(config, input, output); });
    });
    EXPECT_EQ(summary.executed, 2U);
    EXPECT_EQ(summary.failed, 1U);
    EXPECT_THAT(logged, HasSubstr("Completed executing 3 records (1 failed)"));

    auto lines = solrank::read_jsonl_file(output);
    ASSERT_EQ(lines.size(), 2U);
    const auto& good = lines[0].value;
    EXPECT_EQ(good["base_execution_result"]["unit_test_stdouts"][1].asString(), "2\n");
    EXPECT_EQ(good["plus_execution_result"]["average_test_score"].asDouble(), 1.0);
    EXPECT_EQ(
        good["plus_execution_result"]["unit_test_stdouts"][0].asString(),
        "123456789012345678901234567890\n"
    );
    const auto& failing = lines[1].value;
    EXPECT_EQ(failing["base_execution_result"]["unit_test_stderrs"][0].asString(), "ValueError()");
    EXPECT_EQ(failing["base_execution_result"]["correct_tests"][0].asBool(), false);
}
