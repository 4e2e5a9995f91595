#include <algorithm>
#include <chrono>
#include <exception>
#include <solrank/execution/invocation_builder.hh>
#include <solrank/execution/orchestrator.hh>
#include <solranklib/file_contents.hh>
#include <solranklib/logger.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/string_transform.hh>
#include <solranklib/time.hh>

namespace solrank {

namespace {

constexpr uint64_t MIB = 1 << 20;

std::vector<std::string> render_tests(const std::vector<Invocation>& invocations) {
    std::vector<std::string> tests;
    tests.reserve(invocations.size());
    for (const auto& inv : invocations) {
        tests.emplace_back(render(inv));
    }
    return tests;
}

bool has_nonempty_stderr(const ExecutionResult& res) {
    return std::any_of(res.unit_test_stderrs.begin(), res.unit_test_stderrs.end(), [](auto& s) {
        return not s.empty();
    });
}

} // namespace

std::vector<double> tier_time_limits(
    const Config& config, const Json::Value& record, const char* result_field, size_t tests_no
) {
    if (not config.timeouts_from_record) {
        return std::vector<double>(tests_no, config.effective_timeout());
    }

    if (not record.isMember(result_field)) {
        THROW("field `", result_field, "` with previous timings is missing");
    }
    auto previous = ExecutionResult::from_json(record[result_field]);
    if (previous.time_taken.size() != tests_no) {
        THROW(
            "`",
            result_field,
            "` has ",
            previous.time_taken.size(),
            " timings, but there are ",
            tests_no,
            " tests"
        );
    }
    std::vector<double> limits;
    limits.reserve(tests_no);
    for (double t : previous.time_taken) {
        limits.emplace_back(std::max(config.timeout_min, t * config.timeout_multiple));
    }
    return limits;
}

void execute_task(const Config& config, Worker& worker, TaskRecord& task) {
    auto program = task.program_text(config.add_prompt);
    auto base_tests = render_tests(build_invocations(task, false));
    auto plus_tests = render_tests(build_invocations(task, true));
    auto base_limits =
        tier_time_limits(config, task.json(), "base_execution_result", base_tests.size());
    auto plus_limits =
        tier_time_limits(config, task.json(), "plus_execution_result", plus_tests.size());

    auto base = worker.run_tier(program, base_tests, base_limits);
    auto plus = worker.run_tier(program, plus_tests, plus_limits);
    if (has_nonempty_stderr(base) or has_nonempty_stderr(plus)) {
        stdlog("Error in task_id: ", task.task_id());
    }
    task.json()["base_execution_result"] = base.to_json();
    task.json()["plus_execution_result"] = plus.to_json();

    if (task.dataset() == DatasetType::MBPP) {
        auto tests = task.assertion_statements();
        if (tests.empty()) {
            THROW("field `test_list` is empty");
        }
        task.json()["text"] = concat_tostr(required_string(task.json(), "text"), '\n', tests[0], '\n');
    }
}

Orchestrator::Orchestrator(const Config& config, Worker& worker, std::vector<JsonLine> lines)
: JobProcessor(config.workers)
, config_(config)
, worker_(worker)
, lines_(std::move(lines)) {}

void Orchestrator::produce_jobs() {
    for (size_t i = 0; i < lines_.size(); ++i) {
        add_job(i);
    }
}

void Orchestrator::process_job(size_t idx) noexcept {
    auto start = std::chrono::steady_clock::now();
    auto& line = lines_[idx];
    try {
        TaskRecord task{config_.dataset, std::move(line)};
        execute_task(config_, worker_, task);
        auto serialized = to_json_line(task.json(), {task.source_text()});
        results_.perform([&](auto& results) { results.emplace(idx, std::move(serialized)); });
    } catch (const std::exception& e) {
        ++failed_;
        errlog("Error processing line ", idx, ": ", e.what());
    }
    auto elapsed = to_seconds(std::chrono::steady_clock::now() - start);
    size_t done = ++completed_;
    stdlog("Executed record ", done, " in ", to_string(elapsed, 2), " seconds");
}

std::vector<std::string> Orchestrator::execute() {
    run();
    return results_.perform([](auto& results) {
        std::vector<std::string> res;
        res.reserve(results.size());
        for (auto& [idx, serialized] : results) {
            res.emplace_back(std::move(serialized));
        }
        return res;
    });
}

ExecutionSummary
execute_file(const Config& config, const std::string& input_file, const std::string& output_file) {
    auto lines = read_jsonl_file(input_file);
    stdlog("Processing ", lines.size(), " records from ", input_file);

    LocalFilesystem fs{config.sandbox_root};
    SpawnerProcessRunner runner;
    Worker worker{
        fs,
        runner,
        {
            .python_executable = config.python_executable,
            .memory_limit = config.memory_limit_mib == 0
                ? std::nullopt
                : std::optional{config.memory_limit_mib * MIB},
            .output_limit = config.output_limit_mib == 0
                ? std::nullopt
                : std::optional{config.output_limit_mib * MIB},
        }
    };

    Orchestrator orchestrator{config, worker, std::move(lines)};
    auto results = orchestrator.execute();

    std::string contents;
    for (const auto& res : results) {
        back_insert(contents, res, '\n');
    }
    put_file_contents(output_file, contents);

    auto summary = orchestrator.summary();
    stdlog("Completed executing ", summary.executed + summary.failed, " records (", summary.failed, " failed)");
    return summary;
}

} // namespace solrank
