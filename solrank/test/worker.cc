#include "execution_fakes.hh"

#include <chrono>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <solrank/execution/worker.hh>
#include <string>
#include <vector>

using solrank::ProcessStatus;
using solrank::Worker;
using std::string;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

solrank::WorkerOptions options() {
    return {.python_executable = "/usr/bin/python3", .memory_limit = 1 << 28, .output_limit = 1 << 20};
}

} // namespace

// NOLINTNEXTLINE
TEST(Worker, passing_test) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, [](const string& /*program*/, const string& dir, FakeFilesystem& files) {
        files.write_file(dir + "stdout.txt", "3\n");
        files.write_file(dir + "elapsed.txt", "0.125");
        return exited(0);
    }};
    Worker worker{fs, runner, options()};

    auto outcome = worker.run_test("def f(x):\n    return x\n", "\nprint(f(3))", 2.5);
    EXPECT_TRUE(outcome.passed);
    EXPECT_EQ(outcome.stdout_text, "3\n");
    EXPECT_EQ(outcome.stderr_text, "");
    EXPECT_EQ(outcome.traceback, "");
    EXPECT_EQ(outcome.elapsed, 0.125);

    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 1U);
    EXPECT_EQ(calls[0].program, "def f(x):\n    return x\n\nprint(f(3))");
    ASSERT_EQ(calls[0].argv.size(), 4U);
    EXPECT_EQ(calls[0].argv[0], "/usr/bin/python3");
    EXPECT_EQ(calls[0].argv[1], "-c");
    EXPECT_THAT(calls[0].argv[2], HasSubstr("program.py"));
    // The harness enforces the time limit, the process gets extra time to start
    EXPECT_EQ(calls[0].argv[3], "2.500000");
    EXPECT_EQ(calls[0].working_dir, "/sandbox/1/");
    EXPECT_EQ(calls[0].limits.real_time_limit, std::chrono::milliseconds{4500});
    EXPECT_EQ(calls[0].limits.memory_limit, 1U << 28);
    EXPECT_EQ(calls[0].limits.output_limit, 1U << 20);

    EXPECT_EQ(fs.directories_alive(), 0U);
}

// NOLINTNEXTLINE
TEST(Worker, raised_exception) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, [](const string& /*program*/, const string& dir, FakeFilesystem& files) {
        files.write_file(dir + "stderr.txt", "ZeroDivisionError('division by zero')");
        files.write_file(dir + "traceback.txt", "  File \"<string>\", line 2, in <module>\n");
        files.write_file(dir + "elapsed.txt", "0.5\n");
        return exited(0);
    }};
    Worker worker{fs, runner, options()};

    auto outcome = worker.run_test("x = 1\n", "\nprint(1 / 0)", 10);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.stderr_text, "ZeroDivisionError('division by zero')");
    EXPECT_THAT(outcome.traceback, HasSubstr("line 2"));
    EXPECT_EQ(outcome.elapsed, 0.5);
    EXPECT_EQ(fs.directories_alive(), 0U);
}

// NOLINTNEXTLINE
TEST(Worker, timeout) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, [](const string& /*program*/, const string& dir, FakeFilesystem& files) {
        files.write_file(dir + "stdout.txt", "partial");
        return ProcessStatus{
            .timed_out = true,
            .exited_normally = false,
            .description = "timed out",
            .runtime = std::chrono::milliseconds{1520},
        };
    }};
    Worker worker{fs, runner, options()};

    auto outcome = worker.run_test("", "\nwhile True: pass", 1.5);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.stderr_text, solrank::TIMEOUT_STDERR);
    EXPECT_EQ(outcome.elapsed, 1.5);
    EXPECT_EQ(outcome.stdout_text, "partial");
    EXPECT_EQ(fs.directories_alive(), 0U);
}

// NOLINTNEXTLINE
TEST(Worker, timeout_reported_by_harness) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, [](const string& /*program*/, const string& dir, FakeFilesystem& files) {
        files.write_file(dir + "stdout.txt", "partial");
        files.write_file(dir + "stderr.txt", "TimeoutException('Timed out!')");
        files.write_file(dir + "traceback.txt", "  File \"<string>\", line 1, in <module>\n");
        files.write_file(dir + "timed_out.txt", "");
        files.write_file(dir + "elapsed.txt", "0.1003");
        return exited(0);
    }};
    Worker worker{fs, runner, options()};

    auto outcome = worker.run_test("", "\nwhile True: pass", 0.1);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.stderr_text, solrank::TIMEOUT_STDERR);
    EXPECT_EQ(outcome.traceback, "");
    EXPECT_EQ(outcome.elapsed, 0.1);
    EXPECT_EQ(outcome.stdout_text, "partial");
    EXPECT_EQ(fs.directories_alive(), 0U);
}

// NOLINTNEXTLINE
TEST(Worker, killed_without_stderr) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, [](const string& /*program*/, const string& /*dir*/, FakeFilesystem& /*fs*/) {
        return ProcessStatus{
            .timed_out = false,
            .exited_normally = false,
            .description = "killed by signal 9 - Killed",
            .runtime = std::chrono::milliseconds{250},
        };
    }};
    Worker worker{fs, runner, options()};

    auto outcome = worker.run_test("", "\nx = [0] * 10**12", 10);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.stderr_text, "Process killed by signal 9 - Killed");
    // No elapsed.txt, so the process runtime is used
    EXPECT_DOUBLE_EQ(outcome.elapsed, 0.25);
}

// NOLINTNEXTLINE
TEST(Worker, stderr_output_fails_the_test) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, [](const string& /*program*/, const string& dir, FakeFilesystem& files) {
        files.write_file(dir + "stderr.txt", "DeprecationWarning: old\n");
        files.write_file(dir + "elapsed.txt", "0.01");
        return exited(0);
    }};
    Worker worker{fs, runner, options()};

    auto outcome = worker.run_test("", "\nprint(1)", 10);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.stderr_text, "DeprecationWarning: old\n");
}

// NOLINTNEXTLINE
TEST(Worker, runner_failure_is_a_failed_test) {
    FakeFilesystem fs;
    FakeProcessRunner runner{
        fs, [](const string& /*program*/, const string& /*dir*/, FakeFilesystem& /*fs*/) -> ProcessStatus {
            THROW("Failed to run `python3`: execvp() - No such file or directory (os error 2)");
        }
    };
    Worker worker{fs, runner, options()};

    auto outcome = worker.run_test("", "\nprint(1)", 10);
    EXPECT_FALSE(outcome.passed);
    EXPECT_THAT(outcome.stderr_text, HasSubstr("Failed to run `python3`"));
    EXPECT_THAT(outcome.traceback, StartsWith("Execution machinery failure: Failed to run"));
    // The sandbox is removed even though the run failed
    EXPECT_EQ(fs.directories_created(), 1U);
    EXPECT_EQ(fs.directories_alive(), 0U);
}

// NOLINTNEXTLINE
TEST(Worker, filesystem_failures_are_failed_tests) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, [](const string& /*program*/, const string& /*dir*/, FakeFilesystem& /*fs*/) {
        return exited(0);
    }};
    Worker worker{fs, runner, options()};

    fs.fail_creating = true;
    auto outcome = worker.run_test("", "\nprint(1)", 10);
    EXPECT_FALSE(outcome.passed);
    EXPECT_THAT(outcome.traceback, HasSubstr("No space left on device"));
    fs.fail_creating = false;

    fs.fail_writing = true;
    outcome = worker.run_test("", "\nprint(1)", 10);
    EXPECT_FALSE(outcome.passed);
    EXPECT_THAT(outcome.stderr_text, HasSubstr("Disk quota exceeded"));
    EXPECT_EQ(fs.directories_alive(), 0U);
    EXPECT_TRUE(runner.calls().empty());
}

// NOLINTNEXTLINE
TEST(Worker, run_tier) {
    FakeFilesystem fs;
    FakeProcessRunner runner{fs, [](const string& program, const string& dir, FakeFilesystem& files) {
        files.write_file(dir + "elapsed.txt", "0.2");
        if (program.find("bad") != string::npos) {
            files.write_file(dir + "stderr.txt", "AssertionError()");
            return exited(0);
        }
        files.write_file(dir + "stdout.txt", "ok\n");
        return exited(0);
    }};
    Worker worker{fs, runner, options()};

    auto res = worker.run_tier("", {"\ngood()", "\nbad()", "\ngood()", "\ngood()"}, {1, 2, 3, 4});
    EXPECT_EQ(res.correct_tests, (std::vector<bool>{true, false, true, true}));
    EXPECT_EQ(res.average_test_score, 0.75);
    EXPECT_THAT(res.unit_test_stdouts, ElementsAre("ok\n", "", "ok\n", "ok\n"));
    EXPECT_THAT(res.unit_test_stderrs, ElementsAre("", "AssertionError()", "", ""));
    EXPECT_THAT(res.time_taken, ElementsAre(0.2, 0.2, 0.2, 0.2));
    EXPECT_FALSE(res.average_time_taken.has_value());

    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 4U);
    EXPECT_EQ(calls[3].argv[3], "4.000000");
    EXPECT_EQ(calls[3].limits.real_time_limit, std::chrono::seconds{6});

    auto empty = worker.run_tier("", {}, {});
    EXPECT_TRUE(empty.correct_tests.empty());
    EXPECT_EQ(empty.average_test_score, 0);

    EXPECT_THROW(worker.run_tier("", {"\nx"}, {}), std::runtime_error);
}
