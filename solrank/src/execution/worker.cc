#include <exception>
#include <solrank/execution/worker.hh>
#include <solranklib/concat_tostr.hh>
#include <solranklib/string_transform.hh>
#include <solranklib/throw_assert.hh>
#include <solranklib/time.hh>

namespace solrank {

namespace {

constexpr const char PROGRAM_FILE[] = "program.py";
constexpr const char STDOUT_FILE[] = "stdout.txt";
constexpr const char STDERR_FILE[] = "stderr.txt";
constexpr const char TRACEBACK_FILE[] = "traceback.txt";
constexpr const char ELAPSED_FILE[] = "elapsed.txt";
constexpr const char TIMED_OUT_FILE[] = "timed_out.txt";

// Executes program.py with only __builtins__ in globals under the time limit
// given as the first argument, which covers only the exec. Output written to
// sys.stderr is held back: on an exception stderr gets only the exception's
// repr() and traceback.txt its traceback (without the harness frame). An
// exceeded time limit is marked with timed_out.txt. The duration of the exec
// goes to elapsed.txt.
constexpr const char HARNESS[] = R"(import io, signal, sys, time, traceback
if hasattr(sys, "set_int_max_str_digits"):
    sys.set_int_max_str_digits(0)

class TimeoutException(Exception):
    pass

def on_alarm(signum, frame):
    raise TimeoutException("Timed out!")

time_limit = float(sys.argv[1])
with open("program.py") as f:
    source = f.read()
signal.signal(signal.SIGALRM, on_alarm)
captured_stderr = io.StringIO()
sys.stderr = captured_stderr
start = time.perf_counter()
try:
    signal.setitimer(signal.ITIMER_REAL, time_limit)
    try:
        exec(compile(source, "<string>", "exec"), {"__builtins__": __builtins__})
    finally:
        signal.setitimer(signal.ITIMER_REAL, 0)
except BaseException as e:
    elapsed = time.perf_counter() - start
    sys.stderr = sys.__stderr__
    if isinstance(e, TimeoutException):
        open("timed_out.txt", "w").close()
    lines = traceback.format_exception(type(e), e, e.__traceback__.tb_next)
    if lines and lines[0].startswith("Traceback"):
        lines = lines[1:]
    sys.stdout.flush()
    sys.stderr.write(repr(e))
    with open("traceback.txt", "w") as f:
        f.write("".join(lines))
else:
    elapsed = time.perf_counter() - start
    sys.stderr = sys.__stderr__
    sys.stderr.write(captured_stderr.getvalue())
with open("elapsed.txt", "w") as f:
    f.write(repr(elapsed))
)";

} // namespace

Worker::Worker(FilesystemOperations& fs, ProcessRunner& runner, WorkerOptions opts)
: fs_(fs)
, runner_(runner)
, opts_(std::move(opts)) {}

TestOutcome Worker::run_test_impl(const std::string& program, std::string_view test, double time_limit) {
    SandboxDirectory sandbox{fs_};
    const auto& dir = sandbox.path();
    fs_.write_file(concat_tostr(dir, PROGRAM_FILE), concat_tostr(program, test));

    auto status = runner_.run(
        {opts_.python_executable, "-c", HARNESS, to_string(time_limit, 6)},
        dir,
        concat_tostr(dir, STDOUT_FILE),
        concat_tostr(dir, STDERR_FILE),
        {
            .real_time_limit = from_seconds(time_limit + INTERPRETER_STARTUP_SLACK),
            .memory_limit = opts_.memory_limit,
            .output_limit = opts_.output_limit,
        }
    );

    auto read_if_exists = [&](const char* name) -> std::string {
        auto path = concat_tostr(dir, name);
        return fs_.file_exists(path) ? fs_.read_file(path) : std::string{};
    };

    TestOutcome res;
    res.stdout_text = read_if_exists(STDOUT_FILE);
    if (status.timed_out or fs_.file_exists(concat_tostr(dir, TIMED_OUT_FILE))) {
        res.passed = false;
        res.stderr_text = TIMEOUT_STDERR;
        res.elapsed = time_limit;
        return res;
    }

    res.stderr_text = read_if_exists(STDERR_FILE);
    res.traceback = read_if_exists(TRACEBACK_FILE);
    auto elapsed = str2num<double>(trim(read_if_exists(ELAPSED_FILE)));
    res.elapsed = elapsed ? *elapsed : to_seconds(status.runtime);

    if (not status.exited_normally and res.stderr_text.empty()) {
        res.stderr_text = concat_tostr("Process ", status.description);
    }
    res.passed = status.exited_normally and res.stderr_text.empty();
    return res;
}

TestOutcome Worker::run_test(const std::string& program, std::string_view test, double time_limit) noexcept {
    try {
        return run_test_impl(program, test, time_limit);
    } catch (const std::exception& e) {
        TestOutcome res;
        res.passed = false;
        res.stderr_text = e.what();
        res.traceback = concat_tostr("Execution machinery failure: ", e.what());
        return res;
    }
}

ExecutionResult Worker::run_tier(
    const std::string& program,
    const std::vector<std::string>& tests,
    const std::vector<double>& time_limits
) {
    throw_assert(tests.size() == time_limits.size());
    ExecutionResult res;
    for (size_t i = 0; i < tests.size(); ++i) {
        res.add(run_test(program, tests[i], time_limits[i]));
    }
    res.update_average_test_score();
    return res;
}

} // namespace solrank
