#pragma once

#include <chrono>
#include <csignal>
#include <cstdint>
#include <optional>
#include <solranklib/errmsg.hh>
#include <solranklib/file_contents.hh>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

class Spawner {
public:
    struct ExitStat {
        std::chrono::nanoseconds runtime{0};
        struct {
            int code; // si_code field from siginfo_t from waitid(2)
            int status; // si_status field from siginfo_t from waitid(2)
        } si{};

        bool timed_out = false; // true iff the process was killed due to real_time_limit
        std::string message; // "exited with N", "killed by signal N - ..." or "timed out"

        [[nodiscard]] bool exited_normally() const noexcept {
            return not timed_out and si.code == CLD_EXITED and si.status == 0;
        }
    };

    struct Options {
        int new_stdin_fd = STDIN_FILENO; // negative - close, STDIN_FILENO - do not change
        int new_stdout_fd = STDOUT_FILENO; // negative - close, STDOUT_FILENO - do not change
        int new_stderr_fd = STDERR_FILENO; // negative - close, STDERR_FILENO - do not change
        std::optional<std::chrono::nanoseconds> real_time_limit = std::nullopt;
        std::optional<uint64_t> memory_limit = std::nullopt; // in bytes (RLIMIT_AS)
        std::optional<uint64_t> file_size_limit = std::nullopt; // in bytes (RLIMIT_FSIZE)
        // If not set and real time limit is set, then CPU time limit will be set to
        // ceil(real time limit in seconds) + 1 seconds
        std::optional<std::chrono::nanoseconds> cpu_time_limit = std::nullopt;
        std::string working_dir = "."; // directory at which program will be run
        int seccomp_bpf_fd = -1; // BPF program exported by seccomp::BpfBuilder, negative - none
    };

    /**
     * @brief Runs @p exec with arguments @p exec_args and limits from @p opts
     * @details @p exec is called via execvp(). The child gets its own process
     *   group; the whole group is killed when the real time limit expires and
     *   after the child exits (no orphaned descendants survive). Only file
     *   descriptors 0, 1 and 2 are inherited. The real time limit is enforced
     *   by polling a pidfd, so no signals or timers are used and this function
     *   is thread-safe.
     *
     * @param exec path to file will be executed
     * @param exec_args arguments passed to exec (including argv[0])
     * @param opts options
     *
     * @return Returns ExitStat structure with fields:
     *   - runtime: wall time from fork() to the death of the child
     *   - si: {code, status} from waitid(2)
     *   - timed_out: whether the real time limit was exceeded
     *   - message: human-readable description of the way the process ended
     *
     * @errors Throws an exception std::runtime_error with appropriate
     *   information if any syscall fails or the child fails before execvp()
     *   succeeded (e.g. @p exec does not exist)
     */
    static ExitStat run(
        const std::string& exec,
        const std::vector<std::string>& exec_args,
        const Options& opts
    );

    static ExitStat run(const std::string& exec, const std::vector<std::string>& exec_args) {
        return run(exec, exec_args, Options{});
    }

private:
    // Sends @p str through @p fd and _exits with -1
    static void send_error_message_and_exit(int fd, std::string_view str) noexcept {
        (void)write_all(fd, str);
        _exit(-1);
    }

    // Sends @p str followed by " (os error <errnum>)" through @p fd and _exits
    // with -1. Uses only async-signal-safe operations.
    static void send_error_message_and_exit(int fd, int errnum, std::string_view str) noexcept;

    static void run_child(
        const std::string& exec,
        char* const* argv,
        const Options& opts,
        int error_fd
    ) noexcept;

    // Describes the way the process has ended
    static std::string exit_description(int code, int status);
};
