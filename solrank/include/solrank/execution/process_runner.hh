#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <solranklib/file_descriptor.hh>
#include <string>
#include <vector>

namespace solrank {

struct ProcessLimits {
    std::chrono::nanoseconds real_time_limit{0};
    std::optional<uint64_t> memory_limit; // [bytes]
    std::optional<uint64_t> output_limit; // [bytes] per written file
};

struct ProcessStatus {
    bool timed_out = false;
    bool exited_normally = false; // exited with status 0
    std::string description; // e.g. "exited with 1", "killed by signal 9 - Killed"
    std::chrono::nanoseconds runtime{0};
};

// Runs a program in a separate process
class ProcessRunner {
public:
    ProcessRunner() = default;
    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner(ProcessRunner&&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;
    ProcessRunner& operator=(ProcessRunner&&) = delete;

    virtual ~ProcessRunner() = default;

    /**
     * @brief Runs @p argv (argv[0] is looked up in PATH) in @p working_dir
     *   with standard input from /dev/null and standard output and error
     *   written to files @p stdout_path and @p stderr_path
     * @details Must be safe to call from many threads at once.
     *
     * @errors Throws std::runtime_error if the process cannot be started
     */
    virtual ProcessStatus run(
        const std::vector<std::string>& argv,
        const std::string& working_dir,
        const std::string& stdout_path,
        const std::string& stderr_path,
        const ProcessLimits& limits
    ) = 0;
};

// Runs processes with Spawner. Every process gets a syscall filter that makes
// networking, tracing, mounting and rebooting fail with EPERM.
class SpawnerProcessRunner : public ProcessRunner {
    FileDescriptor seccomp_bpf_fd_;

public:
    SpawnerProcessRunner();

    ProcessStatus run(
        const std::vector<std::string>& argv,
        const std::string& working_dir,
        const std::string& stdout_path,
        const std::string& stderr_path,
        const ProcessLimits& limits
    ) override;
};

} // namespace solrank
