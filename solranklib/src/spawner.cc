#include <array>
#include <cerrno>
#include <climits>
#include <cmath>
#include <csignal>
#include <cstring>
#include <linux/close_range.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <memory>
#include <poll.h>
#include <solranklib/call_in_destructor.hh>
#include <solranklib/concat_tostr.hh>
#include <solranklib/file_descriptor.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/spawner.hh>
#include <solranklib/syscalls.hh>
#include <solranklib/time.hh>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>

using std::string;
using std::vector;

void Spawner::send_error_message_and_exit(int fd, int errnum, std::string_view str) noexcept {
    (void)write_all(fd, str);
    // strerror() is not async-signal-safe
    char num[16];
    int len = 0;
    unsigned x = errnum < 0 ? 0 : errnum;
    do {
        num[len++] = static_cast<char>('0' + x % 10);
        x /= 10;
    } while (x > 0);
    (void)write_all(fd, " (os error ");
    while (len > 0) {
        (void)write_all(fd, &num[--len], 1);
    }
    (void)write_all(fd, ")");
    _exit(-1);
}

string Spawner::exit_description(int code, int status) {
    switch (code) {
    case CLD_EXITED: return concat_tostr("exited with ", status);
    case CLD_KILLED:
        return concat_tostr("killed by signal ", status, " - ", strsignal(status));
    case CLD_DUMPED:
        return concat_tostr("killed and dumped by signal ", status, " - ", strsignal(status));
    default: THROW("Invalid siginfo_t.si_code: ", code);
    }
}

Spawner::ExitStat
Spawner::run(const string& exec, const vector<string>& exec_args, const Spawner::Options& opts) {
    using std::chrono_literals::operator""ns;

    if (opts.real_time_limit.has_value() and opts.real_time_limit.value() <= 0ns) {
        THROW("If set, real_time_limit has to be greater than 0");
    }
    if (opts.cpu_time_limit.has_value() and opts.cpu_time_limit.value() <= 0ns) {
        THROW("If set, cpu_time_limit has to be greater than 0");
    }
    if (opts.memory_limit.has_value() and opts.memory_limit.value() == 0) {
        THROW("If set, memory_limit has to be greater than 0");
    }

    // The child may only use async-signal-safe functions, so argv is prepared here
    vector<char*> argv;
    argv.reserve(exec_args.size() + 1);
    for (const auto& arg : exec_args) {
        argv.emplace_back(const_cast<char*>(arg.c_str()));
    }
    argv.emplace_back(nullptr);

    // Error stream from child via pipe
    std::array<int, 2> pfd{};
    if (pipe2(pfd.data(), O_CLOEXEC) == -1) {
        THROW("pipe()", errmsg());
    }
    FileDescriptor error_pipe_read{pfd[0]};
    FileDescriptor error_pipe_write{pfd[1]};

    auto start = std::chrono::steady_clock::now();
    pid_t cpid = fork();
    if (cpid == -1) {
        THROW("fork()", errmsg());
    }
    if (cpid == 0) {
        run_child(exec, argv.data(), opts, error_pipe_write);
    }

    (void)error_pipe_write.close();

    siginfo_t si{};
    // Kills the whole process group and reaps the child, also when an exception is thrown
    CallInDtor kill_and_wait_child_guard([&] {
        (void)kill(-cpid, SIGKILL);
        (void)kill(cpid, SIGKILL); // The child might not have created its process group yet
        (void)syscalls::waitid(P_PID, cpid, &si, WEXITED, nullptr);
    });

    FileDescriptor pidfd{syscalls::pidfd_open(cpid, 0)};
    if (not pidfd.is_open()) {
        THROW("pidfd_open()", errmsg());
    }

    bool timed_out = false;
    for (;;) {
        int timeout_ms = -1;
        if (opts.real_time_limit.has_value()) {
            auto remaining = *opts.real_time_limit - (std::chrono::steady_clock::now() - start);
            if (remaining <= 0ns) {
                timed_out = true;
                break;
            }
            // Round up, so that we do not wake up too early
            timeout_ms = static_cast<int>(std::min<int64_t>(
                std::chrono::ceil<std::chrono::milliseconds>(remaining).count(), INT_MAX
            ));
        }

        pollfd pfd_poll = {.fd = pidfd, .events = POLLIN, .revents = 0};
        int rc = poll(&pfd_poll, 1, timeout_ms);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }
        if (rc == 1) {
            break; // The child has died
        }
        // rc == 0, remaining time is rechecked
    }

    if (timed_out) {
        kill_and_wait_child_guard.call_and_cancel();
    } else {
        kill_and_wait_child_guard.cancel();
        if (syscalls::waitid(P_PIDFD, pidfd, &si, WEXITED, nullptr) == -1) {
            THROW("waitid()", errmsg());
        }
        // Remove descendants left in the process group
        (void)kill(-cpid, SIGKILL);
    }
    auto runtime = std::chrono::steady_clock::now() - start;

    // The write end of the pipe is closed in the child by execvp() or _exit()
    string error_message = get_file_contents(error_pipe_read);
    if (not error_message.empty()) {
        THROW("Failed to run `", exec, "`: ", error_message);
    }

    ExitStat es;
    es.runtime = std::chrono::duration_cast<std::chrono::nanoseconds>(runtime);
    es.si.code = si.si_code;
    es.si.status = si.si_status;
    es.timed_out = timed_out;
    if (timed_out) {
        es.runtime = *opts.real_time_limit;
        es.message = "timed out";
    } else {
        es.message = exit_description(si.si_code, si.si_status);
    }
    return es;
}

void Spawner::run_child(
    const string& exec, char* const* argv, const Options& opts, int error_fd
) noexcept {
    auto send_error_and_exit = [error_fd](int errnum, std::string_view str) {
        send_error_message_and_exit(error_fd, errnum, str);
    };

    // Create new process group (useful for killing the whole process group)
    if (setpgid(0, 0)) {
        send_error_and_exit(errno, "setpgid()");
    }

    // Change working directory
    if (opts.working_dir != "." and opts.working_dir != "./" and not opts.working_dir.empty()) {
        if (chdir(opts.working_dir.c_str()) == -1) {
            send_error_and_exit(errno, "chdir()");
        }
    }

    auto set_rlimit = [&](int resource, rlim_t value, std::string_view name) {
        rlimit limit{};
        limit.rlim_cur = limit.rlim_max = value;
        if (setrlimit(resource, &limit)) {
            send_error_and_exit(errno, name);
        }
    };

    set_rlimit(RLIMIT_CORE, 0, "setrlimit(RLIMIT_CORE)");
    if (opts.memory_limit.has_value()) {
        set_rlimit(RLIMIT_AS, *opts.memory_limit, "setrlimit(RLIMIT_AS)");
    }
    if (opts.file_size_limit.has_value()) {
        set_rlimit(RLIMIT_FSIZE, *opts.file_size_limit, "setrlimit(RLIMIT_FSIZE)");
    }

    // Useful when the spawned process becomes orphaned
    auto cpu_tl = opts.cpu_time_limit ? opts.cpu_time_limit : opts.real_time_limit;
    if (cpu_tl.has_value()) {
        auto secs = std::chrono::ceil<std::chrono::seconds>(*cpu_tl).count() + 1;
        set_rlimit(RLIMIT_CPU, static_cast<rlim_t>(secs), "setrlimit(RLIMIT_CPU)");
    }

    auto change_fd = [&](int new_fd, int target_fd) {
        if (new_fd < 0) {
            (void)close(target_fd);
        } else if (new_fd != target_fd) {
            while (dup2(new_fd, target_fd) == -1) {
                if (errno != EINTR) {
                    send_error_and_exit(errno, "dup2()");
                }
            }
        }
    };
    change_fd(opts.new_stdin_fd, STDIN_FILENO);
    change_fd(opts.new_stdout_fd, STDOUT_FILENO);
    change_fd(opts.new_stderr_fd, STDERR_FILENO);

    // Do not leak other file descriptors to the executed program
    if (syscalls::close_range(STDERR_FILENO + 1, ~0U, CLOSE_RANGE_CLOEXEC)) {
        send_error_and_exit(errno, "close_range()");
    }

    if (opts.seccomp_bpf_fd >= 0) {
        struct stat st = {};
        if (fstat(opts.seccomp_bpf_fd, &st)) {
            send_error_and_exit(errno, "fstat()");
        }
        if (st.st_size <= 0 or st.st_size % sizeof(sock_filter) != 0 or
            st.st_size / sizeof(sock_filter) > USHRT_MAX)
        {
            send_error_message_and_exit(error_fd, "invalid seccomp_bpf_fd length");
        }
        void* filter_ptr = mmap(nullptr, st.st_size, PROT_READ, MAP_PRIVATE, opts.seccomp_bpf_fd, 0);
        if (filter_ptr == MAP_FAILED) {
            send_error_and_exit(errno, "mmap()");
        }
        auto fprog = sock_fprog{
            .len = static_cast<decltype(sock_fprog::len)>(st.st_size / sizeof(sock_filter)),
            .filter = static_cast<sock_filter*>(filter_ptr),
        };
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0)) {
            send_error_and_exit(errno, "prctl(PR_SET_NO_NEW_PRIVS)");
        }
        if (syscall(SYS_seccomp, SECCOMP_SET_MODE_FILTER, 0, &fprog)) {
            send_error_and_exit(errno, "seccomp()");
        }
    }

    execvp(exec.c_str(), argv);
    send_error_and_exit(errno, "execvp()");
}
