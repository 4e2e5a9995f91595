#include <cerrno>
#include <fcntl.h>
#include <solrank/execution/process_runner.hh>
#include <solranklib/errmsg.hh>
#include <solranklib/file_perms.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/seccomp/bpf_builder.hh>
#include <solranklib/spawner.hh>

namespace solrank {

namespace {

FileDescriptor build_seccomp_filter() {
    sandbox::seccomp::BpfBuilder bpf;
    for (int syscall : {
             SCMP_SYS(socket),
             SCMP_SYS(socketpair),
             SCMP_SYS(connect),
             SCMP_SYS(bind),
             SCMP_SYS(listen),
             SCMP_SYS(accept),
             SCMP_SYS(accept4),
             SCMP_SYS(sendto),
             SCMP_SYS(sendmsg),
             SCMP_SYS(sendmmsg),
             SCMP_SYS(ptrace),
             SCMP_SYS(process_vm_readv),
             SCMP_SYS(process_vm_writev),
             SCMP_SYS(mount),
             SCMP_SYS(umount2),
             SCMP_SYS(pivot_root),
             SCMP_SYS(chroot),
             SCMP_SYS(reboot),
             SCMP_SYS(kexec_load),
             SCMP_SYS(init_module),
             SCMP_SYS(finit_module),
             SCMP_SYS(delete_module),
             SCMP_SYS(swapon),
             SCMP_SYS(swapoff),
             SCMP_SYS(setns),
             SCMP_SYS(unshare),
         })
    {
        bpf.err_syscall(EPERM, syscall);
    }
    return bpf.export_to_fd();
}

FileDescriptor open_output_file(const std::string& path) {
    FileDescriptor fd{path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_0644};
    if (not fd.is_open()) {
        THROW("open('", path, "')", errmsg());
    }
    return fd;
}

} // namespace

SpawnerProcessRunner::SpawnerProcessRunner() : seccomp_bpf_fd_(build_seccomp_filter()) {}

ProcessStatus SpawnerProcessRunner::run(
    const std::vector<std::string>& argv,
    const std::string& working_dir,
    const std::string& stdout_path,
    const std::string& stderr_path,
    const ProcessLimits& limits
) {
    if (argv.empty()) {
        THROW("empty argv");
    }

    FileDescriptor dev_null{"/dev/null", O_RDONLY | O_CLOEXEC};
    if (not dev_null.is_open()) {
        THROW("open('/dev/null')", errmsg());
    }
    auto stdout_fd = open_output_file(stdout_path);
    auto stderr_fd = open_output_file(stderr_path);

    auto es = Spawner::run(
        argv[0],
        argv,
        {
            .new_stdin_fd = dev_null,
            .new_stdout_fd = stdout_fd,
            .new_stderr_fd = stderr_fd,
            .real_time_limit = limits.real_time_limit,
            .memory_limit = limits.memory_limit,
            .file_size_limit = limits.output_limit,
            .cpu_time_limit = std::nullopt,
            .working_dir = working_dir,
            .seccomp_bpf_fd = seccomp_bpf_fd_,
        }
    );

    return {
        .timed_out = es.timed_out,
        .exited_normally = es.exited_normally(),
        .description = std::move(es.message),
        .runtime = es.runtime,
    };
}

} // namespace solrank
