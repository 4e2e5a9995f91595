#pragma once

#include <cstdint>
#include <seccomp.h>
#include <solranklib/errmsg.hh>
#include <solranklib/file_descriptor.hh>
#include <solranklib/macros/throw.hh>
#include <sys/mman.h>

namespace sandbox::seccomp {

struct ARG0_EQ {
    uint64_t datum;
};

struct ARG0_NE {
    uint64_t datum;
};

struct ARG0_MASKED_EQ {
    uint64_t mask;
    uint64_t datum;
};

// Builds a seccomp BPF program that can be installed with
// seccomp(SECCOMP_SET_MODE_FILTER) from the exported memfd
class BpfBuilder {
    scmp_filter_ctx seccomp_ctx;

    static constexpr auto arg_cmp_to_seccomp_native(const ARG0_EQ& arg_cmp) noexcept {
        return SCMP_A0(SCMP_CMP_EQ, arg_cmp.datum);
    }

    static constexpr auto arg_cmp_to_seccomp_native(const ARG0_NE& arg_cmp) noexcept {
        return SCMP_A0(SCMP_CMP_NE, arg_cmp.datum);
    }

    static constexpr auto arg_cmp_to_seccomp_native(const ARG0_MASKED_EQ& arg_cmp) noexcept {
        return SCMP_A0(SCMP_CMP_MASKED_EQ, arg_cmp.mask, arg_cmp.datum);
    }

public:
    explicit BpfBuilder(uint32_t def_action = SCMP_ACT_ALLOW)
    : seccomp_ctx{seccomp_init(def_action)} {
        if (!seccomp_ctx) {
            THROW("seccomp_init() failed");
        }

        // Enable binary tree sorted syscalls in the filter
        int err = seccomp_attr_set(seccomp_ctx, SCMP_FLTATR_CTL_OPTIMIZE, 2);
        if (err) {
            THROW("seccomp_attr_set()", errmsg(-err));
        }
    }

    BpfBuilder(const BpfBuilder&) = delete;
    BpfBuilder(BpfBuilder&&) = delete;
    BpfBuilder& operator=(const BpfBuilder&) = delete;
    BpfBuilder& operator=(BpfBuilder&&) = delete;

    template <class... Args>
    void allow_syscall(int syscall, Args&&... args) {
        int err = seccomp_rule_add(
            seccomp_ctx,
            SCMP_ACT_ALLOW,
            syscall,
            sizeof...(args),
            arg_cmp_to_seccomp_native(std::forward<Args>(args))...
        );
        if (err) {
            THROW("seccomp_rule_add()", errmsg(-err));
        }
    }

    template <class... Args>
    void err_syscall(int errnum, int syscall, Args&&... args) {
        int err = seccomp_rule_add(
            seccomp_ctx,
            SCMP_ACT_ERRNO(errnum),
            syscall,
            sizeof...(args),
            arg_cmp_to_seccomp_native(std::forward<Args>(args))...
        );
        if (err) {
            THROW("seccomp_rule_add()", errmsg(-err));
        }
    }

    [[nodiscard]] FileDescriptor export_to_fd() const {
        auto mfd = FileDescriptor{memfd_create("seccomp bpf", MFD_CLOEXEC)};
        if (!mfd.is_open()) {
            THROW("memfd_create()", errmsg());
        }

        int err = seccomp_export_bpf(seccomp_ctx, mfd);
        if (err) {
            THROW("seccomp_export_bpf()", errmsg(-err));
        }

        return mfd;
    }

    ~BpfBuilder() { seccomp_release(seccomp_ctx); }
};

} // namespace sandbox::seccomp
