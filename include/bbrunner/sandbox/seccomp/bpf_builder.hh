#pragma once

#include <bbrunner/errmsg.hh>
#include <bbrunner/file_descriptor.hh>
#include <bbrunner/macros/throw.hh>
#include <cstdint>
#include <seccomp.h>
#include <sys/mman.h>

namespace sandbox::seccomp {

// Builds a seccomp BPF program with libseccomp
class BpfBuilder {
    scmp_filter_ctx seccomp_ctx_;

public:
    explicit BpfBuilder(uint32_t def_action) : seccomp_ctx_{seccomp_init(def_action)} {
        if (!seccomp_ctx_) {
            THROW("seccomp_init() failed");
        }
        // Enable binary tree sorted syscalls in the filter
        int err = seccomp_attr_set(seccomp_ctx_, SCMP_FLTATR_CTL_OPTIMIZE, 2);
        if (err) {
            seccomp_release(seccomp_ctx_);
            THROW("seccomp_attr_set()", errmsg(-err));
        }
    }

    BpfBuilder(const BpfBuilder&) = delete;
    BpfBuilder(BpfBuilder&&) = delete;
    BpfBuilder& operator=(const BpfBuilder&) = delete;
    BpfBuilder& operator=(BpfBuilder&&) = delete;

    void allow_syscall(int syscall) {
        int err = seccomp_rule_add(seccomp_ctx_, SCMP_ACT_ALLOW, syscall, 0);
        if (err) {
            THROW("seccomp_rule_add()", errmsg(-err));
        }
    }

    // Returns memfd containing the array of struct sock_filter
    [[nodiscard]] FileDescriptor export_to_fd() const {
        auto mfd = FileDescriptor{memfd_create("seccomp bpf", MFD_CLOEXEC)};
        if (!mfd.is_open()) {
            THROW("memfd_create()", errmsg());
        }
        int err = seccomp_export_bpf(seccomp_ctx_, mfd);
        if (err) {
            THROW("seccomp_export_bpf()", errmsg(-err));
        }
        return mfd;
    }

    ~BpfBuilder() { seccomp_release(seccomp_ctx_); }
};

} // namespace sandbox::seccomp
