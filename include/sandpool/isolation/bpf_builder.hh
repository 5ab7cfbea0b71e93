#pragma once

#include <cstdint>
#include <fcntl.h>
#include <optional>
#include <sandpool/errmsg.hh>
#include <sandpool/file_descriptor.hh>
#include <sandpool/isolation/syscall_names.hh>
#include <sandpool/macros/throw.hh>
#include <seccomp.h>
#include <string>
#include <sys/mman.h>

namespace sandpool::seccomp {

struct ARG0_MASKED_EQ {
    uint64_t mask;
    uint64_t datum;
};

struct ARG0_EQ {
    uint64_t datum;
};

// Syscall number on the native architecture or std::nullopt if there is no such syscall
[[nodiscard]] inline std::optional<int> resolve_syscall(const char* name) noexcept {
    int nr = seccomp_syscall_resolve_name(name);
    if (nr == __NR_SCMP_ERROR || nr < 0) {
        return std::nullopt;
    }
    return nr;
}

class BpfBuilder {
    scmp_filter_ctx seccomp_ctx_;

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wc99-extensions"
#pragma clang diagnostic ignored "-Wmissing-field-initializers"
#endif

    static constexpr auto arg_cmp_to_seccomp_native(const ARG0_MASKED_EQ& arg_cmp) noexcept {
        return SCMP_A0(SCMP_CMP_MASKED_EQ, arg_cmp.mask, arg_cmp.datum);
    }

    static constexpr auto arg_cmp_to_seccomp_native(const ARG0_EQ& arg_cmp) noexcept {
        return SCMP_A0(SCMP_CMP_EQ, arg_cmp.datum);
    }

#ifdef __clang__
#pragma clang diagnostic pop
#endif

    template <class... Args>
    void add_rule(uint32_t action, int syscall, Args&&... args) {
        int err = seccomp_rule_add(
            seccomp_ctx_,
            action,
            syscall,
            sizeof...(args),
            arg_cmp_to_seccomp_native(std::forward<Args>(args))...
        );
        if (err) {
            THROW("seccomp_rule_add(", syscall_name(syscall), ")", errmsg(-err));
        }
    }

public:
    explicit BpfBuilder(uint32_t def_action) : seccomp_ctx_{seccomp_init(def_action)} {
        if (!seccomp_ctx_) {
            THROW("seccomp_init() failed");
        }

        // Enable binary tree sorted syscalls in the filter
        int err = seccomp_attr_set(seccomp_ctx_, SCMP_FLTATR_CTL_OPTIMIZE, 2);
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
        add_rule(SCMP_ACT_ALLOW, syscall, std::forward<Args>(args)...);
    }

    template <class... Args>
    void err_syscall(int errnum, int syscall, Args&&... args) {
        add_rule(SCMP_ACT_ERRNO(static_cast<uint16_t>(errnum)), syscall, std::forward<Args>(args)...);
    }

    // Returns false if the syscall does not exist on the native architecture
    template <class... Args>
    bool allow_syscall(const char* name, Args&&... args) {
        auto nr = resolve_syscall(name);
        if (nr) {
            allow_syscall(*nr, std::forward<Args>(args)...);
        }
        return nr.has_value();
    }

    // Returns false if the syscall does not exist on the native architecture
    template <class... Args>
    bool err_syscall(int errnum, const char* name, Args&&... args) {
        auto nr = resolve_syscall(name);
        if (nr) {
            err_syscall(errnum, *nr, std::forward<Args>(args)...);
        }
        return nr.has_value();
    }

    [[nodiscard]] FileDescriptor export_to_fd() const {
        auto mfd = FileDescriptor{memfd_create("seccomp bpf", MFD_CLOEXEC | MFD_ALLOW_SEALING)};
        if (!mfd.is_open()) {
            THROW("memfd_create()", errmsg());
        }

        int err = seccomp_export_bpf(seccomp_ctx_, mfd);
        if (err) {
            THROW("seccomp_export_bpf()", errmsg(-err));
        }
        // The program is shared by every worker spawned later
        if (fcntl(mfd, F_ADD_SEALS, F_SEAL_SHRINK | F_SEAL_GROW | F_SEAL_WRITE | F_SEAL_SEAL)) {
            THROW("fcntl(F_ADD_SEALS)", errmsg());
        }

        return mfd;
    }

    ~BpfBuilder() { seccomp_release(seccomp_ctx_); }
};

} // namespace sandpool::seccomp
