#include <cstdlib>
#include <memory>
#include <sandpool/concat_tostr.hh>
#include <sandpool/isolation/syscall_names.hh>
#include <seccomp.h>

namespace sandpool::seccomp {

std::string syscall_name(int nr) {
    std::unique_ptr<char, decltype(&free)> name{
        seccomp_syscall_resolve_num_arch(SCMP_ARCH_NATIVE, nr), &free
    };
    if (name) {
        return name.get();
    }
    return concat_tostr('#', nr);
}

uint32_t native_arch() noexcept { return seccomp_arch_native(); }

} // namespace sandpool::seccomp
