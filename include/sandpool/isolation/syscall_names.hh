#pragma once

#include <cstdint>
#include <string>

namespace sandpool::seccomp {

// Name of the syscall @p nr on the native architecture or "#<nr>" if unknown
[[nodiscard]] std::string syscall_name(int nr);

// AUDIT_ARCH_* value of the native architecture, as reported in seccomp_data::arch
[[nodiscard]] uint32_t native_arch() noexcept;

} // namespace sandpool::seccomp
