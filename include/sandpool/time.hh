#pragma once

#include <chrono>
#include <cstdint>
#include <string>

// Returns local time as "YYYY-mm-dd HH:MM:SS"
std::string local_datetime();

template <class Rep, class Period>
[[nodiscard]] constexpr uint64_t to_usec(std::chrono::duration<Rep, Period> d) noexcept {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(d).count());
}

template <class Rep, class Period>
[[nodiscard]] constexpr uint64_t to_msec(std::chrono::duration<Rep, Period> d) noexcept {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
}
