#pragma once

#include <limits>
#include <type_traits>

// Checks whether @p from is representable in the integral type To
template <class To, class From>
[[nodiscard]] constexpr bool converts_safely_to(From from) noexcept {
    static_assert(std::is_integral_v<To> && std::is_integral_v<From>);
    if constexpr (std::is_same_v<To, bool>) {
        return from == 0 || from == 1;
    } else if constexpr (std::is_signed_v<From> && !std::is_signed_v<To>) {
        return from >= 0 &&
            static_cast<std::make_unsigned_t<From>>(from) <= std::numeric_limits<To>::max();
    } else if constexpr (!std::is_signed_v<From> && std::is_signed_v<To>) {
        return from <= static_cast<std::make_unsigned_t<To>>(std::numeric_limits<To>::max());
    } else {
        return std::numeric_limits<To>::min() <= from && from <= std::numeric_limits<To>::max();
    }
}
