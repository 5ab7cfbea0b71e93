#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace detail {

template <class T>
decltype(auto) stringify(T&& x) {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;
    if constexpr (std::is_same_v<U, char>) {
        return std::string_view{&x, 1};
    } else if constexpr (std::is_same_v<U, bool>) {
        return std::string_view{x ? "true" : "false"};
    } else if constexpr (std::is_arithmetic_v<U>) {
        return std::to_string(x);
    } else if constexpr (std::is_enum_v<U>) {
        return std::to_string(static_cast<std::underlying_type_t<U>>(x));
    } else {
        return std::string_view{x};
    }
}

} // namespace detail

// Appends all @p args converted to strings to @p str
template <class... Args>
std::string& back_insert(std::string& str, Args&&... args) {
    ((str += detail::stringify(std::forward<Args>(args))), ...);
    return str;
}

template <class... Args>
[[nodiscard]] std::string concat_tostr(Args&&... args) {
    std::string res;
    back_insert(res, std::forward<Args>(args)...);
    return res;
}
