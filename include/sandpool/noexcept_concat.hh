#pragma once

#include <cstddef>
#include <cstring>
#include <string_view>
#include <type_traits>
#include <utility>

// Fixed-capacity string, output is silently cut at N bytes
template <size_t N>
class StackBuff {
    char data_[N + 1];
    size_t len_ = 0;

public:
    StackBuff() noexcept { data_[0] = '\0'; }

    void append(std::string_view str) noexcept {
        auto n = str.size() < N - len_ ? str.size() : N - len_;
        std::memcpy(data_ + len_, str.data(), n);
        len_ += n;
        data_[len_] = '\0';
    }

    template <class T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, char>, int> = 0>
    void append(T x) noexcept {
        char buff[24];
        size_t pos = sizeof(buff);
        bool negative = false;
        std::make_unsigned_t<T> ux;
        if constexpr (std::is_signed_v<T>) {
            negative = x < 0;
            ux = negative ? static_cast<std::make_unsigned_t<T>>(0) - static_cast<std::make_unsigned_t<T>>(x)
                          : static_cast<std::make_unsigned_t<T>>(x);
        } else {
            ux = x;
        }
        do {
            buff[--pos] = static_cast<char>('0' + ux % 10);
            ux /= 10;
        } while (ux > 0);
        if (negative) {
            buff[--pos] = '-';
        }
        append(std::string_view{buff + pos, sizeof(buff) - pos});
    }

    void append(char c) noexcept { append(std::string_view{&c, 1}); }

    [[nodiscard]] const char* c_str() const noexcept { return data_; }

    [[nodiscard]] const char* data() const noexcept { return data_; }

    [[nodiscard]] size_t size() const noexcept { return len_; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator std::string_view() const noexcept { return {data_, len_}; }
};

// Concatenation that does not allocate memory
template <size_t N = 256, class... Args>
[[nodiscard]] StackBuff<N> noexcept_concat(Args&&... args) noexcept {
    StackBuff<N> res;
    (res.append(std::forward<Args>(args)), ...);
    return res;
}
