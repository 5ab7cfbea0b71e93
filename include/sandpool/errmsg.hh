#pragma once

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string_view>

// Fixed-size buffer holding " - <error description> (os error <errnum>)". Usable where memory
// allocation is forbidden e.g. between clone3() and execveat().
class ErrmsgBuff {
    static constexpr size_t max_len = 127;
    char str_[max_len + 1];
    size_t len_ = 0;

    void append(std::string_view s) noexcept {
        auto n = std::min(s.size(), max_len - len_);
        std::memcpy(str_ + len_, s.data(), n);
        len_ += n;
        str_[len_] = '\0';
    }

public:
    explicit ErrmsgBuff(int errnum) noexcept {
        str_[0] = '\0';
        append(" - ");
        char descr[64];
        // GNU strerror_r() may or may not use the provided buffer
        const char* errstr = strerror_r(errnum, descr, sizeof(descr));
        append(errstr == nullptr ? "Unknown error" : errstr);

        char num[24];
        size_t pos = sizeof(num);
        auto x = static_cast<unsigned>(errnum < 0 ? -errnum : errnum);
        do {
            num[--pos] = static_cast<char>('0' + x % 10);
            x /= 10;
        } while (x > 0);
        if (errnum < 0) {
            num[--pos] = '-';
        }
        // Ensure the suffix fits
        len_ = std::min(len_, max_len - (sizeof(num) - pos) - std::strlen(" (os error )"));
        append(" (os error ");
        append({num + pos, sizeof(num) - pos});
        append(")");
    }

    [[nodiscard]] const char* c_str() const noexcept { return str_; }

    [[nodiscard]] size_t size() const noexcept { return len_; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator std::string_view() const noexcept { return {str_, len_}; }
};

inline ErrmsgBuff errmsg(int errnum) noexcept { return ErrmsgBuff{errnum}; }

inline ErrmsgBuff errmsg() noexcept { return ErrmsgBuff{errno}; }
