#pragma once

#include <cstddef>
#include <cstring>
#include <optional>
#include <sandpool/converts_safely_to.hh>
#include <sandpool/macros/throw.hh>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace deserialize {

template <class T>
struct From {};
template <class T>
constexpr inline auto from = From<T>{};

template <class T>
struct CastedFrom {};
template <class T>
constexpr inline auto casted_from = CastedFrom<T>{};

class Reader {
    const std::byte* data_;
    size_t size_;

public:
    Reader(const std::byte* data, size_t size) noexcept : data_{data}, size_{size} {}

    Reader(const Reader&) = delete;
    Reader(Reader&&) = default;
    Reader& operator=(const Reader&) = delete;
    Reader& operator=(Reader&&) = default;
    ~Reader() = default;

    const std::byte* extract_bytes(size_t len) {
        if (len > size_) {
            THROW("cannot read ", len, " bytes, have only ", size_, " bytes");
        }
        auto res = data_;
        data_ += len;
        size_ -= len;
        return res;
    }

    void read_bytes(void* dest, size_t len) {
        auto src = extract_bytes(len);
        if (len > 0) {
            std::memcpy(dest, src, len);
        }
    }

    template <class T, std::enable_if_t<std::is_trivially_copyable_v<T>, int> = 0>
    [[nodiscard]] T read_bytes_as() {
        T value;
        read_bytes(&value, sizeof(value));
        return value;
    }

    template <class T, class SerializedT, decltype(T{std::declval<SerializedT>()}, 0) = 0>
    [[nodiscard]] T read(From<SerializedT> /**/) {
        return T{read_bytes_as<SerializedT>()};
    }

    template <class T, class SerializedT>
    [[nodiscard]] T read(CastedFrom<SerializedT> /**/) {
        auto serialized_value = read_bytes_as<SerializedT>();
        if (!converts_safely_to<T>(serialized_value)) {
            THROW("cannot safely convert value: ", serialized_value);
        }
        return static_cast<T>(serialized_value);
    }

    template <class T, class SerializedT>
    void read(T& x, From<SerializedT> tag) {
        x = read<T>(tag);
    }

    template <class T, class SerializedT>
    void read(T& x, CastedFrom<SerializedT> tag) {
        x = read<T>(tag);
    }

    template <size_t N, class SerializedFlagsT>
    void read_flags(std::pair<bool&, SerializedFlagsT> (&&flags)[N], From<SerializedFlagsT> /**/) {
        auto bits = read_bytes_as<SerializedFlagsT>();
        for (auto&& [flag, serialized_flag] : flags) {
            flag = (bits & serialized_flag) != 0;
            bits &= static_cast<SerializedFlagsT>(~serialized_flag);
        }
        if (bits != 0) {
            THROW("found unexpected flag bits: (dec) ", bits);
        }
    }

    template <class T, class Tag>
    void read_optional_if(std::optional<T>& opt, Tag tag, bool condition) {
        if (condition) {
            opt = read<T>(tag);
        } else {
            opt = std::nullopt;
        }
    }

    // Reads the length as LenT followed by the bytes, refuses lengths above @p max_len
    template <class LenT>
    [[nodiscard]] std::string_view read_string(From<LenT> /**/, size_t max_len) {
        auto len = read<size_t>(casted_from<LenT>);
        if (len > max_len) {
            THROW("string is too long: ", len, " > ", max_len);
        }
        return {reinterpret_cast<const char*>(extract_bytes(len)), len};
    }

    [[nodiscard]] size_t remaining_size() const noexcept { return size_; }

    void expect_end() const {
        if (size_ != 0) {
            THROW("unexpected trailing ", size_, " bytes");
        }
    }
};

} // namespace deserialize
