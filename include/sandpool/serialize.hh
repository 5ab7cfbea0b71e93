#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <sandpool/converts_safely_to.hh>
#include <sandpool/macros/throw.hh>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace serialize {

// Serialization is done in two phases: the first one counts bytes, the second one writes them
enum class Phase {
    CountLen,
    Serialize,
};

template <Phase phase>
class Writer;

template <class T>
struct As {};
template <class T>
constexpr inline auto as = As<T>{};

template <class T>
struct CastedAs {};
template <class T>
constexpr inline auto casted_as = CastedAs<T>{};

template <Phase phase>
struct WriterBase {
    template <class T, std::enable_if_t<std::is_trivially_copyable_v<T>, int> = 0>
    void write_as_bytes(const T& value) {
        static_cast<Writer<phase>*>(this)->write_bytes(&value, sizeof(T));
    }

    template <class T, class SerializedT, decltype(SerializedT{std::declval<T>()}, 0) = 0>
    void write(const T& value, As<SerializedT> /**/) {
        write_as_bytes(SerializedT{value});
    }

    template <class T, class SerializedT>
    void write(const T& value, CastedAs<SerializedT> /**/) {
        if (!converts_safely_to<SerializedT>(value)) {
            THROW("cannot safely convert value: ", value, " to a ", sizeof(SerializedT), "-byte integer");
        }
        write_as_bytes(static_cast<SerializedT>(value));
    }

    template <size_t N, class SerializedFlagsT>
    void write_flags(std::pair<bool, SerializedFlagsT> (&&flags)[N], As<SerializedFlagsT> /**/) {
        auto bits = SerializedFlagsT{};
        for (auto&& [flag, serialized_flag] : flags) {
            if (flag) {
                bits |= serialized_flag;
            }
        }
        write_as_bytes(bits);
    }

    // Writes the length as LenT followed by the bytes
    template <class LenT>
    void write_string(std::string_view str, As<LenT> /**/) {
        write(str.size(), casted_as<LenT>);
        static_cast<Writer<phase>*>(this)->write_bytes(str.data(), str.size());
    }
};

template <>
class Writer<Phase::CountLen> : public WriterBase<Phase::CountLen> {
    size_t size_ = 0;

public:
    Writer() noexcept = default;

    void write_bytes(const void* /*ptr*/, size_t len) noexcept { size_ += len; }

    [[nodiscard]] size_t written_bytes_num() const noexcept { return size_; }
};

template <>
class Writer<Phase::Serialize> : public WriterBase<Phase::Serialize> {
    std::byte* dest_;
    size_t size_;

public:
    Writer(std::byte* dest, size_t size) noexcept : dest_{dest}, size_{size} {}

    void write_bytes(const void* ptr, size_t len) {
        if (len > size_) {
            THROW("cannot write ", len, " bytes, have space only for ", size_, " bytes");
        }
        if (len > 0) {
            std::memcpy(dest_, ptr, len);
        }
        dest_ += len;
        size_ -= len;
    }

    [[nodiscard]] size_t remaining_size() const noexcept { return size_; }
};

// Runs @p serialize_func for both phases and returns the serialized bytes
template <class Func>
[[nodiscard]] std::vector<std::byte> to_bytes(Func&& serialize_func) {
    Writer<Phase::CountLen> counter;
    serialize_func(counter);
    std::vector<std::byte> buff(counter.written_bytes_num());
    Writer<Phase::Serialize> writer{buff.data(), buff.size()};
    serialize_func(writer);
    if (writer.remaining_size() != 0) {
        THROW("BUG: serialization phases wrote different amounts of bytes");
    }
    return buff;
}

} // namespace serialize
