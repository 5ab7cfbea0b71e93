#pragma once

#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <sandpool/concat_tostr.hh>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

// Parses files of the form:
//   # comment
//   name: value         (or name = value)
//   quoted: 'it''s'     (single-quoted, '' is a quote)
//   escaped: "a\tb\x41" (double-quoted with C escapes)
//   list: [a, 'b c',
//          "d"]         (arrays may span lines)
class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        size_t line_;
        size_t column_;
        std::string diagnostics_;

    public:
        ParseError(size_t line, size_t column, const std::string& msg, std::string diagnostics)
        : runtime_error(concat_tostr("line ", line, ':', column, ": ", msg))
        , line_{line}
        , column_{column}
        , diagnostics_{std::move(diagnostics)} {}

        [[nodiscard]] size_t line() const noexcept { return line_; }

        [[nodiscard]] size_t column() const noexcept { return column_; }

        // Two lines: the context of the error and a caret pointing at the faulty position
        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

    };

    class Variable {
        bool set_ = false;
        bool array_ = false;
        std::string str_;
        std::vector<std::string> arr_;

        friend class ConfigFile;

    public:
        [[nodiscard]] bool is_set() const noexcept { return set_; }

        [[nodiscard]] bool is_array() const noexcept { return array_; }

        // std::nullopt if the value is not one of: 1, 0, true, false, on, off
        [[nodiscard]] std::optional<bool> as_bool() const noexcept;

        // std::nullopt if the whole value is not a number of type T
        template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            if constexpr (std::is_floating_point_v<T>) {
                return parse_floating(str_);
            } else {
                T res{};
                auto [ptr, ec] = std::from_chars(str_.data(), str_.data() + str_.size(), res);
                if (ec != std::errc{} || ptr != str_.data() + str_.size() || str_.empty()) {
                    return std::nullopt;
                }
                return res;
            }
        }

        // Empty if the variable is not set or is an array
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Empty if the variable is not set or is not an array
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }

    private:
        static std::optional<double> parse_floating(const std::string& str) noexcept;
    };

private:
    std::map<std::string, Variable, std::less<>> vars_;
    static const Variable null_var;

public:
    // Adds variables @p names to the recognized variable set
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars_.emplace(std::forward<Args>(names), Variable{}), ...);
    }

    [[nodiscard]] const Variable& get_var(std::string_view name) const noexcept {
        auto it = vars_.find(name);
        return it == vars_.end() ? null_var : it->second;
    }

    const Variable& operator[](std::string_view name) const noexcept { return get_var(name); }

    [[nodiscard]] const std::map<std::string, Variable, std::less<>>& get_vars() const noexcept {
        return vars_;
    }

    /**
     * @brief Loads variables from file @p path
     * @details Uses load_config_from_string()
     *
     * @errors Throws std::runtime_error if reading the file fails and everything that
     *   load_config_from_string() throws
     */
    void load_config_from_file(const char* path, bool allow_unknown = false);

    /**
     * @brief Loads variables from @p config. Variables absent from @p config become unset.
     *
     * @param allow_unknown if false, a variable not added with add_vars() is an error, otherwise
     *   it is added to the variable set
     *
     * @errors Throws ParseError
     */
    void load_config_from_string(std::string_view config, bool allow_unknown = false);
};

inline const ConfigFile::Variable ConfigFile::null_var{};
