#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sandpool/config_file.hh>
#include <sandpool/file_contents.hh>

namespace {

constexpr bool is_ws(char c) noexcept { return c == ' ' || c == '\t' || c == '\r'; }

constexpr bool is_name_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
        c == '-' || c == '_' || c == '.';
}

constexpr int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

class Parser {
    std::string text_; // always ends with '\n'
    size_t pos_ = 0;

public:
    explicit Parser(std::string_view config) : text_(config) { text_ += '\n'; }

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }

    [[nodiscard]] char peek(size_t offset = 0) const noexcept {
        return pos_ + offset < text_.size() ? text_[pos_ + offset] : '\n';
    }

    void advance(size_t n = 1) noexcept { pos_ = std::min(pos_ + n, text_.size()); }

    void skip_ws() noexcept {
        while (!at_end() && is_ws(peek())) {
            advance();
        }
    }

    void skip_comment() noexcept {
        while (!at_end() && peek() != '\n') {
            advance();
        }
    }

    template <class... Args>
    [[noreturn]] void fail(Args&&... msg) const {
        size_t pos = std::min(pos_, text_.size() - 1);
        size_t line_beg = pos;
        while (line_beg > 0 && text_[line_beg - 1] != '\n') {
            --line_beg;
        }
        auto line = 1 + static_cast<size_t>(std::count(text_.begin(), text_.begin() + line_beg, '\n'));
        size_t column = pos - line_beg + 1;

        std::string diags;
        auto append_char = [&](unsigned char c) {
            if (c >= 0x20 && c < 0x7f) {
                diags += static_cast<char>(c);
            } else {
                constexpr char digits[] = "0123456789abcdef";
                diags += "\\x";
                diags += digits[c >> 4];
                diags += digits[c & 15];
            }
        };
        constexpr size_t context = 32;
        size_t left = line_beg;
        if (pos - line_beg > context) {
            diags += "...";
            left = pos - context;
        }
        for (size_t i = left; i < pos; ++i) {
            append_char(text_[i]);
        }
        size_t padding = diags.size();
        size_t stress_len = 1;
        if (text_[pos] != '\n') {
            append_char(text_[pos]);
            stress_len = diags.size() - padding;
            size_t i = pos + 1;
            for (; text_[i] != '\n' && i <= pos + context; ++i) {
                append_char(text_[i]);
            }
            if (text_[i] != '\n') {
                diags += "...";
            }
        }
        diags += '\n';
        diags.append(padding, ' ');
        diags += '^';
        diags.append(stress_len - 1, '~');
        throw ConfigFile::ParseError(
            line, column, concat_tostr(std::forward<Args>(msg)...), std::move(diags)
        );
    }

    std::string_view extract_name() noexcept {
        size_t beg = pos_;
        while (is_name_char(peek())) {
            advance();
        }
        return std::string_view{text_}.substr(beg, pos_ - beg);
    }

    std::string extract_value(bool in_array) {
        std::string res;
        if (peek() == '\'') {
            advance();
            for (;;) {
                char c = peek();
                if (c == '\n') {
                    fail("missing terminating ' character");
                }
                advance();
                if (c == '\'') {
                    if (peek() != '\'') {
                        return res;
                    }
                    advance();
                }
                res += c;
            }
        }

        if (peek() == '"') {
            advance();
            for (;;) {
                char c = peek();
                if (c == '\n') {
                    fail("missing terminating \" character");
                }
                if (c == '"') {
                    advance();
                    return res;
                }
                if (c != '\\') {
                    res += c;
                    advance();
                    continue;
                }
                advance();
                switch (peek()) {
                case '\'': res += '\''; break;
                case '"': res += '"'; break;
                case '?': res += '?'; break;
                case '\\': res += '\\'; break;
                case 'a': res += '\a'; break;
                case 'b': res += '\b'; break;
                case 'f': res += '\f'; break;
                case 'n': res += '\n'; break;
                case 'r': res += '\r'; break;
                case 't': res += '\t'; break;
                case 'v': res += '\v'; break;
                case 'x': {
                    advance();
                    int hi = hex_value(peek());
                    if (hi < 0) {
                        fail("invalid hexadecimal digit: `", peek(), '`');
                    }
                    advance();
                    int lo = hex_value(peek());
                    if (lo < 0) {
                        fail("invalid hexadecimal digit: `", peek(), '`');
                    }
                    res += static_cast<char>((hi << 4) | lo);
                    break;
                }
                default: fail("unknown escape sequence: `\\", peek(), '`');
                }
                advance();
            }
        }

        // Unquoted literal
        if (peek() == '[' || (in_array && (peek() == ',' || peek() == ']'))) {
            fail("invalid beginning of the string literal: `", peek(), '`');
        }
        size_t beg = pos_;
        auto is_end = [&](char c) {
            return c == '\n' || c == '#' || (in_array && (c == ',' || c == ']'));
        };
        while (!is_end(peek())) {
            advance();
        }
        size_t end = pos_;
        while (end > beg && is_ws(text_[end - 1])) {
            --end;
        }
        return text_.substr(beg, end - beg);
    }
};

} // namespace

std::optional<bool> ConfigFile::Variable::as_bool() const noexcept {
    if (str_ == "1" || str_ == "true" || str_ == "on") {
        return true;
    }
    if (str_ == "0" || str_ == "false" || str_ == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<double> ConfigFile::Variable::parse_floating(const std::string& str) noexcept {
    if (str.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    double res = std::strtod(str.c_str(), &end);
    if (errno != 0 || end != str.c_str() + str.size()) {
        return std::nullopt;
    }
    return res;
}

void ConfigFile::load_config_from_file(const char* path, bool allow_unknown) {
    load_config_from_string(get_file_contents(path), allow_unknown);
}

void ConfigFile::load_config_from_string(std::string_view config, bool allow_unknown) {
    for (auto& [name, var] : vars_) {
        var = Variable{};
    }

    Parser parser{config};
    while (!parser.at_end()) {
        parser.skip_ws();
        if (parser.peek() == '\n') {
            parser.advance();
            continue;
        }
        if (parser.peek() == '#') {
            parser.skip_comment();
            continue;
        }

        auto name = parser.extract_name();
        if (name.empty()) {
            parser.fail("invalid or missing variable name");
        }
        auto it = vars_.find(name);
        if (it == vars_.end()) {
            if (!allow_unknown) {
                parser.fail("unknown variable: `", name, '`');
            }
            it = vars_.emplace(std::string{name}, Variable{}).first;
        }
        Variable& var = it->second;
        if (var.is_set()) {
            parser.fail("variable `", name, "` is set more than once");
        }

        parser.skip_ws();
        if (parser.peek() == '\n' || parser.peek() == '#') {
            parser.fail("incomplete directive: `", name, '`');
        }
        if (parser.peek() != '=' && parser.peek() != ':') {
            parser.fail("invalid assignment operator: `", parser.peek(), '`');
        }
        parser.advance();
        parser.skip_ws();

        var.set_ = true;
        if (parser.peek() != '[') {
            if (parser.peek() != '\n' && parser.peek() != '#') {
                var.str_ = parser.extract_value(false);
            }
        } else {
            var.array_ = true;
            parser.advance();
            for (;;) {
                while (!parser.at_end() && (is_ws(parser.peek()) || parser.peek() == '\n')) {
                    parser.advance();
                }
                if (parser.at_end()) {
                    parser.fail("missing terminating ] character at the end of an array");
                }
                if (parser.peek() == ']') {
                    parser.advance();
                    break;
                }
                if (parser.peek() == '#') {
                    parser.skip_comment();
                    continue;
                }
                if (parser.peek() == ',') {
                    parser.advance();
                    continue;
                }
                var.arr_.emplace_back(parser.extract_value(true));
                parser.skip_ws();
                char c = parser.peek();
                if (c == ',' || c == '\n') {
                    parser.advance();
                } else if (c == '#') {
                    parser.skip_comment();
                } else if (c == ']') {
                    parser.advance();
                    break;
                } else {
                    parser.fail("unknown sequence after the value: `", c, '`');
                }
            }
        }

        parser.skip_ws();
        if (parser.peek() == '#') {
            parser.skip_comment();
            continue;
        }
        if (parser.peek() != '\n') {
            parser.fail("unknown sequence after the value: `", parser.peek(), '`');
        }
        parser.advance();
    }
}
