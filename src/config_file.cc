#include <algorithm>
#include <bbrunner/config_file.hh>
#include <bbrunner/file_contents.hh>
#include <cctype>
#include <cstddef>
#include <exception>
#include <utility>

using std::string;

namespace {

constexpr bool is_ws(char c) noexcept { return c == ' ' || c == '\t' || c == '\r'; }

constexpr bool is_name_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
        c == '-' || c == '_' || c == '.';
}

constexpr int hex2dec(char c) noexcept {
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

template <class ErrorHandler>
class Parser {
    const string& config_; // every line ends with '\n'
    size_t pos_ = 0;
    ErrorHandler error_handler_;

public:
    Parser(const string& config, ErrorHandler error_handler) noexcept
    : config_(config)
    , error_handler_(std::move(error_handler)) {}

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= config_.size(); }

    [[nodiscard]] char peek(size_t offset = 0) const noexcept {
        return pos_ + offset < config_.size() ? config_[pos_ + offset] : '\n';
    }

    void advance(size_t n = 1) noexcept { pos_ = std::min(pos_ + n, config_.size()); }

    void skip_ws() noexcept {
        while (!at_end() && is_ws(peek())) {
            advance();
        }
    }

    void skip_ws_and_newlines() noexcept {
        while (!at_end() && (is_ws(peek()) || peek() == '\n')) {
            advance();
        }
    }

    void skip_comment() noexcept {
        while (!at_end() && peek() != '\n') {
            advance();
        }
    }

    std::string_view extract_name() noexcept {
        size_t beg = pos_;
        while (!at_end() && is_name_char(peek())) {
            advance();
        }
        return std::string_view{config_}.substr(beg, pos_ - beg);
    }

    [[nodiscard]] size_t line_beg() const noexcept {
        if (pos_ == 0) {
            return 0;
        }
        auto nl = config_.rfind('\n', pos_ - 1);
        return nl == string::npos ? 0 : nl + 1;
    }

    [[nodiscard]] size_t line() const noexcept {
        auto newlines = std::count(
            config_.begin(), config_.begin() + static_cast<std::ptrdiff_t>(line_beg()), '\n'
        );
        return 1 + static_cast<size_t>(newlines);
    }

    [[nodiscard]] size_t col() const noexcept { return pos_ - line_beg() + 1; }

    [[nodiscard]] string diagnostics() const {
        string diags;
        auto beg = line_beg();
        for (size_t i = beg; i < config_.size() && config_[i] != '\n'; ++i) {
            auto c = static_cast<unsigned char>(config_[i]);
            diags += std::isprint(c) || c == '\t' ? static_cast<char>(c) : '?';
        }
        diags += '\n';
        diags.append(pos_ - beg, ' ');
        diags += '^';
        return diags;
    }

    template <class... Args>
    [[noreturn]] void throw_parse_error(Args&&... msg) const {
        error_handler_(*this, std::forward<Args>(msg)...);
        std::terminate();
    }

    string extract_single_quoted() {
        string res;
        advance(); // '
        for (;;) {
            char c = peek();
            if (c == '\n') {
                throw_parse_error("Missing terminating ' character");
            }
            advance();
            if (c == '\'') {
                if (peek() != '\'') {
                    return res;
                }
                advance(); // '' is an escaped '
            }
            res += c;
        }
    }

    string extract_double_quoted() {
        string res;
        advance(); // "
        for (;;) {
            char c = peek();
            if (c == '\n') {
                throw_parse_error("Missing terminating \" character");
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
            advance(); // backslash
            char esc = peek();
            switch (esc) {
            case '\'':
            case '"':
            case '\\': res += esc; break;
            case 't': res += '\t'; break;
            case 'n': res += '\n'; break;
            case 'r': res += '\r'; break;
            case '0': res += '\0'; break;
            case 'x': {
                int hi = hex2dec(peek(1));
                int lo = hex2dec(peek(2));
                if (hi < 0 || lo < 0) {
                    throw_parse_error("Invalid hexadecimal escape sequence");
                }
                res += static_cast<char>((hi << 4) | lo);
                advance(2);
                break;
            }
            default: throw_parse_error("Unknown escape sequence: `\\", esc, '`');
            }
            advance();
        }
    }

    string extract_literal(bool in_array) {
        char c = peek();
        if (c == '[' || (in_array && (c == ',' || c == ']'))) {
            throw_parse_error("Invalid beginning of the value: `", c, '`');
        }
        size_t beg = pos_;
        while (!at_end()) {
            c = peek();
            if (c == '\n' || c == '#' || (in_array && (c == ',' || c == ']'))) {
                break;
            }
            advance();
        }
        size_t end = pos_;
        while (end > beg && is_ws(config_[end - 1])) {
            --end;
        }
        return config_.substr(beg, end - beg);
    }

    string extract_value(bool in_array) {
        switch (peek()) {
        case '\'': return extract_single_quoted();
        case '"': return extract_double_quoted();
        default: return extract_literal(in_array);
        }
    }
};

} // namespace

void ConfigFile::load_config_from_file(FilePath path, bool load_all) {
    load_config_from_string(get_file_contents(path), load_all);
}

void ConfigFile::load_config_from_string(string config, bool load_all) {
    for (auto& [name, var] : vars_) {
        var.unset();
    }
    config += '\n';
    Parser parser{config, [] [[noreturn]] (const auto& p, auto&&... msg) {
                      ParseError pe(p.line(), p.col(), std::forward<decltype(msg)>(msg)...);
                      pe.diagnostics_ = p.diagnostics();
                      throw pe;
                  }};
    Variable ignored;

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
            parser.throw_parse_error("Invalid or missing variable name");
        }
        parser.skip_ws();
        if (parser.peek() == '\n' || parser.peek() == '#') {
            parser.throw_parse_error("Missing value of variable: `", name, '`');
        }
        if (parser.peek() != ':' && parser.peek() != '=') {
            parser.throw_parse_error("Invalid assignment operator: `", parser.peek(), '`');
        }
        parser.advance();
        parser.skip_ws();

        Variable* var = &ignored;
        if (auto it = vars_.find(name); it != vars_.end()) {
            var = &it->second;
        } else if (load_all) {
            var = &vars_[string{name}];
        }
        var->unset();
        var->flag_ = Variable::SET;

        if (parser.peek() != '[') {
            if (parser.peek() != '\n' && parser.peek() != '#') {
                var->str_ = parser.extract_value(false);
            }
        } else {
            var->flag_ |= Variable::ARRAY;
            parser.advance(); // [
            for (;;) {
                parser.skip_ws_and_newlines();
                if (parser.at_end()) {
                    parser.throw_parse_error("Missing terminating ] character of an array");
                }
                char c = parser.peek();
                if (c == ']') {
                    parser.advance();
                    break;
                }
                if (c == '#') {
                    parser.skip_comment();
                    continue;
                }
                if (c == ',') {
                    parser.advance();
                    continue;
                }
                var->arr_.emplace_back(parser.extract_value(true));
                parser.skip_ws();
                c = parser.peek();
                if (c == ',' || c == '\n') {
                    parser.advance();
                } else if (c == '#') {
                    parser.skip_comment();
                } else if (c != ']') {
                    parser.throw_parse_error("Unknown sequence after the value: `", c, '`');
                }
            }
        }

        parser.skip_ws();
        if (parser.peek() == '#') {
            parser.skip_comment();
        }
        if (parser.peek() != '\n') {
            parser.throw_parse_error("Unknown sequence after the value: `", parser.peek(), '`');
        }
        parser.advance();
    }
}
