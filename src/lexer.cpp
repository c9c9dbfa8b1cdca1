#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "debug.hpp"
#include "lexer.hpp"
#include "unicode.hpp"

std::string literal_to_string(const literal& lit)
{
    struct visitor {
        std::string operator()(const integer& i) const { return i.str(); }
        std::string operator()(double d) const { return std::format("{}", d); }
        std::string operator()(const std::string& s) const { return std::format("\"{}\"", s); }
        std::string operator()(std::nullptr_t) const { return "nil"; }
    };
    return std::visit(visitor{}, lit);
}

std::string token_type_to_string(token_type type)
{
    switch (type) {
        case token_type::start_stmt: return "START_STMT";
        case token_type::end_stmt: return "END_STMT";
        case token_type::keyword: return "KEYWORD";
        case token_type::literal: return "LITERAL";
        case token_type::identifier: return "IDENTIFIER";
        default: return "UNKNOWN";
    }
}

token token::identifier(std::string name, location loc)
{
    token t{token_type::identifier, std::move(loc)};
    t.text = std::move(name);
    return t;
}

token token::from_keyword(keyword kw, std::string spelling, location loc)
{
    token t{token_type::keyword, std::move(loc)};
    t.kw = kw;
    t.text = std::move(spelling);
    return t;
}

token token::from_literal(literal value, location loc)
{
    token t{token_type::literal, std::move(loc)};
    t.value = std::move(value);
    return t;
}

std::string token::to_string() const
{
    std::string shown = token_type::literal == type? literal_to_string(value): text;
    return std::format("Token({}, '{}') at {}", token_type_to_string(type), shown, loc.to_string());
}

namespace {

    bool is_digits(std::string_view s)
    {
        return not s.empty() and std::ranges::all_of(s, [](char c) {
            return std::isdigit(static_cast<unsigned char>(c));
        });
    }

    std::string_view strip_sign(std::string_view s)
    {
        if (not s.empty() and ('+' == s.front() or '-' == s.front())) {
            s.remove_prefix(1);
        }
        return s;
    }

    bool is_whole_number(std::string_view s)
    {
        return is_digits(strip_sign(s));
    }

    integer parse_whole_number(std::string_view s)
    {
        bool negative = not s.empty() and '-' == s.front();
        auto digits = strip_sign(s);
        // cpp_int reads a leading 0 as an octal prefix.
        auto first = digits.find_first_not_of('0');
        digits = std::string_view::npos == first? digits.substr(digits.size() - 1): digits.substr(first);
        integer result{std::string(digits)};
        return negative? integer(-result): result;
    }

    // A decimal number must contain at least one digit, so that words like
    // "inf" and "nan" stay identifiers.
    bool parse_decimal(std::string_view s, double& out)
    {
        if (std::ranges::none_of(s, [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            return false;
        }
        if (not s.empty() and '+' == s.front()) s.remove_prefix(1);
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        return std::errc{} == ec and ptr == s.data() + s.size();
    }

    bool is_space(char32_t ch)
    {
        return U' ' == ch or U'\t' == ch or U'\r' == ch or U'\v' == ch or U'\f' == ch;
    }

} // anonymous namespace

token classify_token(std::string text, location loc)
{
    if ("let" == text) {
        return token::from_keyword(keyword::let, std::move(text), std::move(loc));
    }
    if ("lambda" == text) {
        return token::from_keyword(keyword::lambda, std::move(text), std::move(loc));
    }
    if (is_whole_number(text)) {
        return token::from_literal(parse_whole_number(text), std::move(loc));
    }
    double d{};
    if (parse_decimal(text, d)) {
        return token::from_literal(d, std::move(loc));
    }
    if ("nil" == text) {
        return token::from_literal(nullptr, std::move(loc));
    }
    return token::identifier(std::move(text), std::move(loc));
}

lexer::lexer(std::string_view source, std::string filename)
    : source_(source), filename_(std::move(filename)) {}

void lexer::append(char32_t ch, const location& loc)
{
    if (buffer_.empty()) buffer_start_ = loc;
    append_utf8(buffer_, ch);
}

void lexer::flush()
{
    if (buffer_.empty()) return;
    auto tok = classify_token(std::move(buffer_), buffer_start_);
    buffer_.clear();
    PALE_DEBUG(lex, "{}", tok.to_string());
    tokens_.push_back(std::move(tok));
}

void lexer::push_string()
{
    auto tok = token::from_literal(std::move(buffer_), string_start_);
    buffer_.clear();
    PALE_DEBUG(lex, "{}", tok.to_string());
    tokens_.push_back(std::move(tok));
    mode_ = mode::normal;
}

void lexer::start_stmt(const location& loc)
{
    flush();
    PALE_DEBUG(lex, "Token(START_STMT) at {}", loc.to_string());
    tokens_.push_back(token::start_stmt(loc));
}

void lexer::end_stmt(const location& loc)
{
    flush();
    PALE_DEBUG(lex, "Token(END_STMT) at {}", loc.to_string());
    tokens_.push_back(token::end_stmt(loc));
    close_wraps(loc);
}

void lexer::close_wraps(const location& loc)
{
    if (pending_wraps_ > 0) {
        PALE_DEBUG(lex, "Closing {} `$` statement(s) at {}", pending_wraps_, loc.to_string());
    }
    for (; pending_wraps_ > 0; --pending_wraps_) {
        tokens_.push_back(token::end_stmt(loc));
    }
}

void lexer::scan_normal(char32_t ch, const location& loc)
{
    if (U'*' == ch and U'{' == last_) {
        buffer_.pop_back();
        flush();
        comment_start_ = {loc.filename, loc.line, loc.column - 1};
        mode_ = mode::in_comment;
        return;
    }

    switch (ch) {
        case U'(':
            start_stmt(loc);
            break;
        case U')':
            end_stmt(loc);
            break;
        case U'"':
            flush();
            string_start_ = loc;
            mode_ = mode::in_string;
            break;
        case U'$':
            start_stmt(loc);
            ++pending_wraps_;
            break;
        default:
            if (is_space(ch)) {
                flush();
            } else {
                append(ch, loc);
            }
            break;
    }
}

void lexer::scan_line(std::u32string_view line, size_t line_number)
{
    last_ = U'\n';
    for (size_t i = 0; i < line.size(); ++i) {
        char32_t ch = line[i];
        location loc = at(line_number, i + 1);

        switch (mode_) {
            case mode::in_string:
                if (U'"' == ch) {
                    push_string();
                } else {
                    append_utf8(buffer_, ch);
                }
                break;

            case mode::in_comment:
                if (U'}' == ch and U'*' == last_) {
                    mode_ = mode::normal;
                    // Don't let the closing brace pair with a following '*'.
                    last_ = U' ';
                    continue;
                }
                break;

            case mode::normal:
                if (U'/' == ch and U'/' == last_) {
                    // The first slash is already sitting in the buffer.
                    buffer_.pop_back();
                    flush();
                    return;
                }
                scan_normal(ch, loc);
                if (mode::in_comment == mode_) {
                    // The '*' opened the comment; it can't also close it.
                    last_ = U' ';
                    continue;
                }
                break;
        }
        last_ = ch;
    }
}

std::vector<token> lexer::tokenize()
{
    size_t line_number = 0;
    size_t start = 0;
    while (start <= source_.size()) {
        auto newline = source_.find('\n', start);
        auto end = std::string_view::npos == newline? source_.size(): newline;
        auto raw = source_.substr(start, end - start);
        ++line_number;

        try {
            scan_line(decode_utf8(raw), line_number);
        } catch (const std::invalid_argument& e) {
            errors_.error(at(line_number, 1), e.what())
                .note("Source files must be UTF-8 encoded.");
        }

        switch (mode_) {
            case mode::normal:
                flush(); // A line break separates tokens.
                break;
            case mode::in_string:
                if (std::string_view::npos != newline) buffer_ += '\n';
                break;
            case mode::in_comment:
                break;
        }

        if (std::string_view::npos == newline) break;
        start = newline + 1;
    }

    location end_of_input = at(line_number, 1);
    if (not tokens_.empty()) end_of_input = tokens_.back().loc;

    if (mode::in_string == mode_) {
        errors_.error(string_start_, "Unterminated string literal!")
            .note("Add a closing `\"`.");
        buffer_.clear();
    } else if (mode::in_comment == mode_) {
        errors_.error(comment_start_, "Unterminated block comment!")
            .note("Close it with `*}`.");
    }
    close_wraps(end_of_input);

    if (not errors_.empty()) {
        throw pale_error(errors_);
    }
    return std::move(tokens_);
}

std::vector<token> tokenize(std::string_view source, const std::string& filename)
{
    lexer lex(source, filename);
    return lex.tokenize();
}
