#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include "diagnostics.hpp"

using integer = boost::multiprecision::cpp_int;

// The literal payload a token can carry. std::nullptr_t is nil.
using literal = std::variant<integer, double, std::string, std::nullptr_t>;

std::string literal_to_string(const literal& lit);

enum class token_type {
    start_stmt,
    end_stmt,
    keyword,
    literal,
    identifier,
};

std::string token_type_to_string(token_type type);

enum class keyword {
    let,
    lambda,
};

struct token {
    token_type type;
    location loc;
    // Identifier name or keyword spelling; empty for markers and literals.
    std::string text;
    keyword kw{keyword::let};
    literal value{nullptr};

    static token start_stmt(location loc) { return {token_type::start_stmt, std::move(loc)}; }
    static token end_stmt(location loc) { return {token_type::end_stmt, std::move(loc)}; }
    static token identifier(std::string name, location loc);
    static token from_keyword(keyword kw, std::string spelling, location loc);
    static token from_literal(literal value, location loc);

    std::string to_string() const;
};

// Classifies a flushed (non-string) buffer: keyword, integer, float, nil,
// otherwise identifier.
token classify_token(std::string text, location loc);

// Converts source text to a flat token sequence.
// Scans line by line in one of three modes (normal, in a string, in a block
// comment) with one character of lookback for the two-character delimiters
// `//`, `{*` and `*}`. A `$` opens an implicit statement that is closed by the
// next `)` or the end of input.
class lexer {
public:
    lexer(std::string_view source, std::string filename);

    // Throws pale_error carrying every lexical error found.
    std::vector<token> tokenize();

private:
    enum class mode {
        normal,
        in_string,
        in_comment,
    };

    std::string_view source_;
    std::string filename_;

    std::vector<token> tokens_;
    std::string buffer_;
    location buffer_start_;
    mode mode_{mode::normal};
    char32_t last_{U'\n'};
    size_t pending_wraps_{0};
    location string_start_;
    location comment_start_;
    diagnostics errors_;

    location at(size_t line, size_t column) const { return {filename_, line, column}; }

    void scan_line(std::u32string_view line, size_t line_number);
    void scan_normal(char32_t ch, const location& loc);
    void append(char32_t ch, const location& loc);
    void flush();
    void push_string();
    void start_stmt(const location& loc);
    void end_stmt(const location& loc);
    void close_wraps(const location& loc);
};

// Convenience wrapper around lexer.
std::vector<token> tokenize(std::string_view source, const std::string& filename);
