#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "diagnostics.hpp"
#include "lexer.hpp"
#include "pale.hpp"

// Builds the statement tree for one top-level statement. Identifiers are
// resolved against idents while parsing, and `let` bindings are inserted into
// it. start is where the token sequence begins and is used for errors that
// have no better location. Throws pale_error.
statement make_ast(std::span<const token> tokens, scope& idents,
    const location& start, size_t max_depth = default_max_depth);

// Parses the tokens of one statement. Nested statements are handed to a new
// parser one level deeper when their closing parenthesis is reached, so a
// `let` earlier in a statement is visible to everything after it.
class ast_parser {
public:
    ast_parser(std::span<const token> tokens, scope& idents,
        location start, size_t depth, size_t max_depth);

    statement parse();

private:
    enum class status {
        arguments,
        bindings,
    };

    struct binding {
        std::string name;
        std::optional<var> value;
        location loc;
    };

    std::span<const token> ts;
    scope& idents;
    location start;
    size_t depth;
    size_t max_depth;

    status state{status::arguments};
    std::vector<size_t> open_parens;
    std::vector<var> args;
    std::optional<location> op_loc;
    size_t let_index{0};
    std::vector<size_t> binding_parens;

    bool is_wrapped() const;
    void on_argument(size_t index);
    void on_binding(size_t index);
    var parse_nested(size_t open, size_t close);
    std::vector<binding> collect_bindings(std::span<const token> list) const;
    void introduce(std::vector<binding> bindings);
    statement finish();
    [[noreturn]] void raw_list_error() const;
};
