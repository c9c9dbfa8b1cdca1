#include <algorithm>
#include <cstddef>
#include <format>
#include <iterator>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "debug.hpp"
#include "parser.hpp"

namespace {

    var literal_to_var(const literal& lit)
    {
        return std::visit([](const auto& v) { return var::make(v); }, lit);
    }

    [[noreturn]] void unknown_identifier(const token& tok)
    {
        throw pale_error(diagnostics{}
            .error(tok.loc, std::format("Unknown identifier `{}`!", tok.text)));
    }

    // Names a binding list introduces: bare names at the top of the list and
    // the first identifier of each parenthesized slot.
    std::set<std::string> binding_names(std::span<const token> list)
    {
        std::set<std::string> names;
        size_t level = 0;
        for (size_t i = 0; i < list.size(); ++i) {
            switch (list[i].type) {
                case token_type::start_stmt:
                    ++level;
                    if (1 == level and i + 1 < list.size()
                        and token_type::identifier == list[i + 1].type) {
                        names.insert(list[i + 1].text);
                    }
                    break;
                case token_type::end_stmt:
                    if (level > 0) --level;
                    break;
                case token_type::identifier:
                    if (0 == level) names.insert(list[i].text);
                    break;
                default:
                    break;
            }
        }
        return names;
    }

} // anonymous namespace

statement make_ast(std::span<const token> tokens, scope& idents,
    const location& start, size_t max_depth)
{
    ast_parser p(tokens, idents, start, 1, max_depth);
    return p.parse();
}

ast_parser::ast_parser(std::span<const token> tokens, scope& idents,
    location start, size_t depth, size_t max_depth)
    : ts(tokens), idents(idents), start(std::move(start)), depth(depth), max_depth(max_depth) {}

bool ast_parser::is_wrapped() const
{
    if (ts.size() < 2 or token_type::start_stmt != ts.front().type) return false;
    size_t level = 0;
    for (size_t i = 0; i < ts.size(); ++i) {
        if (token_type::start_stmt == ts[i].type) {
            ++level;
        } else if (token_type::end_stmt == ts[i].type) {
            if (0 == level) return false;
            if (0 == --level) return ts.size() - 1 == i;
        }
    }
    return false;
}

statement ast_parser::parse()
{
    if (depth > max_depth) {
        throw pale_error(diagnostics{}
            .error(start, "Statements are nested too deeply!")
            .note(std::format("The limit is {} levels.", max_depth)));
    }

    size_t first = 0;
    size_t last = ts.size();
    if (is_wrapped()) {
        ++first;
        --last;
    }
    if (first >= last) {
        throw pale_error(diagnostics{}
            .error(start, "Empty statements are not allowed!")
            .note("Put an operator and its arguments inside it, or delete it."));
    }

    PALE_DEBUG(parse, "Parsing {} token(s) at depth {} from {}", last - first, depth, start.to_string());

    for (size_t i = first; i < last; ++i) {
        if (status::bindings == state) {
            on_binding(i);
        } else {
            on_argument(i);
        }
    }

    if (status::bindings == state) {
        const token& let = ts[let_index];
        throw pale_error(diagnostics{}
            .error(let.loc, "The binding list of this `let` is never closed!")
            .note("Add a closing `)`."));
    }
    if (not open_parens.empty()) {
        throw pale_error(diagnostics{}
            .error(ts[open_parens.back()].loc, "Unmatched opening parentheses!")
            .note("Deleting it might fix this error."));
    }

    return finish();
}

void ast_parser::on_argument(size_t index)
{
    const token& tok = ts[index];

    switch (tok.type) {
        case token_type::start_stmt:
            open_parens.push_back(index);
            return;

        case token_type::end_stmt: {
            if (open_parens.empty()) {
                throw pale_error(diagnostics{}
                    .error(tok.loc, "Unmatched closing parentheses!")
                    .note("Delete it."));
            }
            size_t open = open_parens.back();
            open_parens.pop_back();
            if (open_parens.empty()) {
                args.push_back(parse_nested(open, index));
            }
            return;
        }

        default:
            break;
    }

    // Anything inside a nested statement is left for its own parser.
    if (not open_parens.empty()) return;

    switch (tok.type) {
        case token_type::keyword:
            if (keyword::lambda == tok.kw) {
                throw pale_error(diagnostics{}
                    .error(tok.loc, "`lambda` is not implemented yet!")
                    .note("Functions can't be defined in source code yet."));
            }
            state = status::bindings;
            let_index = index;
            break;

        case token_type::literal:
            if (not op_loc) op_loc = tok.loc;
            args.push_back(literal_to_var(tok.value));
            break;

        case token_type::identifier: {
            auto handle = idents.lookup(tok.text);
            if (not handle) unknown_identifier(tok);
            if (not op_loc) op_loc = tok.loc;
            args.push_back(handle->new_ref());
            break;
        }

        default:
            throw internal_error(std::format("Unexpected {}", tok.to_string()));
    }
}

void ast_parser::on_binding(size_t index)
{
    const token& tok = ts[index];

    switch (tok.type) {
        case token_type::start_stmt:
            binding_parens.push_back(index);
            return;

        case token_type::end_stmt: {
            if (binding_parens.empty()) {
                throw pale_error(diagnostics{}
                    .error(tok.loc, "Unmatched closing parentheses!")
                    .note("Delete it."));
            }
            binding_parens.pop_back();
            if (binding_parens.empty()) {
                // The list sits between `let (` and this `)`.
                size_t list_start = let_index + 2;
                introduce(collect_bindings(ts.subspan(list_start, index - list_start)));
                state = status::arguments;
            }
            return;
        }

        default:
            break;
    }

    if (binding_parens.empty()) {
        throw pale_error(diagnostics{}
            .error(tok.loc, "Expected a list of bindings after `let`!")
            .note(ts[let_index].loc, "Write it as `(let ((name value) ...) ...)`."));
    }
}

var ast_parser::parse_nested(size_t open, size_t close)
{
    ast_parser nested(ts.subspan(open, close - open + 1), idents, ts[open].loc, depth + 1, max_depth);
    return var::make(nested.parse());
}

std::vector<ast_parser::binding> ast_parser::collect_bindings(std::span<const token> list) const
{
    struct slot {
        location open;
        std::optional<std::string> name;
        location name_loc;
        bool has_value{false};
    };

    auto siblings = binding_names(list);
    std::vector<binding> found;
    std::optional<slot> current;

    for (const auto& tok : list) {
        switch (tok.type) {
            case token_type::keyword:
                throw pale_error(diagnostics{}
                    .error(tok.loc, "Keywords are not allowed in variable assignments!"));

            case token_type::start_stmt:
                if (not current) {
                    current = slot{tok.loc};
                    break;
                }
                if (not current->name) {
                    throw pale_error(diagnostics{}
                        .error(tok.loc, "Variable names must be literals!"));
                }
                if (not current->has_value) {
                    throw pale_error(diagnostics{}
                        .error(tok.loc, "Variables must be literals or other values (not expressions)!"));
                }
                throw pale_error(diagnostics{}
                    .error(tok.loc, "Unknown opening parenthesis.")
                    .note(tok.loc, "Delete it."));

            case token_type::end_stmt:
                if (not current) {
                    throw internal_error(std::format("Unbalanced binding list at {}", tok.loc.to_string()));
                }
                if (not current->name) {
                    throw pale_error(diagnostics{}
                        .error(current->open, "Empty binding.")
                        .note(current->open, "Delete it."));
                }
                if (not current->has_value) {
                    throw pale_error(diagnostics{}
                        .error(current->open, "Variable defined in parentheses must have an initial value.")
                        .note(current->open, "Remove the parentheses around it."));
                }
                current.reset();
                break;

            case token_type::identifier:
                if (not current) {
                    // A bare name is bound to nil.
                    found.push_back({tok.text, std::nullopt, tok.loc});
                    break;
                }
                if (not current->name) {
                    current->name = tok.text;
                    current->name_loc = tok.loc;
                    break;
                }
                if (current->has_value) {
                    throw pale_error(diagnostics{}
                        .error(current->open, "Identifier not allowed here!")
                        .note(tok.loc, "Remove it."));
                }
                if (siblings.contains(tok.text)) {
                    throw pale_error(diagnostics{}
                        .error(tok.loc, "Making a variable depend upon another in the statement is not currently implemented!")
                        .note("Bind it in an enclosing `let` instead."));
                }
                if (auto handle = idents.lookup(tok.text)) {
                    found.push_back({*current->name, handle->new_ref(), current->name_loc});
                    current->has_value = true;
                    break;
                }
                unknown_identifier(tok);

            case token_type::literal:
                if (not current) {
                    throw pale_error(diagnostics{}
                        .error(tok.loc, "Unknown literal in `let` statement.")
                        .note("Bind it to a variable name.")
                        .note(tok.loc, "Delete it."));
                }
                if (not current->name) {
                    throw pale_error(diagnostics{}
                        .error(tok.loc, "Cannot assign to literal value!"));
                }
                if (current->has_value) {
                    throw pale_error(diagnostics{}
                        .error(current->open, "Literal not allowed here!")
                        .note(tok.loc, "Remove it."));
                }
                found.push_back({*current->name, literal_to_var(tok.value), current->name_loc});
                current->has_value = true;
                break;
        }
    }
    return found;
}

void ast_parser::introduce(std::vector<binding> bindings)
{
    // Check everything first so a failed `let` binds nothing.
    std::set<std::string> seen;
    for (const auto& b : bindings) {
        if (idents.contains(b.name) or not seen.insert(b.name).second) {
            throw pale_error(diagnostics{}
                .error(b.loc, "Shadowing is not currently allowed!")
                .note("Change its name."));
        }
    }

    for (auto& b : bindings) {
        PALE_DEBUG(parse, "Binding `{}` at {}", b.name, b.loc.to_string());
        if (not idents.insert(b.name, b.value? std::move(*b.value): var::nil())) {
            throw internal_error(std::format("`{}` was bound while introducing it", b.name));
        }
    }
}

statement ast_parser::finish()
{
    if (args.empty()) raw_list_error();

    if (args.front()->is_func()) {
        var op = args.front();
        std::vector<var> rest(std::make_move_iterator(args.begin() + 1), std::make_move_iterator(args.end()));
        return statement(std::move(op), std::move(rest), op_loc.value_or(start));
    }

    // A statement wrapped in extra parentheses is the statement itself.
    if (1 == args.size() and args.front()->is_statement()) {
        return std::get<statement>(std::move(args.front()->data));
    }

    raw_list_error();
}

void ast_parser::raw_list_error() const
{
    throw pale_error(diagnostics{}
        .error(start, "Raw lists are not available (Yet...)!")
        .note("This is not a function."));
}
