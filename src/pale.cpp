// Value model, callables and scope of the pale interpreter.

#include <cmath>
#include <format>
#include <memory>
#include <optional>
#include <ostream>
#include <print>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "debug.hpp"
#include "pale.hpp"
#include "parser.hpp"
#include "utils.hpp"

var var::nil() { return var::make(nullptr); }

var var::maybe_clone() const
{
    return std::visit([&](const auto& v) -> var {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, func>) {
            auto copy = v->try_clone();
            if (not copy) {
                throw internal_error(std::format(
                    "Tried to clone a function that can't be copied ({})", v->debug_info()));
            }
            return var::make(std::move(copy));
        } else if constexpr (std::is_same_v<T, statement>) {
            throw internal_error(std::format(
                "Tried to clone the statement at {}", v.loc().to_string()));
        } else if constexpr (std::is_same_v<T, list>) {
            list copy;
            for (const auto& item : v.items) {
                copy.items.push_back(item.maybe_clone());
            }
            return var::make(std::move(copy));
        } else if constexpr (std::is_same_v<T, alias>) {
            return v.target.maybe_clone();
        } else {
            return var::make(T(v));
        }
    }, cell->data);
}

const callable& value::as_func() const
{
    if (not is_func()) {
        throw internal_error(std::format("Expected a function but found {} `{}`",
            value_type_string(*this), describe(*this)));
    }
    return *std::get<func>(data);
}

bool operator==(const value& lhs, const value& rhs)
{
    // Aliases compare as whatever they point at.
    if (auto* a = std::get_if<alias>(&lhs.data)) return a->target.get() == rhs;
    if (auto* a = std::get_if<alias>(&rhs.data)) return lhs == a->target.get();

    return std::visit([](const auto& l, const auto& r) -> bool {
        using L = std::decay_t<decltype(l)>;
        using R = std::decay_t<decltype(r)>;

        if constexpr (not std::is_same_v<L, R>) {
            return false;
        } else if constexpr (std::is_same_v<L, double>) {
            return std::fabs(l - r) < floating_epsilon;
        } else if constexpr (std::is_same_v<L, std::nullptr_t>) {
            return true;
        } else if constexpr (std::is_same_v<L, func>) {
            return false;
        } else if constexpr (std::is_same_v<L, statement>) {
            return &l == &r;
        } else if constexpr (std::is_same_v<L, list>) {
            if (l.items.size() != r.items.size()) return false;
            for (auto [a, b] : std::views::zip(l.items, r.items)) {
                if (not (a.get() == b.get())) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<L, alias>) {
            return l.target.get() == r.target.get();
        } else {
            return l == r;
        }
    }, lhs.data, rhs.data);
}

namespace {

    std::string join_items(const list& l, auto&& show)
    {
        std::string result = "(";
        for (const auto& [index, item] : l.items | std::views::enumerate) {
            if (index > 0) result += ' ';
            result += show(item.get());
        }
        result += ')';
        return result;
    }

} // anonymous namespace

std::string value_to_string(const value& v)
{
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, integer>) {
            return x.str();
        } else if constexpr (std::is_same_v<T, double>) {
            return std::format("{}", x);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "nil";
        } else if constexpr (std::is_same_v<T, list>) {
            return join_items(x, [](const value& item) { return value_to_string(item); });
        } else if constexpr (std::is_same_v<T, func>) {
            return "<Function>";
        } else if constexpr (std::is_same_v<T, statement>) {
            return value_to_string(x.resolve());
        } else {
            return value_to_string(x.target);
        }
    }, v.data);
}

std::string value_to_string(const var& v) { return value_to_string(v.get()); }

std::string describe(const value& v)
{
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, std::string>) {
            return std::format("\"{}\"", x);
        } else if constexpr (std::is_same_v<T, list>) {
            return join_items(x, [](const value& item) { return describe(item); });
        } else if constexpr (std::is_same_v<T, func>) {
            return std::format("<{}>", x->debug_info());
        } else if constexpr (std::is_same_v<T, statement>) {
            return std::format("<statement at {}>", x.loc().to_string());
        } else if constexpr (std::is_same_v<T, alias>) {
            return "&" + describe(x.target.get());
        } else {
            return value_to_string(x);
        }
    }, v.data);
}

std::string value_type_string(const value& v)
{
    struct type_visitor {
        std::string operator()(const integer&) const { return "Integer"; }
        std::string operator()(double) const { return "Floating"; }
        std::string operator()(const std::string&) const { return "String"; }
        std::string operator()(std::nullptr_t) const { return "Nil"; }
        std::string operator()(const list&) const { return "List"; }
        std::string operator()(const func&) const { return "Func"; }
        std::string operator()(const statement&) const { return "Statement"; }
        std::string operator()(const alias&) const { return "Alias"; }
    };
    return std::visit(type_visitor{}, v.data);
}

std::string statement::to_tree(size_t indent) const
{
    std::string pad(indent * 2, ' ');
    std::string result = std::format("{}Statement at {}\n", pad, loc_.to_string());
    result += std::format("{}  op: {}\n", pad, describe(op_.get()));
    for (const auto& arg : args_) {
        if (auto* s = std::get_if<statement>(&arg->data)) {
            result += s->to_tree(indent + 1);
        } else {
            result += std::format("{}  {} {}\n", pad, value_type_string(arg.get()), describe(arg.get()));
        }
    }
    return result;
}

std::string callable::debug_info() const
{
    return demangle(typeid(*this));
}

std::string intrinsic_symbol(intrinsic_op op)
{
    switch (op) {
        case intrinsic_op::add: return "+";
        case intrinsic_op::subtract: return "-";
        case intrinsic_op::multiply: return "*";
        case intrinsic_op::print: return "print";
    }
    throw internal_error("Unknown intrinsic operation");
}

namespace {

    // Marks a user function as running for the lifetime of the guard.
    struct active_call {
        bool& flag;
        explicit active_call(bool& f): flag(f) { flag = true; }
        ~active_call() { flag = false; }
        active_call(const active_call&) = delete;
        active_call& operator=(const active_call&) = delete;
    };

    std::string operation_name(intrinsic_op op)
    {
        switch (op) {
            case intrinsic_op::add: return "addition";
            case intrinsic_op::subtract: return "subtraction";
            case intrinsic_op::multiply: return "multiplication";
            case intrinsic_op::print: return "printing";
        }
        throw internal_error("Unknown intrinsic operation");
    }

    var arithmetic(intrinsic_op op, const std::vector<var>& args, const location& loc_called)
    {
        auto symbol = intrinsic_symbol(op);
        if (args.size() < 2) {
            throw pale_error(diagnostics{}
                .error(loc_called, std::format("`{}` ({}) requires at least two arguments!",
                    symbol, operation_name(op)))
                .note(std::format("It was given {}.", args.size())));
        }

        integer acc;
        for (const auto& [index, arg] : args | std::views::enumerate) {
            var resolved = arg.resolve();
            auto* n = std::get_if<integer>(&resolved->data);
            if (not n) {
                throw pale_error(diagnostics{}
                    .error(loc_called, std::format("Incompatible types for `{}` ({}): Integer and {} `{}`!",
                        symbol, operation_name(op), value_type_string(resolved.get()),
                        value_to_string(resolved)))
                    .note(std::format("Argument {} is not an Integer.", index + 1)));
            }
            if (0 == index) {
                acc = *n;
                continue;
            }
            switch (op) {
                case intrinsic_op::add: acc += *n; break;
                case intrinsic_op::subtract: acc -= *n; break;
                case intrinsic_op::multiply: acc *= *n; break;
                case intrinsic_op::print: throw internal_error("print is not arithmetic");
            }
        }
        return var::make(std::move(acc));
    }

} // anonymous namespace

var intrinsic::call(const std::vector<var>& args, const location& loc_called) const
{
    PALE_DEBUG(call, "Calling `{}` with {} argument(s) at {}",
        intrinsic_symbol(op), args.size(), loc_called.to_string());

    if (intrinsic_op::print != op) {
        return arithmetic(op, args, loc_called);
    }

    if (args.size() != 1) {
        throw pale_error(diagnostics{}
            .error(loc_called, "Print intrinsic requires only one argument!")
            .note("Try wrapping this in a statement with `$`."));
    }
    var resolved = args.front().resolve();
    std::println(*out, "{}", value_to_string(resolved));
    return var::make(integer(0));
}

std::unique_ptr<callable> intrinsic::try_clone() const
{
    return std::make_unique<intrinsic>(*this);
}

std::string intrinsic::debug_info() const
{
    return std::format("intrinsic {}", intrinsic_symbol(op));
}

var user_function::call(const std::vector<var>& args, const location& loc_called) const
{
    PALE_DEBUG(call, "Calling user function of {} parameter(s) with {} argument(s) at {}",
        arity(), args.size(), loc_called.to_string());

    if (active) {
        throw pale_error(diagnostics{}
            .error(loc_called, "Recursive calls are not supported!")
            .note("This function is already running, and its parameters can only hold one call."));
    }
    if (args.size() < arity()) {
        throw pale_error(diagnostics{}
            .error(loc_called, "Insufficient arguments provided!")
            .note(std::format("Expected {} but got {}.", arity(), args.size())));
    }
    if (args.size() > arity()) {
        throw pale_error(diagnostics{}
            .error(loc_called, "Too many arguments provided!")
            .note(std::format("Expected {} but got {}.", arity(), args.size()))
            .note("Delete them."));
    }

    for (auto [param, arg] : std::views::zip(params, args)) {
        // A parameter passed to itself already holds what it should.
        if (param.same_cell(arg)) continue;
        param->data = alias{arg.new_ref()};
    }

    // The parameter cells changed, so nothing the body cached is valid.
    body.forget();
    active_call running(active);
    try {
        return body.resolve();
    } catch (const pale_error& e) {
        diagnostics call_site;
        call_site.error(loc_called, "Error in the body of the function called here.");
        diagnostics diag = e.diag();
        diag.extend(std::move(call_site));
        throw pale_error(std::move(diag));
    }
}

std::string user_function::debug_info() const
{
    return std::format("user function/{} defined at {}", arity(), body.loc().to_string());
}

scope::scope(std::ostream& os): out(&os)
{
    for (auto op : {intrinsic_op::print, intrinsic_op::add, intrinsic_op::subtract, intrinsic_op::multiply}) {
        vars.emplace(intrinsic_symbol(op), var::make(func(std::make_unique<intrinsic>(op, os))));
    }
}

std::optional<var> scope::lookup(std::string_view name) const
{
    auto it = vars.find(name);
    if (vars.end() == it) return std::nullopt;
    return it->second.new_ref();
}

bool scope::insert(const std::string& name, var handle)
{
    auto [it, inserted] = vars.try_emplace(name, std::move(handle));
    if (inserted) {
        PALE_DEBUG(scope, "Bound `{}` to {}", name, describe(it->second.get()));
    } else {
        PALE_DEBUG(scope, "Refused to rebind `{}`", name);
    }
    return inserted;
}

std::vector<std::string> scope::names() const
{
    return vars | std::views::keys | std::ranges::to<std::vector<std::string>>();
}

std::string run_lisp(std::string_view source, const std::string& source_name)
{
    scope idents;
    return run_lisp(source, source_name, idents);
}

std::string run_lisp(std::string_view source, const std::string& source_name,
    scope& idents, const run_options& options)
{
    auto tokens = tokenize(source, source_name);
    if (options.dump) {
        for (const auto& tok : tokens) {
            std::println(idents.output(), "{}", tok.to_string());
        }
    }

    statement ast = make_ast(tokens, idents, location{source_name, 1, 1}, options.max_depth);
    if (options.dump) {
        std::print(idents.output(), "{}", ast.to_tree());
    }

    return value_to_string(ast.resolve());
}
