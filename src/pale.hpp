#pragma once

#include <cstddef>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "diagnostics.hpp"
#include "lexer.hpp"

// Forward declarations
struct value;
class callable;

// A shared, mutable handle to exactly one runtime value. Copying a var (or
// calling new_ref) aliases the same cell; writes through one alias are seen
// by all of them. Use maybe_clone for an independent copy.
class var {
    std::shared_ptr<value> cell;

    explicit var(std::shared_ptr<value> c): cell(std::move(c)) {}

public:
    template<typename T>
    static var make(T&& v);

    static var nil();

    // Another handle to the same cell. Nothing is copied.
    var new_ref() const { return var(cell); }

    // A new cell holding a copy of this one's contents. Throws
    // internal_error for statements and for callables that can't be copied.
    var maybe_clone() const;

    value& get() const;
    value* operator->() const { return cell.get(); }

    // Forces a statement into a concrete value (memoized), follows aliases,
    // and returns any other value as a new reference to itself.
    var resolve() const;

    bool same_cell(const var& that) const { return cell == that.cell; }
};

// An unevaluated expression: an operator, its argument handles and a
// memoized result. Built only by the parser, which guarantees the operator
// holds a callable.
class statement {
    std::vector<var> args_;
    var op_;
    mutable std::optional<var> result_;
    location loc_;

public:
    statement(var op, std::vector<var> args, location loc);

    // Invokes the operator on first use and caches the result. Later calls
    // return a handle to the same cached cell without recomputing.
    var resolve() const;

    // Drops the cached result of this statement and of every statement
    // nested directly in its arguments.
    void forget() const;

    bool is_resolved() const { return result_.has_value(); }
    const location& loc() const { return loc_; }

    // Multi-line tree dump used by --dump and debug output.
    std::string to_tree(size_t indent = 0) const;
};

// Callables are invoked with their unevaluated argument handles and the
// location of the call.
class callable {
public:
    virtual ~callable() = default;
    virtual var call(const std::vector<var>& args, const location& loc_called) const = 0;
    // An independent copy, or nullptr if this callable can't be copied.
    virtual std::unique_ptr<callable> try_clone() const { return nullptr; }
    virtual std::string debug_info() const;
};

enum class intrinsic_op {
    add,
    subtract,
    multiply,
    print,
};

// The built-in operations. Arithmetic works on integers only; print writes
// the display form of its single argument to an output stream.
class intrinsic final: public callable {
    intrinsic_op op;
    std::ostream* out;

public:
    explicit intrinsic(intrinsic_op o, std::ostream& os = std::cout): op(o), out(&os) {}

    var call(const std::vector<var>& args, const location& loc_called) const override;
    std::unique_ptr<callable> try_clone() const override;
    std::string debug_info() const override;
};

std::string intrinsic_symbol(intrinsic_op op);

// A function over a fixed set of parameter cells. The body was parsed with
// the parameters in scope, so it reads whatever the parameter cells hold.
// The cells are reused by every call: calls are not reentrant.
class user_function final: public callable {
    std::vector<var> params;
    statement body;
    // Set while the body runs. The parameter cells can only hold one call.
    mutable bool active{false};

public:
    user_function(std::vector<var> p, statement b): params(std::move(p)), body(std::move(b)) {}

    var call(const std::vector<var>& args, const location& loc_called) const override;
    std::string debug_info() const override;
    size_t arity() const { return params.size(); }
};

// A handle wrapping another handle. Parameter cells hold these so that
// reading a parameter reads the caller's argument.
struct alias {
    var target;
};

struct list {
    std::vector<var> items;
};

using func = std::unique_ptr<callable>;

// Used for floating point equality.
inline constexpr double floating_epsilon = 0.001;

struct value {
    using variant_type = std::variant<
        integer,
        double,
        std::string,
        std::nullptr_t, // nil
        list,
        func,
        statement,
        alias
    >;
    variant_type data;

    template<typename T>
        requires std::is_constructible_v<variant_type, T>
    value(T&& t): data(std::forward<T>(t)) {}

    bool is_func() const { return std::holds_alternative<func>(data); }
    bool is_statement() const { return std::holds_alternative<statement>(data); }

    // Throws internal_error if this isn't a callable.
    const callable& as_func() const;

    friend bool operator==(const value& lhs, const value& rhs);
};

inline value& var::get() const { return *cell; }

template<typename T>
var var::make(T&& v)
{
    return var(std::make_shared<value>(std::forward<T>(v)));
}

// The display form: numbers as literals, strings raw, nil as "nil", lists as
// "(a b c)", functions as "<Function>". Statements are resolved first.
std::string value_to_string(const value& v);
std::string value_to_string(const var& v);

// Like value_to_string but never evaluates anything. Used for logging.
std::string describe(const value& v);

std::string value_type_string(const value& v);

// Identifier name to handle. Names are unique: insert refuses to rebind.
class scope {
    std::map<std::string, var, std::less<>> vars;
    std::ostream* out;

public:
    // Seeded with the intrinsics print, +, - and *.
    explicit scope(std::ostream& os = std::cout);

    std::optional<var> lookup(std::string_view name) const;
    bool contains(std::string_view name) const { return vars.contains(name); }
    // Returns false (and changes nothing) if name is already bound.
    bool insert(const std::string& name, var handle);
    std::vector<std::string> names() const;
    std::ostream& output() const { return *out; }
};

// How deeply statements may nest before the parser gives up.
inline constexpr size_t default_max_depth = 256;

struct run_options {
    // Print the tokens and the statement tree before evaluating.
    bool dump{false};
    size_t max_depth{default_max_depth};
};

// Parses and evaluates source as one statement in a fresh default scope.
// Returns the display form of the result; throws pale_error.
std::string run_lisp(std::string_view source, const std::string& source_name);

// As above, but in the given scope, which keeps any `let` bindings.
std::string run_lisp(std::string_view source, const std::string& source_name,
    scope& idents, const run_options& options = {});

// Deepest statement nesting reached by evaluation since the last reset.
void   eval_reset_max_depth();
size_t eval_get_max_depth();
