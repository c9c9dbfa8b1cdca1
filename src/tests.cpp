#include <exception>
#include <format>
#include <memory>
#include <print>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "config.hpp"
#include "debug.hpp"
#include "diagnostics.hpp"
#include "lexer.hpp"
#include "pale.hpp"
#include "parser.hpp"
#include "repl.hpp"
#include "tests.hpp"
#include "unicode.hpp"
#include "utils.hpp"

namespace {

// Helper for running tests. Everything runs in one scope, so `let` bindings
// from earlier inputs are visible to later ones until reset.
struct test_runner {
    std::ostringstream out;
    scope idents{out};
    int failures = 0;

    bool test_eval(const std::string& input, const std::string& expected_output);
    bool test_output(const std::string& input, const std::string& expected_printed);
    bool test_error(const std::string& input, const std::string& expected_error_substring);
    bool check(bool ok, std::string_view description);

    void reset()
    {
        idents = scope(out);
        out.str("");
    }
};

bool test_runner::test_eval(const std::string& input, const std::string& expected_output)
{
    try {
        auto actual_output = run_lisp(input, "test", idents);
        if (actual_output == expected_output) {
            std::println("✓ {} => {}", input, actual_output);
            return true;
        } else {
            println_red("✗ {}: expected {}, got {}", input, expected_output, actual_output);
            failures++;
            return false;
        }
    } catch (const std::exception& e) {
        println_red("✗ {}: threw exception: {}", input, e.what());
        failures++;
        return false;
    }
}

bool test_runner::test_output(const std::string& input, const std::string& expected_printed)
{
    out.str("");
    try {
        run_lisp(input, "test", idents);
    } catch (const std::exception& e) {
        println_red("✗ {}: threw exception: {}", input, e.what());
        failures++;
        return false;
    }
    if (out.str() == expected_printed) {
        std::println("✓ {} printed '{}'", input, out.str());
        return true;
    }
    println_red("✗ {}: expected to print '{}', printed '{}'", input, expected_printed, out.str());
    failures++;
    return false;
}

bool test_runner::test_error(const std::string& input, const std::string& expected_error_substring)
{
    try {
        auto result = run_lisp(input, "test", idents);
        println_red("✗ {}: expected error containing '{}', but got result: {}",
                    input, expected_error_substring, result);
        failures++;
        return false;
    } catch (const std::exception& e) {
        std::string error_msg = e.what();
        if (error_msg.find(expected_error_substring) != std::string::npos) {
            std::println("✓ {}: correctly threw error containing '{}'", input, expected_error_substring);
            return true;
        } else {
            println_red("✗ {}: expected error containing '{}', got '{}'",
                        input, expected_error_substring, error_msg);
            failures++;
            return false;
        }
    }
}

bool test_runner::check(bool ok, std::string_view description)
{
    if (ok) {
        std::println("✓ {}", description);
        return true;
    }
    println_red("✗ {}", description);
    failures++;
    return false;
}

// Not cloneable, and relies on the default debug_info.
class constant_callable final: public callable {
public:
    var call(const std::vector<var>&, const location&) const override
    {
        return var::make(integer(7));
    }
};

int test_diagnostics()
{
    std::println("\n--- Diagnostics ---");
    test_runner runner;

    diagnostics d;
    d.note("dropped");
    d.error(location{"f", 2, 3}, "Bad thing!")
        .note("Fix it.")
        .note(location{"f", 2, 4}, "Here.");
    runner.check(d.size() == 1, "note with no error is dropped");
    runner.check(d.to_string() == "f:2:3 - Bad thing!\n\tNOTE: Fix it.\n\tNOTE: f:2:4 - Here.",
        "error and notes render in order");

    diagnostics more;
    more.error(location{"g", 1, 1}, "Second!");
    d.extend(more);
    runner.check(d.size() == 2 and d.to_string().ends_with("\ng:1:1 - Second!"), "extend appends entries");

    try {
        throw pale_error(d);
    } catch (const pale_error& e) {
        runner.check(e.what() == d.to_string(), "pale_error what() is the rendered diagnostics");
        runner.check(e.diag().size() == 2, "pale_error keeps the entries");
    }

    internal_error bug("broken invariant");
    runner.check(std::string(bug.what()).find("this is a bug in pale") != std::string::npos,
        "internal errors say they are bugs");

    return runner.failures;
}

int test_unicode()
{
    std::println("\n--- UTF-8 decoding ---");
    test_runner runner;

    runner.check(decode_utf8("A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80") == U"Aé€😀", "decodes 1 to 4 byte sequences");
    runner.check(decode_utf8("").empty(), "empty input");

    auto rejects = [&](std::string_view bytes, std::string_view fragment, std::string_view what) {
        try {
            decode_utf8(bytes);
            runner.check(false, what);
        } catch (const std::invalid_argument& e) {
            runner.check(std::string_view(e.what()).find(fragment) != std::string_view::npos, what);
        }
    };
    rejects("\x80", "unexpected byte 0x80", "rejects a stray continuation byte");
    rejects("ab\xC3", "at byte 2: truncated", "rejects a truncated sequence");
    rejects("\xC0\x80", "overlong", "rejects an overlong encoding");
    rejects("\xED\xA0\x80", "surrogate", "rejects an encoded surrogate");
    rejects("\xC3\x20", "continuation", "rejects a bad continuation byte");

    std::string encoded;
    append_utf8(encoded, U'é');
    append_utf8(encoded, U'😀');
    runner.check(encoded == "\xC3\xA9\xF0\x9F\x98\x80", "encodes code points");
    try {
        append_utf8(encoded, 0xD800);
        runner.check(false, "refuses to encode a surrogate");
    } catch (const std::invalid_argument&) {
        runner.check(true, "refuses to encode a surrogate");
    }

    return runner.failures;
}

int test_lexer_tokens()
{
    std::println("\n--- Lexer tokens ---");
    test_runner runner;

    auto tokens = tokenize(R"RAW((+ (- 1 23 23423423) "sliijioo"))RAW", "test");
    for (const auto& tok : tokens) {
        std::println("{}", tok.to_string());
    }

    struct expected {
        token_type type;
        size_t column;
        std::string shown;
    };
    std::vector<expected> want{
        {token_type::start_stmt, 1, ""},
        {token_type::identifier, 2, "+"},
        {token_type::start_stmt, 4, ""},
        {token_type::identifier, 5, "-"},
        {token_type::literal, 7, "1"},
        {token_type::literal, 9, "23"},
        {token_type::literal, 12, "23423423"},
        {token_type::end_stmt, 20, ""},
        {token_type::literal, 22, "\"sliijioo\""},
        {token_type::end_stmt, 32, ""},
    };

    bool same = tokens.size() == want.size();
    for (size_t i = 0; same and i < want.size(); ++i) {
        const auto& tok = tokens[i];
        std::string shown = token_type::literal == tok.type? literal_to_string(tok.value): tok.text;
        same = tok.type == want[i].type and tok.loc == location{"test", 1, want[i].column}
            and shown == want[i].shown;
    }
    runner.check(same, "exact token sequence with 1-based columns");

    runner.check(std::holds_alternative<integer>(tokens[6].value)
        and std::get<integer>(tokens[6].value) == 23423423, "integer literal value");

    auto multi = tokenize("\"é\" x\n  (y)", "test");
    runner.check(multi.size() == 5
        and multi[1].loc == location{"test", 1, 5}
        and multi[2].loc == location{"test", 2, 3},
        "columns count code points, lines count from 1");

    auto spread = tokenize("(print \"a\nb\")", "test");
    runner.check(spread.size() == 4 and std::get<std::string>(spread[2].value) == "a\nb",
        "strings may span lines");

    return runner.failures;
}

int test_classify_token()
{
    std::println("\n--- Token classification ---");
    test_runner runner;
    location loc{"test", 1, 1};

    auto is_integer = [&](std::string text, const integer& want) {
        auto tok = classify_token(text, loc);
        runner.check(token_type::literal == tok.type and std::holds_alternative<integer>(tok.value)
            and std::get<integer>(tok.value) == want, std::format("`{}` is the integer {}", text, want.str()));
    };
    auto is_float = [&](std::string text, double want) {
        auto tok = classify_token(text, loc);
        runner.check(token_type::literal == tok.type and std::holds_alternative<double>(tok.value)
            and std::get<double>(tok.value) == want, std::format("`{}` is the float {}", text, want));
    };
    auto is_identifier = [&](std::string text) {
        auto tok = classify_token(text, loc);
        runner.check(token_type::identifier == tok.type and tok.text == text,
            std::format("`{}` is an identifier", text));
    };

    is_integer("42", 42);
    is_integer("-17", -17);
    is_integer("+5", 5);
    is_integer("007", 7);
    is_integer("0", 0);
    is_integer("123456789012345678901234567890", integer("123456789012345678901234567890"));
    is_float("3.14", 3.14);
    is_float("-0.5", -0.5);
    is_float("1e3", 1000.0);
    is_identifier("abc");
    is_identifier("inf");
    is_identifier("nan");
    is_identifier("1.2.3");
    is_identifier("-");
    is_identifier("lets");

    auto nil = classify_token("nil", loc);
    runner.check(token_type::literal == nil.type and std::holds_alternative<std::nullptr_t>(nil.value),
        "`nil` is the nil literal");

    auto let = classify_token("let", loc);
    runner.check(token_type::keyword == let.type and keyword::let == let.kw, "`let` is a keyword");
    auto lambda = classify_token("lambda", loc);
    runner.check(token_type::keyword == lambda.type and keyword::lambda == lambda.kw, "`lambda` is a keyword");

    return runner.failures;
}

int test_lexer_comments()
{
    std::println("\n--- Comments ---");
    test_runner runner;

    runner.test_eval("(+ 1 2) // (+ 3 4)", "3");
    runner.test_eval("// nothing here\n(+ 1 2)", "3");
    runner.test_eval("{* a block comment *} (+ 1 2)", "3");
    runner.test_eval("(+ 1 {* spans\nseveral\nlines *} 2)", "3");
    runner.test_eval("{*} still a comment *} (+ 3 4)", "7");
    runner.test_eval("(+ 1{*x*}2)", "3");

    auto tokens = tokenize("a//b", "test");
    runner.check(tokens.size() == 1 and "a" == tokens[0].text, "`//` ends the token before it");

    auto block = tokenize("x{*y*}z", "test");
    runner.check(block.size() == 2 and "x" == block[0].text and "z" == block[1].text,
        "`{*` ends the token before it");

    return runner.failures;
}

int test_lexer_errors()
{
    std::println("\n--- Lexical errors ---");
    test_runner runner;

    runner.test_error("(print \"abc", "test:1:8 - Unterminated string literal!");
    runner.test_error("(print \"abc", "Add a closing `\"`.");
    runner.test_error("(+ 1 2) {* abc", "test:1:9 - Unterminated block comment!");
    runner.test_error("(+ 1 2)\n\xC3", "test:2:1 - Invalid UTF-8");
    runner.test_error("(+ 1 2)\n\xC3", "Source files must be UTF-8 encoded.");

    try {
        tokenize("\xFF\n(print \"abc", "test");
        runner.check(false, "all lexical errors are reported together");
    } catch (const pale_error& e) {
        runner.check(e.diag().size() == 2, "all lexical errors are reported together");
    }

    return runner.failures;
}

int test_dollar_sugar()
{
    std::println("\n--- `$` statements ---");
    test_runner runner;

    auto tokens = tokenize("$print \"hi\"", "test");
    runner.check(tokens.size() == 4
        and token_type::start_stmt == tokens.front().type
        and token_type::end_stmt == tokens.back().type, "`$` wraps to the end of input");

    runner.test_output("$print \"hi\"", "hi\n");
    runner.test_eval("(+ 1 $* 2 3)", "7");
    runner.test_eval("$+ 1 $* 2 3", "7");
    runner.test_eval("$+ 1 2", "3");

    return runner.failures;
}

int test_arithmetic()
{
    std::println("\n--- Arithmetic ---");
    test_runner runner;

    runner.test_eval("(+ 1 2)", "3");
    runner.test_eval("(+ 1 2 3 4)", "10");
    runner.test_eval("(- 10 3)", "7");
    runner.test_eval("(- 10 3 2)", "5");
    runner.test_eval("(- 1 5)", "-4");
    runner.test_eval("(* 3 4)", "12");
    runner.test_eval("(* 2 3 4)", "24");
    runner.test_eval("(+ (* 2 3) (- 10 5))", "11");
    runner.test_eval("(* (+ 1 2) (+ 3 4))", "21");
    runner.test_eval("(* 99999999999999999999 99999999999999999999)",
        "9999999999999999999800000000000000000001");
    runner.test_eval("+ 1 2", "3");
    runner.test_eval("((+ 1 2))", "3");
    runner.test_eval("(((* 2 2)))", "4");

    runner.test_error("(+ 1)", "requires at least two arguments!");
    runner.test_error("(*)", "requires at least two arguments!");
    runner.test_error("(+ 1 \"a\")", "Incompatible types for `+` (addition): Integer and String `a`!");
    runner.test_error("(- 1 nil)", "Incompatible types for `-` (subtraction): Integer and Nil `nil`!");
    runner.test_error("(* 2 2.5)", "Incompatible types for `*` (multiplication): Integer and Floating `2.5`!");
    runner.test_error("(+ 1 print)", "Func `<Function>`");

    return runner.failures;
}

int test_print()
{
    std::println("\n--- print ---");
    test_runner runner;

    runner.test_output("(print 42)", "42\n");
    runner.test_output("(print \"hello world\")", "hello world\n");
    runner.test_output("(print nil)", "nil\n");
    runner.test_output("(print 2.5)", "2.5\n");
    runner.test_output("(print (+ 1 2))", "3\n");
    runner.test_output("(print print)", "<Function>\n");
    runner.test_output("(print \"a\nb\")", "a\nb\n");
    runner.test_eval("(print 1)", "0");
    runner.test_eval("(+ (print 1) 5)", "5");

    runner.test_error("(print 1 2)", "Print intrinsic requires only one argument!");
    runner.test_error("(print 1 2)", "Try wrapping this in a statement with `$`.");
    runner.test_error("(print)", "Print intrinsic requires only one argument!");

    return runner.failures;
}

int test_memoization()
{
    std::println("\n--- Memoization ---");
    test_runner runner;

    auto tokens = tokenize("(print \"hi\")", "test");
    statement s = make_ast(tokens, runner.idents, location{"test", 1, 1});
    runner.check(not s.is_resolved(), "statements start unresolved");

    var first = s.resolve();
    var second = s.resolve();
    runner.check(runner.out.str() == "hi\n", "resolving twice prints once");
    runner.check(first.same_cell(second), "resolving twice returns the same cell");
    runner.check(s.is_resolved(), "statement remembers its result");

    s.forget();
    runner.check(not s.is_resolved(), "forget drops the result");
    s.resolve();
    runner.check(runner.out.str() == "hi\nhi\n", "a forgotten statement runs again");

    auto nested_tokens = tokenize("(+ 1 (print 5))", "test");
    statement nested = make_ast(nested_tokens, runner.idents, location{"test", 1, 1});
    runner.out.str("");
    var sum = nested.resolve();
    runner.check(value_to_string(sum) == "1" and runner.out.str() == "5\n", "nested statement runs once");
    nested.forget();
    nested.resolve();
    runner.check(runner.out.str() == "5\n5\n", "forget reaches nested statements");

    var wrapped = var::make(std::move(nested));
    var resolved = wrapped.resolve();
    runner.check(value_to_string(resolved) == "1" and runner.out.str() == "5\n5\n",
        "resolving a handle to a resolved statement reuses the result");

    return runner.failures;
}

int test_parser_errors()
{
    std::println("\n--- Parser errors ---");
    test_runner runner;

    runner.test_error("(foo 1)", "test:1:2 - Unknown identifier `foo`!");
    runner.test_error("(+ 1 (* 2 bar))", "test:1:11 - Unknown identifier `bar`!");
    runner.test_error("(+ 1 2))", "test:1:8 - Unmatched closing parentheses!");
    runner.test_error("(+ 1 2))", "Delete it.");
    runner.test_error("(+ 1 (+ 2 3)", "test:1:1 - Unmatched opening parentheses!");
    runner.test_error("(+ 1 (+ 2 3)", "Deleting it might fix this error.");
    runner.test_error("()", "Empty statements are not allowed!");
    runner.test_error("", "test:1:1 - Empty statements are not allowed!");
    runner.test_error("// only a comment", "Empty statements are not allowed!");
    runner.test_error("(+ 1 ())", "test:1:6 - Empty statements are not allowed!");
    runner.test_error("()", "Put an operator and its arguments inside it, or delete it.");
    runner.test_error("(+ 1 ())", "Put an operator and its arguments inside it, or delete it.");
    runner.test_error("(1 2 3)", "Raw lists are not available (Yet...)!");
    runner.test_error("(1 2 3)", "This is not a function.");
    runner.test_error("((+ 1 2) 3)", "Raw lists are not available (Yet...)!");
    runner.test_error("(lambda (x) x)", "`lambda` is not implemented yet!");

    return runner.failures;
}

int test_let()
{
    std::println("\n--- let ---");
    test_runner runner;

    runner.test_eval("(let ((x 5)) (+ x 1))", "6");
    runner.test_eval("(let ((y 2) (z 3)) (* y z))", "6");
    runner.check(runner.idents.contains("x") and runner.idents.contains("z"), "bindings stay in the scope");
    runner.test_eval("(+ x z)", "8");
    runner.test_output("(let ((s \"hi\")) (print s))", "hi\n");
    runner.test_output("(let (n) (print n))", "nil\n");
    runner.test_output("(let ((p print)) (p 5))", "5\n");
    runner.test_output("(let ((w x)) (print w))", "5\n");

    auto x = runner.idents.lookup("x");
    auto w = runner.idents.lookup("w");
    runner.check(x and w and x->same_cell(*w), "binding to a name aliases its cell");

    runner.reset();
    runner.test_error("(let ((+ 1)) +)", "Shadowing is not currently allowed!");
    runner.test_error("(let ((a 1) (a 2)) a)", "Shadowing is not currently allowed!");
    runner.test_error("(let ((a 1)) a)", "Raw lists are not available (Yet...)!");
    runner.test_error("(let ((a 1)) (print a))", "test:1:8 - Shadowing is not currently allowed!");
    runner.test_error("(let ((b 1) (c b)) b)",
        "Making a variable depend upon another in the statement is not currently implemented!");
    runner.test_error("(let ((d)) d)", "Variable defined in parentheses must have an initial value.");
    runner.test_error("(let ((d)) d)", "Remove the parentheses around it.");
    runner.test_error("(let (1) (print 1))", "Unknown literal in `let` statement.");
    runner.test_error("(let (1) (print 1))", "Bind it to a variable name.");
    runner.test_error("(let ((1 2)) (print 1))", "Cannot assign to literal value!");
    runner.test_error("(let ((e (+ 1 2))) e)", "Variables must be literals or other values (not expressions)!");
    runner.test_error("(let (((e 1))) e)", "Variable names must be literals!");
    runner.test_error("(let ((e 1 (f))) e)", "Unknown opening parenthesis.");
    runner.test_error("(let ((e 1 f)) e)", "Identifier not allowed here!");
    runner.test_error("(let ((let 1)) (print 1))", "Keywords are not allowed in variable assignments!");
    runner.test_error("(let (()) (print 1))", "Empty binding.");
    runner.test_error("(let g (print 1))", "Expected a list of bindings after `let`!");
    runner.test_error("(let ((h missing)) (print h))", "Unknown identifier `missing`!");
    runner.check(not runner.idents.contains("e") and not runner.idents.contains("h"),
        "a failed `let` binds nothing");

    return runner.failures;
}

int test_values()
{
    std::println("\n--- Values ---");
    test_runner runner;

    var items = var::make(list{{var::make(integer(1)), var::make(std::string("a")), var::nil()}});
    runner.check(value_to_string(items) == "(1 a nil)", "lists display space separated");
    runner.check(value_to_string(var::make(list{})) == "()", "empty list");
    runner.check(value_to_string(var::make(2.5)) == "2.5", "floats display");
    runner.check(value_to_string(var::make(alias{items})) == "(1 a nil)", "aliases display their target");
    runner.check(describe(items.get()) == "(1 \"a\" nil)", "describe quotes strings");

    runner.check(value_type_string(value(integer(1))) == "Integer", "Integer type name");
    runner.check(value_type_string(value(std::string("s"))) == "String", "String type name");
    runner.check(value_type_string(value(nullptr)) == "Nil", "Nil type name");
    runner.check(value_type_string(items.get()) == "List", "List type name");

    runner.check(value(1.0) == value(1.0005), "floats equal within epsilon");
    runner.check(not (value(1.0) == value(1.01)), "floats differ beyond epsilon");
    runner.check(not (value(integer(1)) == value(1.0)), "integer never equals float");
    runner.check(value(std::string("a")) == value(std::string("a")), "strings compare by content");
    runner.check(value(nullptr) == value(nullptr), "nil equals nil");
    var other = var::make(list{{var::make(integer(1)), var::make(std::string("a")), var::nil()}});
    runner.check(items.get() == other.get(), "lists compare element-wise");
    runner.check(value(alias{other}) == items.get(), "aliases compare as their target");

    return runner.failures;
}

int test_aliasing()
{
    std::println("\n--- Handles and cloning ---");
    test_runner runner;

    var original = var::make(integer(10));
    var same = original.new_ref();
    same->data = integer(11);
    runner.check(value_to_string(original) == "11", "writes through new_ref are shared");

    var copy = original.maybe_clone();
    copy->data = integer(12);
    runner.check(value_to_string(original) == "11" and value_to_string(copy) == "12",
        "maybe_clone makes an independent cell");

    var items = var::make(list{{original.new_ref()}});
    var items_copy = items.maybe_clone();
    original->data = integer(13);
    runner.check(value_to_string(items) == "(13)" and value_to_string(items_copy) == "(11)",
        "lists clone element-wise");

    var pointing = var::make(alias{original});
    var unwrapped = pointing.maybe_clone();
    runner.check(std::holds_alternative<integer>(unwrapped->data), "cloning an alias copies its target");

    auto plus = runner.idents.lookup("+");
    var plus_copy = plus->maybe_clone();
    runner.check(plus_copy->is_func() and not plus_copy.same_cell(*plus), "intrinsics can be cloned");

    var constant = var::make(func(std::make_unique<constant_callable>()));
    try {
        constant.maybe_clone();
        runner.check(false, "cloning a non-cloneable callable is a bug");
    } catch (const internal_error& e) {
        runner.check(std::string(e.what()).find("constant_callable") != std::string::npos,
            "cloning a non-cloneable callable is a bug");
    }

    auto tokens = tokenize("(+ 1 2)", "test");
    var stmt = var::make(make_ast(tokens, runner.idents, location{"test", 1, 1}));
    try {
        stmt.maybe_clone();
        runner.check(false, "cloning a statement is a bug");
    } catch (const internal_error&) {
        runner.check(true, "cloning a statement is a bug");
    }

    runner.check(runner.idents.insert("seven", constant.new_ref()), "insert a custom callable");
    runner.check(not runner.idents.insert("seven", var::nil()), "insert refuses to rebind");
    runner.test_eval("(seven)", "7");
    runner.test_eval("(+ (seven) 1)", "8");

    return runner.failures;
}

int test_user_functions()
{
    std::println("\n--- User functions ---");
    test_runner runner;

    var a = var::nil();
    var b = var::nil();
    runner.idents.insert("a", a.new_ref());
    runner.idents.insert("b", b.new_ref());
    auto body_tokens = tokenize("(+ a b)", "body");
    statement body = make_ast(body_tokens, runner.idents, location{"body", 1, 1});

    auto add2 = std::make_unique<user_function>(std::vector<var>{a, b}, std::move(body));
    runner.check(2 == add2->arity(), "arity is the parameter count");
    runner.check(add2->debug_info().find("body:1:2") != std::string::npos, "debug info names the body");
    runner.idents.insert("add2", var::make(func(std::move(add2))));

    runner.test_eval("(add2 1 2)", "3");
    runner.test_eval("(add2 (+ 1 1) 5)", "7");
    runner.test_eval("(+ (add2 1 2) (add2 10 20))", "33");

    runner.test_eval("(let ((n 40)) (add2 n 2))", "42");
    auto n = runner.idents.lookup("n");
    auto* param = std::get_if<alias>(&a->data);
    runner.check(param and n and param->target.same_cell(*n), "parameters alias the caller's argument");

    runner.test_error("(add2 1)", "test:1:2 - Insufficient arguments provided!");
    runner.test_error("(add2 1 2 3)", "Too many arguments provided!");
    runner.test_error("(add2 1 2 3)", "Delete them.");

    try {
        run_lisp("(add2 1 \"x\")", "test", runner.idents);
        runner.check(false, "errors in the body name the call site");
    } catch (const pale_error& e) {
        const auto& entries = e.diag().entries();
        runner.check(2 == entries.size()
            and entries[0].message.starts_with("body:1:2 - Incompatible types")
            and entries[1].message.starts_with("test:1:2 - "),
            "errors in the body name the call site");
    }

    runner.test_error("(add2 (add2 1 2) 3)", "test:1:8 - Recursive calls are not supported!");
    runner.test_error("(add2 (add2 1 2) 3)", "test:1:2 - Error in the body of the function called here.");
    runner.test_eval("(add2 1 2)", "3");

    return runner.failures;
}

int test_nesting()
{
    std::println("\n--- Nesting ---");
    test_runner runner;

    std::string deep = std::string(300, '(') + "+ 1 2" + std::string(300, ')');
    runner.test_error(deep, "Statements are nested too deeply!");

    try {
        run_options options;
        options.max_depth = 400;
        auto result = run_lisp(deep, "test", runner.idents, options);
        runner.check("3" == result, "a higher limit allows deeper nesting");
    } catch (const pale_error& e) {
        println_red("threw: {}", e.what());
        runner.check(false, "a higher limit allows deeper nesting");
    }

    eval_reset_max_depth();
    runner.test_eval("(+ 1 (+ 2 (+ 3 4)))", "10");
    runner.check(3 == eval_get_max_depth(), "evaluation depth is tracked");

    return runner.failures;
}

int test_dump()
{
    std::println("\n--- Dump ---");
    test_runner runner;

    run_options options;
    options.dump = true;
    auto result = run_lisp("(+ 1 (* 2 3))", "test", runner.idents, options);
    auto dumped = runner.out.str();
    runner.check("7" == result, "dumping still evaluates");
    runner.check(dumped.find("Token(START_STMT, '') at test:1:1") != std::string::npos, "dump lists tokens");
    runner.check(dumped.find("Statement at test:1:2") != std::string::npos
        and dumped.find("  Statement at test:1:7") != std::string::npos, "dump shows the statement tree");

    return runner.failures;
}

int test_config()
{
    std::println("\n--- Command line ---");
    test_runner runner;

    auto parse = [](std::vector<std::string_view> args) { return parse_arguments(args); };

    auto none = parse({});
    runner.check(not none.input and not none.command and default_max_depth == none.max_depth,
        "no arguments means the REPL");

    auto command = parse({"-c", "(+ 1 2)"});
    runner.check(command.command and command.input and "(+ 1 2)" == *command.input
        and "<provided>" == command.source_name(), "-c takes source text");

    auto file = parse({"--dump", "prog.pale"});
    runner.check(file.dump and "prog.pale" == file.source_name(), "a path names its source");

    auto debug = parse({"--debug", "eval", "--debug=memo", "--no-color", "--max-depth", "10"});
    runner.check("eval,memo" == debug.debug and debug.no_color and 10 == debug.max_depth,
        "debug, color and depth options");
    runner.check(parse({"--max-depth=7"}).max_depth == 7 and parse({"-h"}).help, "--max-depth= and -h");

    auto rejects = [&](std::vector<std::string_view> args, std::string_view what) {
        try {
            parse(args);
            runner.check(false, what);
        } catch (const usage_error&) {
            runner.check(true, what);
        }
    };
    rejects({"--bogus"}, "unknown options are rejected");
    rejects({"a", "b"}, "only one input");
    rejects({"-c"}, "-c needs source");
    rejects({"--max-depth", "abc"}, "--max-depth needs a number");
    rejects({"--max-depth", "0"}, "--max-depth must be positive");
    rejects({"--debug"}, "--debug needs a value");

    runner.check(usage_text("pale").starts_with("Usage: pale"), "usage text names the program");

    return runner.failures;
}

int test_debug_settings()
{
    std::println("\n--- Debug settings ---");
    test_runner runner;

    options opts;
    opts.debug = "memo";
    opts.no_color = true;
    apply_debug_settings(opts, "eval,call");
    runner.check(get_debug().is_enabled("eval") and get_debug().is_enabled("call")
        and get_debug().is_enabled("memo") and not get_debug().is_enabled("lex"),
        "environment and --debug categories combine");
    runner.check(not get_debug().are_colors_enabled(), "--no-color turns colors off");

    get_debug().enable_list("none");
    runner.check(get_debug().get_enabled_categories().empty(), "none disables everything");

    try {
        get_debug().enable_list("bogus");
        runner.check(false, "unknown categories are rejected");
    } catch (const std::runtime_error&) {
        runner.check(true, "unknown categories are rejected");
    }

    get_debug().disable_all();
    get_debug().set_colors(true);
    return runner.failures;
}

int test_repl_helpers()
{
    std::println("\n--- REPL helpers ---");
    test_runner runner;

    runner.check(not is_complete_expression("(+ 1"), "open statement is incomplete");
    runner.check(is_complete_expression("(+ 1 2)"), "balanced statement is complete");
    runner.check(is_complete_expression("$print 1"), "`$` needs no closing parenthesis");
    runner.check(is_complete_expression("(print \"(\")"), "parentheses in strings don't count");
    runner.check(not is_complete_expression("(print \"abc)"), "open string is incomplete");
    runner.check(is_complete_expression("(+ 1 {* ) *} 2)"), "parentheses in block comments don't count");
    runner.check(is_complete_expression("(+ 1 2) // ("), "parentheses in line comments don't count");
    runner.check(is_complete_expression("(+ 1 2))"), "extra closing parentheses are left to the parser");

    std::ostringstream out;
    repl_state state{scope(out), {}};
    state.idents.insert("x", var::make(integer(1)));
    runner.check(handle_special_command(":dump on", state) and state.options.dump, ":dump on");
    runner.check(handle_special_command(":dump off", state) and not state.options.dump, ":dump off");
    runner.check(handle_special_command(":reset", state) and not state.idents.contains("x")
        and state.idents.contains("print"), ":reset starts a fresh scope");
    runner.check(not handle_special_command(":nonsense", state), "unknown commands are not handled");

    out.str("");
    runner.check(handle_special_command(":help", state) and out.str().find(":reset") != std::string::npos,
        ":help writes to the session output");

    get_debug().disable_all();
    runner.check(handle_special_command(":debug on eval", state) and get_debug().is_enabled("eval")
        and not get_debug().is_enabled("memo"), ":debug on enables one category");
    out.str("");
    runner.check(handle_special_command(":debug status", state) and out.str().find("eval") != std::string::npos,
        ":debug status lists enabled categories");
    runner.check(handle_special_command(":debug off", state) and get_debug().get_enabled_categories().empty(),
        ":debug off disables every category");
    out.str("");
    runner.check(handle_special_command(":debug on bogus", state) and get_debug().get_enabled_categories().empty()
        and out.str().find("Unknown debug category: bogus") != std::string::npos,
        "unknown debug categories are reported and enable nothing");
    runner.check(handle_special_command(":debug on eval,memo", state) and get_debug().is_enabled("eval")
        and get_debug().is_enabled("memo"), ":debug on takes a comma separated list");
    runner.check(handle_special_command(":debug off memo", state) and get_debug().is_enabled("eval")
        and not get_debug().is_enabled("memo"), ":debug off disables one category");
    get_debug().disable_all();

    std::string pending;
    runner.check(not add_input_line(pending, "   (+ 1") and "   (+ 1" == pending,
        "incomplete statements wait for more lines");
    runner.check(add_input_line(pending, "  2)") == "   (+ 1\n  2)" and pending.empty(),
        "statements keep their leading whitespace");
    runner.check(not add_input_line(pending, "   ") and pending.empty(), "blank lines are dropped");
    runner.check(add_input_line(pending, "  :dump on  ") == ":dump on" and pending.empty(), "commands are trimmed");
    runner.check(add_input_line(pending, " quit ") == "quit", "quit is trimmed");

    auto typed = add_input_line(pending, "   (foo)");
    runner.check(typed == "   (foo)", "a single line statement is returned as typed");
    if (typed) {
        runner.test_error(*typed, "test:1:5 - Unknown identifier `foo`!");
    }

    return runner.failures;
}

} // anonymous namespace

bool run_tests()
{
    int failures{0};
    std::println("\n{}", std::string(60, '='));
    failures += test_diagnostics();
    failures += test_unicode();
    failures += test_lexer_tokens();
    failures += test_classify_token();
    failures += test_lexer_comments();
    failures += test_lexer_errors();
    failures += test_dollar_sugar();
    std::println("{}", std::string(60, '='));
    failures += test_arithmetic();
    failures += test_print();
    failures += test_memoization();
    failures += test_parser_errors();
    failures += test_let();
    std::println("{}", std::string(60, '='));
    failures += test_values();
    failures += test_aliasing();
    failures += test_user_functions();
    failures += test_nesting();
    failures += test_dump();
    std::println("{}", std::string(60, '='));
    failures += test_config();
    failures += test_debug_settings();
    failures += test_repl_helpers();
    std::println("{}", std::string(60, '='));

    if (failures != 0) {
        std::println("\n✗ {} test(s) failed!", failures);
        return false;
    }

    std::println("\n✓ All tests passed!");
    std::println("{}\n", std::string(50, '='));
    return true;
}
