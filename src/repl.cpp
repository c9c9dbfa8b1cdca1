#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <format>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <print>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <readline/history.h>
#include <readline/readline.h>

#include "debug.hpp"
#include "pale.hpp"
#include "repl.hpp"
#include "utils.hpp"

namespace {

    // Readline's completion callbacks take no context.
    const scope* completion_scope{nullptr};

    std::optional<std::string> get_history_file()
    {
        const char* home = std::getenv("HOME");
        if (not home) return std::nullopt;
        return std::format("{}/.pale_history", home);
    }

    // nullopt at end of input.
    std::optional<std::string> read_with_readline(const std::string& prompt)
    {
        std::unique_ptr<char, decltype([](char* p){ std::free(p); })>
            line(readline(prompt.c_str()));
        if (not line) return std::nullopt;
        return std::string(line.get());
    }

    char* symbol_generator(const char* prefix, int state)
    {
        static std::vector<std::string> matches;
        static size_t match_index{0};

        if (0 == state) {
            matches.clear();
            match_index = 0;

            if (completion_scope) {
                auto string_starts_with = [](const std::string& str, const char* prefix) {
                    return std::string_view(str).starts_with(prefix);
                };
                std::ranges::copy(
                    completion_scope->names() | std::views::filter(std::bind_back(string_starts_with, prefix)),
                    std::back_inserter(matches));
            }
        }

        if (match_index < matches.size()) {
            return strdup(matches[match_index++].c_str());
        }

        return nullptr;
    }

    char** symbol_completion(const char* text, int start, int)
    {
        // Don't complete filenames
        rl_attempted_completion_over = 1;

        if (0 == start or std::strchr("($ \t\n", rl_line_buffer[start - 1])) {
            return rl_completion_matches(text, symbol_generator);
        }

        return nullptr;
    }

    void setup_completion()
    {
        rl_attempted_completion_function = symbol_completion;
        rl_completer_word_break_characters = " \t\n()$";
    }

    void print_welcome()
    {
        std::println("Welcome to the pale REPL!");
        std::println("Type statements to evaluate them, or 'quit' to exit.");
        std::println("Statements can span lines; keep typing until the parentheses balance.");
        std::println("Special commands start with ':' (try ':help')");
        std::println("Examples:");
        std::println("  (+ 1 2 3)");
        std::println("  $print \"Hello, world!\"");
        std::println("  (let ((x 5)) (* x x))");
        std::println("  :debug on eval");
        std::println("");
    }

    // Read one complete statement or command, across several lines if needed.
    std::optional<std::string> read_expression()
    {
        std::string pending;

        while (true) {
            auto line = read_with_readline(pending.empty()? "pale> ": "...> ");
            if (not line) {
                if (pending.empty()) return std::nullopt;
                // Let the parser report what's missing.
                return pending;
            }

            if (auto input = add_input_line(pending, *line)) {
                add_history(input->c_str());
                return input;
            }
        }
    }

    bool is_quit_command(const std::string& input)
    {
        return "quit" == input or "exit" == input;
    }

    void show_debug_help(std::ostream& out)
    {
        auto categories{debug_categories | std::views::keys | std::ranges::to<std::vector>()};
        std::ranges::sort(categories);
        std::println(out, "Debug commands:");
        std::println(out, "  :debug on [categories]    - Enable categories (comma separated, all if none given)");
        std::println(out, "  :debug off [categories]   - Disable categories (all if none given)");
        std::println(out, "  :debug status             - Show enabled categories and colors");
        std::println(out, "  :debug colors on|off      - Color the [category] prefixes");
        std::println(out, "Categories: {}", categories);
    }

    void show_debug_status(std::ostream& out)
    {
        auto enabled = get_debug().get_enabled_categories() | std::ranges::to<std::vector>();
        std::ranges::sort(enabled);
        std::println(out, "Colors: {}", get_debug().are_colors_enabled()? "on": "off");
        if (enabled.empty()) {
            std::println(out, "Enabled: none");
        } else {
            std::println(out, "Enabled: {}", enabled);
        }
    }

    // `:debug <action> [argument]`, everything reported on out.
    void run_debug_command(std::string_view action, std::string_view argument, std::ostream& out)
    {
        if (action.empty() or "help" == action) {
            show_debug_help(out);
        } else if ("status" == action) {
            show_debug_status(out);
        } else if ("colors" == action and ("on" == argument or "off" == argument)) {
            get_debug().set_colors("on" == argument);
            std::println(out, "Debug colors {}", argument);
        } else if ("on" == action) {
            try {
                // Same syntax as --debug and PALE_DEBUG.
                get_debug().enable_list(argument.empty()? "all": argument);
                show_debug_status(out);
            } catch (const std::runtime_error& e) {
                std::println(out, "Error: {}", e.what());
            }
        } else if ("off" == action) {
            if (argument.empty()) {
                get_debug().disable_all();
            }
            for (auto part : argument | std::views::split(',')) {
                get_debug().disable(std::string(std::string_view(part.begin(), part.end())));
            }
            show_debug_status(out);
        } else {
            std::println(out, "Unknown debug command: {} {}. Try ':debug help'", action, argument);
        }
    }

    void print_result(const std::string& result)
    {
        std::println("=> {}", result);
    }

    void print_error(const std::exception& e)
    {
        println_red("{}", e.what());
    }

} // anonymous namespace

bool is_complete_expression(const std::string& input)
{
    enum class mode { normal, in_string, in_line_comment, in_block_comment };

    int paren_count = 0;
    mode m = mode::normal;
    char last = '\n';

    for (char ch : input) {
        switch (m) {
            case mode::in_string:
                if ('"' == ch) m = mode::normal;
                break;
            case mode::in_line_comment:
                if ('\n' == ch) m = mode::normal;
                break;
            case mode::in_block_comment:
                if ('}' == ch and '*' == last) {
                    m = mode::normal;
                    ch = ' ';
                }
                break;
            case mode::normal:
                if ('/' == ch and '/' == last) {
                    m = mode::in_line_comment;
                } else if ('*' == ch and '{' == last) {
                    m = mode::in_block_comment;
                    ch = ' ';
                } else if ('"' == ch) {
                    m = mode::in_string;
                } else if ('(' == ch) {
                    ++paren_count;
                } else if (')' == ch) {
                    // Too many closing parens; let the parser report it.
                    if (--paren_count < 0) return true;
                }
                break;
        }
        last = ch;
    }

    return mode::in_string != m and mode::in_block_comment != m and 0 == paren_count;
}

std::optional<std::string> add_input_line(std::string& pending, const std::string& line)
{
    if (not pending.empty()) {
        pending += '\n';
    }
    pending += line;

    std::string trimmed = pending;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\n\r"));
    trimmed.erase(trimmed.find_last_not_of(" \t\n\r") + 1);

    if (trimmed.empty()) {
        pending.clear();
        return std::nullopt;
    }

    // Commands are matched word for word, but statements keep their
    // whitespace so columns match what was typed.
    if (trimmed.starts_with(":") or is_quit_command(trimmed)) {
        pending.clear();
        return trimmed;
    }
    if (is_complete_expression(pending)) {
        return std::exchange(pending, {});
    }
    return std::nullopt;
}

bool handle_special_command(const std::string& input, repl_state& state)
{
    std::ostream& out = state.idents.output();
    std::istringstream iss(input);
    std::string command, action, argument;
    iss >> command >> action >> argument;

    if (":debug" == command) {
        run_debug_command(action, argument, out);
        return true;
    }

    if (":help" == command) {
        std::println(out, "Special commands:");
        std::println(out, "  :help          - Show this help");
        std::println(out, "  :reset         - Forget every `let` binding made so far");
        std::println(out, "  :dump on|off   - Print tokens and the statement tree before evaluating");
        std::println(out, "  :debug ...     - Debug control commands (:debug help for details)");
        std::println(out, "  quit, exit     - Exit the REPL");
        std::println(out, "");
        std::println(out, "Or enter any pale statement to evaluate it.");
        return true;
    }

    if (":reset" == command) {
        state.idents = scope(out);
        std::println(out, "Scope reset");
        return true;
    }

    if (":dump" == command) {
        if ("on" == action or "off" == action) {
            state.options.dump = "on" == action;
            std::println(out, "Dump {}", action);
        } else {
            std::println(out, "Usage: :dump on|off");
        }
        return true;
    }

    return false;
}

void repl(const run_options& options)
{
    auto history_file = get_history_file();
    if (history_file) {
        // A missing history file just means a first session.
        read_history(history_file->c_str());
    }

    repl_state state{scope(), options};
    completion_scope = &state.idents;
    setup_completion();

    print_welcome();

    while (true) {
        auto input = read_expression();
        if (not input or is_quit_command(*input)) {
            std::println("Goodbye!");
            break;
        }

        if (input->starts_with(":")) {
            if (not handle_special_command(*input, state)) {
                std::println("Unknown command: {}. Try ':help'", *input);
            }
            continue;
        }

        try {
            eval_reset_max_depth();
            auto result = run_lisp(*input, "<repl>", state.idents, state.options);
            PALE_DEBUG(stack-depth, "max statement depth: {}", eval_get_max_depth());
            print_result(result);
        } catch (const pale_error& e) {
            print_error(e);
        } catch (const internal_error& e) {
            print_error(e);
        }
    }

    completion_scope = nullptr;
    if (history_file and 0 != write_history(history_file->c_str())) {
        println_red("Could not save history to {}", *history_file);
    }
}
