#include <cstdio>
#include <cstdlib>
#include <exception>
#include <print>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "debug.hpp"
#include "pale.hpp"
#include "repl.hpp"
#include "utils.hpp"

namespace {

    constexpr int exit_language_error = 1;
    constexpr int exit_usage_error = 2;

    int run_input(const options& opts)
    {
        std::string source = opts.command? *opts.input: read_file_content(*opts.input);
        scope idents;
        eval_reset_max_depth();
        auto result = run_lisp(source, opts.source_name(), idents, opts.to_run_options());
        PALE_DEBUG(stack-depth, "max statement depth: {}", eval_get_max_depth());
        std::println("{}", result);
        return EXIT_SUCCESS;
    }

} // anonymous namespace

int main(int argc, char* argv[])
{
    const char* program = argc > 0? argv[0]: "pale";

    options opts;
    try {
        opts = parse_arguments(argc, argv);
        apply_debug_settings(opts, std::getenv("PALE_DEBUG"));
    } catch (const std::runtime_error& e) {
        println_red("{}", e.what());
        std::println(stderr, "{}", usage_text(program));
        return exit_usage_error;
    }

    if (opts.help) {
        std::println("{}", usage_text(program));
        return EXIT_SUCCESS;
    }

    if (not opts.input) {
        repl(opts.to_run_options());
        return EXIT_SUCCESS;
    }

    try {
        return run_input(opts);
    } catch (const pale_error& e) {
        println_red("{}", e.what());
        return exit_language_error;
    } catch (const internal_error& e) {
        println_red("{}", e.what());
        return exit_language_error;
    } catch (const std::runtime_error& e) {
        // Reading the source file failed.
        println_red("{}", e.what());
        return exit_usage_error;
    }
}
