#include <charconv>
#include <cstddef>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "config.hpp"
#include "debug.hpp"

namespace {

    size_t parse_depth(std::string_view text)
    {
        size_t n = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
        if (std::errc{} != ec or ptr != text.data() + text.size() or 0 == n) {
            throw usage_error(std::format("--max-depth needs a positive whole number, not `{}`", text));
        }
        return n;
    }

} // anonymous namespace

std::string options::source_name() const
{
    if (command or not input) return "<provided>";
    return *input;
}

options parse_arguments(std::span<const std::string_view> args)
{
    options opts;
    for (size_t i = 0; i < args.size(); ++i) {
        auto arg = args[i];

        auto next_value = [&]() -> std::string_view {
            if (i + 1 >= args.size()) {
                throw usage_error(std::format("{} needs a value", arg));
            }
            return args[++i];
        };

        if ("-c" == arg or "--command" == arg) {
            opts.command = true;
        } else if ("-d" == arg or "--dump" == arg) {
            opts.dump = true;
        } else if ("-h" == arg or "--help" == arg) {
            opts.help = true;
        } else if ("--no-color" == arg) {
            opts.no_color = true;
        } else if ("--debug" == arg) {
            if (not opts.debug.empty()) opts.debug += ',';
            opts.debug += next_value();
        } else if (arg.starts_with("--debug=")) {
            if (not opts.debug.empty()) opts.debug += ',';
            opts.debug += arg.substr(8);
        } else if ("--max-depth" == arg) {
            opts.max_depth = parse_depth(next_value());
        } else if (arg.starts_with("--max-depth=")) {
            opts.max_depth = parse_depth(arg.substr(12));
        } else if (arg.size() > 1 and arg.starts_with('-')) {
            throw usage_error(std::format("Unknown option `{}`", arg));
        } else if (opts.input) {
            throw usage_error(std::format("Only one input is allowed, but got `{}` and `{}`", *opts.input, arg));
        } else {
            opts.input = std::string(arg);
        }
    }

    if (opts.command and not opts.input) {
        throw usage_error("--command needs source text to run");
    }
    return opts;
}

options parse_arguments(int argc, char* argv[])
{
    std::vector<std::string_view> args(argv + 1, argv + argc);
    return parse_arguments(args);
}

std::string usage_text(std::string_view program)
{
    return std::format(
        "Usage: {} [options] [input]\n"
        "\n"
        "Runs a pale program from a file, or from the command line with -c.\n"
        "With no input, starts an interactive session.\n"
        "\n"
        "Options:\n"
        "  -c, --command        treat input as source text\n"
        "  -d, --dump           print the tokens and statement tree before evaluating\n"
        "      --debug LIST     enable debug categories (comma separated, \"all\" or \"none\")\n"
        "      --no-color       disable colored debug output\n"
        "      --max-depth N    how deeply statements may nest (default {})\n"
        "  -h, --help           show this help\n"
        "\n"
        "PALE_DEBUG in the environment is read like --debug.",
        program, default_max_depth);
}

void apply_debug_settings(const options& opts, const char* env_value)
{
    if (env_value) {
        get_debug().enable_list(env_value);
    }
    if (not opts.debug.empty()) {
        get_debug().enable_list(opts.debug);
    }
    get_debug().set_colors(not opts.no_color);
}
