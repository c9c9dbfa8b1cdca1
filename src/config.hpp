#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "pale.hpp"

// Thrown for bad command lines. The message is meant for the user.
class usage_error: public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct options {
    // input is source text instead of a path.
    bool command{false};
    bool dump{false};
    bool no_color{false};
    bool help{false};
    // Comma separated debug categories from --debug.
    std::string debug;
    size_t max_depth{default_max_depth};
    // Path or source text; none means start the REPL.
    std::optional<std::string> input;

    // Name used in locations: "<provided>" for -c, the path otherwise.
    std::string source_name() const;
    run_options to_run_options() const { return {dump, max_depth}; }
};

// args excludes the program name.
options parse_arguments(std::span<const std::string_view> args);
options parse_arguments(int argc, char* argv[]);

std::string usage_text(std::string_view program);

// Turns on the categories from PALE_DEBUG (env_value, may be null) and then
// those given with --debug, and applies --no-color.
void apply_debug_settings(const options& opts, const char* env_value);
