#pragma once

#include <optional>
#include <string>

#include "pale.hpp"

struct repl_state {
    scope idents;
    run_options options;
};

// True once the parentheses of input balance outside strings and comments.
bool is_complete_expression(const std::string& input);

// Appends one typed line to pending. Returns the input to act on once it
// is a whole statement (untrimmed, so columns stay right) or a command or
// quit (trimmed). Blank input is dropped.
std::optional<std::string> add_input_line(std::string& pending, const std::string& line);

// Runs a REPL command such as `:reset` or `:debug on eval`, reporting on the
// session scope's output stream. Returns false if input isn't a command.
bool handle_special_command(const std::string& input, repl_state& state);

// Interactive loop over a session scope that keeps `let` bindings between
// lines until `:reset`. Returns at end of input or on quit/exit.
void repl(const run_options& options);
