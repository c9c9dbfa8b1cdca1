#pragma once

#include <cstddef>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Where a token or statement came from. Lines and columns are 1-based and
// count code points of the untrimmed source line.
struct location {
    std::string filename;
    size_t line{1};
    size_t column{1};

    std::string to_string() const
    {
        return std::format("{}:{}:{}", filename, line, column);
    }

    bool operator==(const location&) const = default;
};

// Builder-style accumulator of errors. Each entry is a primary message tied
// to a location plus any number of notes. Notes attach to the most recently
// added entry.
class diagnostics {
public:
    struct entry {
        std::string message;
        std::vector<std::string> notes;
    };

    diagnostics& error(const location& loc, std::string_view message);
    diagnostics& note(std::string_view text);
    diagnostics& note(const location& loc, std::string_view text);

    // Append all entries of other after ours.
    void extend(diagnostics other);

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    const std::vector<entry>& entries() const { return entries_; }

    std::string to_string() const;

private:
    std::vector<entry> entries_;
};

// Thrown for every user-triggerable failure (lexical, syntactic, type and
// runtime). what() is the rendered diagnostics.
class pale_error: public std::runtime_error {
public:
    explicit pale_error(diagnostics diag)
        : std::runtime_error(diag.to_string()), diag_(std::move(diag)) {}

    const diagnostics& diag() const { return diag_; }

private:
    diagnostics diag_;
};

// Thrown when an invariant the parser guarantees turns out to be false.
// Seeing one of these is a bug in the interpreter, never in the program.
class internal_error: public std::logic_error {
public:
    explicit internal_error(const std::string& msg)
        : std::logic_error("Internal error: " + msg +
            " (this is a bug in pale, please report it)") {}
};
