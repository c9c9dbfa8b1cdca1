#include <format>
#include <string>
#include <string_view>
#include <utility>

#include "diagnostics.hpp"

diagnostics& diagnostics::error(const location& loc, std::string_view message)
{
    entries_.push_back({std::format("{} - {}", loc.to_string(), message), {}});
    return *this;
}

diagnostics& diagnostics::note(std::string_view text)
{
    // A note with nothing to attach to is dropped.
    if (not entries_.empty()) {
        entries_.back().notes.push_back(std::format("NOTE: {}", text));
    }
    return *this;
}

diagnostics& diagnostics::note(const location& loc, std::string_view text)
{
    if (not entries_.empty()) {
        entries_.back().notes.push_back(
            std::format("NOTE: {} - {}", loc.to_string(), text));
    }
    return *this;
}

void diagnostics::extend(diagnostics other)
{
    for (auto& e : other.entries_) {
        entries_.push_back(std::move(e));
    }
}

std::string diagnostics::to_string() const
{
    std::string result;
    for (const auto& e : entries_) {
        if (not result.empty()) result += '\n';
        result += e.message;
        for (const auto& n : e.notes) {
            result += "\n\t";
            result += n;
        }
    }
    return result;
}
