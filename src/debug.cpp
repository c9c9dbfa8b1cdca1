#include <algorithm>
#include <format>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "debug.hpp"

// The value is the color; the keys define which categories exist.
std::unordered_map<std::string, std::string> debug_categories{
    {"lex", "\033[35m"},         // Magenta
    {"parse", "\033[31m"},       // Red
    {"scope", "\033[33m"},       // Yellow
    {"eval", "\033[36m"},        // Cyan
    {"call", "\033[34m"},        // Blue
    {"memo", "\033[32m"},        // Green
    {"stack-depth", "\033[90m"}, // Dark gray
};

debug_controller& get_debug()
{
    static debug_controller instance;
    return instance;
}

void debug_controller::enable(const std::string& category)
{
    if (not debug_categories.contains(category)) {
        auto known = debug_categories | std::views::keys | std::ranges::to<std::vector<std::string>>();
        std::ranges::sort(known);
        throw std::runtime_error(std::format("Unknown debug category: {} (known: {}, all, none)",
            category, known));
    }
    enabled_categories.insert(category);
}

void debug_controller::disable(const std::string& category)
{ enabled_categories.erase(category); }

void debug_controller::enable_list(std::string_view categories)
{
    for (auto part : categories | std::views::split(',')) {
        std::string name(std::string_view(part.begin(), part.end()));
        if (name.empty()) continue;
        if ("all" == name) {
            enable_all();
        } else if ("none" == name) {
            disable_all();
        } else {
            enable(name);
        }
    }
}

std::unordered_set<std::string> debug_controller::get_enabled_categories() const
{ return enabled_categories; }

void debug_controller::enable_all()
{ enabled_categories = std::views::keys(debug_categories) | std::ranges::to<std::unordered_set>(); }

void debug_controller::disable_all()
{ enabled_categories.clear(); }

bool debug_controller::is_enabled(const std::string& category) const
{ return enabled_categories.contains(category); }

void debug_controller::set_colors(bool enable) { use_colors = enable; }
bool debug_controller::are_colors_enabled() const { return use_colors; }

std::string debug_controller::get_prefix(const std::string& category) const
{
    if (not debug_categories.contains(category)) {
        throw std::runtime_error("Unknown debug category: " + category);
    }
    return std::format("[{}]", category);
}

std::string debug_controller::get_color(const std::string& category) const
{
    return debug_categories.at(category);
}
