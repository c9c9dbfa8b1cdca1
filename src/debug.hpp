#pragma once

#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#define PALE_DEBUG(category, ...) get_debug().log(#category, __VA_ARGS__)
#define PALE_DEBUG_ENABLED(category) get_debug().is_enabled(#category)

extern std::unordered_map<std::string, std::string> debug_categories;

class debug_controller {
private:
    std::unordered_set<std::string> enabled_categories;
    bool use_colors = true;

public:
    void enable(const std::string& category);
    void disable(const std::string& category);
    // Accepts "cat1,cat2,...", "all" or "none".
    void enable_list(std::string_view categories);
    std::unordered_set<std::string> get_enabled_categories() const;
    void enable_all();
    void disable_all();
    bool is_enabled(const std::string& category) const;
    void set_colors(bool enable);
    bool are_colors_enabled() const;

    template<typename... Args>
    void log(const std::string& category,
        std::string_view format_str, Args&&... args)
    {
        if (not is_enabled(category)) return;

        std::string prefix = get_prefix(category);
        if (use_colors) {
            prefix = get_color(category) + prefix + "\033[0m";
        }

        std::string message = std::vformat(format_str, std::make_format_args(args...));
        std::println("{} {}", prefix, message);
    }

private:
    std::string get_prefix(const std::string& category) const;
    std::string get_color(const std::string& category) const;
};

debug_controller& get_debug();
