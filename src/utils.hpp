#pragma once

#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <typeinfo>

std::string demangle(std::type_info const& type);

void println_red(std::string_view format_str, auto&&... args)
{
    std::println(stderr, "\033[31m{}\033[0m",
        std::vformat(format_str,
            std::make_format_args(args...)));
}

// Throws std::runtime_error if the file can't be read.
std::string read_file_content(const std::string& filename);
