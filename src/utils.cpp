#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <typeinfo>

#include <cxxabi.h>

#include "utils.hpp"

std::string demangle(std::type_info const& type)
{
    int status = 0;
    char* name = abi::__cxa_demangle(type.name(), nullptr, nullptr, &status);
    std::string result(name? name: type.name());
    std::free(name);
    return result;
}

std::string read_file_content(const std::string& filename)
{
    std::ifstream file(filename, std::ios::binary);
    if (not file.is_open()) {
        throw std::runtime_error("Could not open source file: " + filename);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Could not read source file: " + filename);
    }
    return buffer.str();
}
