#pragma once

#include <string>
#include <string_view>

// Decodes a UTF-8 byte string into code points.
// Throws std::invalid_argument (with the byte offset) if utf8 is invalid.
std::u32string decode_utf8(std::string_view utf8);

// Appends the UTF-8 encoding of codepoint to out.
// Throws std::invalid_argument if codepoint isn't a valid Unicode scalar.
void append_utf8(std::string& out, char32_t codepoint);
