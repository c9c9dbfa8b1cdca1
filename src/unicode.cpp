#include <cstddef>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

#include "unicode.hpp"

namespace {

    // Length of the sequence introduced by lead, or 0 if lead can't start one.
    size_t sequence_length(uint8_t lead)
    {
        if (0x00 == (lead & 0x80)) return 1;
        if (0xC0 == (lead & 0xE0)) return 2;
        if (0xE0 == (lead & 0xF0)) return 3;
        if (0xF0 == (lead & 0xF8)) return 4;
        return 0;
    }

    // Smallest code point that needs a sequence of the given length.
    constexpr char32_t minimum_for_length[] = {0, 0, 0x80, 0x800, 0x10000};

    [[noreturn]] void invalid(size_t offset, std::string_view what)
    {
        throw std::invalid_argument(
            std::format("Invalid UTF-8 at byte {}: {}", offset, what));
    }

} // anonymous namespace

std::u32string decode_utf8(std::string_view utf8)
{
    std::u32string result;
    result.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size()) {
        auto lead = static_cast<uint8_t>(utf8[i]);
        size_t length = sequence_length(lead);
        if (0 == length) {
            invalid(i, std::format("unexpected byte 0x{:02X}", lead));
        }
        if (i + length > utf8.size()) {
            invalid(i, "truncated sequence");
        }

        // Payload bits of the lead byte shrink as the sequence grows.
        char32_t codepoint = 1 == length? lead: lead & (0x7F >> length);
        for (size_t k = 1; k < length; ++k) {
            auto trail = static_cast<uint8_t>(utf8[i + k]);
            if (0x80 != (trail & 0xC0)) {
                invalid(i + k, std::format("bad continuation byte 0x{:02X}", trail));
            }
            codepoint = (codepoint << 6) | (trail & 0x3F);
        }

        if (codepoint < minimum_for_length[length]) {
            invalid(i, "overlong encoding");
        }
        if (codepoint >= 0xD800 and codepoint <= 0xDFFF) {
            invalid(i, std::format("encoded surrogate U+{:X}", static_cast<uint32_t>(codepoint)));
        }
        if (codepoint > 0x10FFFF) {
            invalid(i, std::format("U+{:X} is outside the Unicode range", static_cast<uint32_t>(codepoint)));
        }

        result.push_back(codepoint);
        i += length;
    }

    return result;
}

void append_utf8(std::string& out, char32_t codepoint)
{
    if (codepoint > 0x10FFFF or (codepoint >= 0xD800 and codepoint <= 0xDFFF)) {
        throw std::invalid_argument(
            std::format("Invalid Unicode codepoint: U+{:X}", static_cast<uint32_t>(codepoint)));
    }

    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}
