#include "utils/utf8.hpp"

#include <cstdint>

namespace utf8 {

namespace {

constexpr char32_t kReplacementCharacter = 0xFFFD;

// Returns number of bytes that form a valid UTF-8 lead byte (1-4), or 0 if invalid.
unsigned char lead_length(unsigned char byte) {
    if (byte < 0x80u) {
        return 1;
    }
    if (byte >= 0xC2u && byte <= 0xDFu) {
        return 2;
    }
    if (byte >= 0xE0u && byte <= 0xEFu) {
        return 3;
    }
    if (byte >= 0xF0u && byte <= 0xF4u) {
        return 4;
    }
    return 0;
}

// Returns true if byte is a valid UTF-8 continuation (0x80..0xBF).
bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

bool is_surrogate(char32_t code_point) {
    return code_point >= 0xD800 && code_point <= 0xDFFF;
}

} // namespace

std::u32string decode(const std::string &text) {
    std::u32string result;
    result.reserve(text.size());

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        unsigned char lead = *pointer;
        unsigned char length = lead_length(lead);

        if (length == 0 || pointer + length > end) {
            result.push_back(kReplacementCharacter);
            ++pointer;
            continue;
        }

        if (length == 1) {
            result.push_back(static_cast<char32_t>(lead));
            ++pointer;
            continue;
        }

        bool valid = true;
        for (unsigned char index = 1; index < length; ++index) {
            if (!is_continuation(pointer[index])) {
                valid = false;
                break;
            }
        }

        char32_t code_point = 0;
        if (valid) {
            code_point = static_cast<char32_t>(lead & (0xFFu >> (length + 1)));
            for (unsigned char index = 1; index < length; ++index) {
                code_point = (code_point << 6) | static_cast<char32_t>(pointer[index] & 0x3Fu);
            }
            // Reject overlong three/four byte forms, surrogates and values past U+10FFFF.
            if ((length == 3 && code_point < 0x800) || (length == 4 && code_point < 0x10000) ||
                is_surrogate(code_point) || code_point > 0x10FFFF) {
                valid = false;
            }
        }

        if (!valid) {
            result.push_back(kReplacementCharacter);
            ++pointer;
            continue;
        }

        result.push_back(code_point);
        pointer += length;
    }

    return result;
}

std::string encode(const std::u32string &code_points) {
    std::string result;
    result.reserve(code_points.size());

    for (char32_t code_point : code_points) {
        if (code_point > 0x10FFFF || is_surrogate(code_point)) {
            code_point = kReplacementCharacter;
        }

        if (code_point < 0x80) {
            result.push_back(static_cast<char>(code_point));
        } else if (code_point < 0x800) {
            result.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
            result.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else if (code_point < 0x10000) {
            result.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
            result.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else {
            result.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
            result.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
    }

    return result;
}

size_t length(const std::string &text) {
    return decode(text).size();
}

} // namespace utf8
