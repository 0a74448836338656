#ifndef TMCPS_UTF8_HPP
#define TMCPS_UTF8_HPP

// UTF-8 <-> code point conversion used by the text tools.
// All lengths reported by tools are in code points, not bytes.

#include <string>

namespace utf8 {

// Decodes UTF-8 into code points. Invalid sequences (broken multibyte,
// invalid lead bytes, overlong or surrogate encodings) become U+FFFD.
std::u32string decode(const std::string &text);

// Encodes code points back to UTF-8. Values outside the Unicode range and
// surrogates are written as U+FFFD.
std::string encode(const std::u32string &code_points);

// Number of code points in text (same counting rules as decode()).
size_t length(const std::string &text);

} // namespace utf8

#endif // TMCPS_UTF8_HPP
