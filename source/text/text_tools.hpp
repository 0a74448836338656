#ifndef TMCPS_TEXT_TOOLS_HPP
#define TMCPS_TEXT_TOOLS_HPP

// Pure text operations behind the MCP tools. No I/O, no shared state.
// Input is UTF-8; lengths and counts are in code points.

#include <cstdint>
#include <string>
#include <vector>

namespace text_tools {

// Character statistics of a text.
struct TextInfo {
    int64_t length = 0;
    int64_t word_count = 0;
    int64_t char_count_no_spaces = 0;
    int64_t uppercase_count = 0;
    int64_t lowercase_count = 0;
    int64_t digit_count = 0;
    int64_t line_count = 0;
};

// Result of a case transformation.
struct CaseResult {
    bool success = false;
    std::string text;
    std::string detected_format;
    std::string error_text;
};

// Result of truncate().
struct TruncateResult {
    bool success = false;
    std::string text;
    bool was_truncated = false;
    std::string error_text;
};

// Result of count_tokens().
struct TokenEstimate {
    int64_t estimated_tokens = 0;
    int64_t word_count = 0;
    int64_t char_count = 0;
};

// Label of the token estimation heuristic.
extern const char *const TOKEN_ESTIMATION_METHOD;

// Code points in reverse order.
std::string reverse_text(const std::string &text);

// Letter case and digits follow the Unicode Uppercase, Lowercase and Numeric_Type properties.
TextInfo text_info(const std::string &text);

// Whitespace-separated words (runs of anything but space, tab, newline, CR, VT, FF).
std::vector<std::string> whitespace_words(const std::string &text);

// Case styles accepted by transform_case(), in the order they are reported.
const std::vector<std::string> &supported_case_styles();

// First case style the whole text conforms to, or "unknown".
std::string detect_case(const std::string &text);

// Lower-cased words of an identifier or phrase in any case style.
std::vector<std::string> split_words(const std::string &text);

// Joins words in the given case style. target must be a supported style.
std::string join_words(const std::vector<std::string> &words, const std::string &target);

CaseResult transform_case(const std::string &text, const std::string &target);

// Lower-case ASCII slug: NFKD, then anything non-ASCII dropped and non-alphanumeric
// runs turned into '-'. Throws std::runtime_error if ICU normalization fails.
std::string slugify(const std::string &text);

// http:// and https:// URLs in order of appearance.
std::vector<std::string> extract_urls(const std::string &text);

// Cut text to at most max_length code points on a word boundary, ending in suffix.
TruncateResult truncate(const std::string &text, int64_t max_length, const std::string &suffix);

TokenEstimate count_tokens(const std::string &text);

} // namespace text_tools

#endif // TMCPS_TEXT_TOOLS_HPP
