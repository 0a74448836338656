#include "text/text_tools.hpp"

#include "utils/utf8.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

#include <algorithm>
#include <stdexcept>

namespace text_tools {

const char *const TOKEN_ESTIMATION_METHOD = "words * 1.3";

namespace {

bool is_space(char32_t character) {
    return character == U' ' || character == U'\t' || character == U'\n' || character == U'\r' ||
           character == U'\v' || character == U'\f';
}

bool is_ascii_upper(char character) {
    return character >= 'A' && character <= 'Z';
}

bool is_ascii_lower(char character) {
    return character >= 'a' && character <= 'z';
}

bool is_ascii_digit(char character) {
    return character >= '0' && character <= '9';
}

bool is_ascii_alnum(char character) {
    return is_ascii_upper(character) || is_ascii_lower(character) || is_ascii_digit(character);
}

char to_ascii_lower(char character) {
    return is_ascii_upper(character) ? static_cast<char>(character - 'A' + 'a') : character;
}

char to_ascii_upper(char character) {
    return is_ascii_lower(character) ? static_cast<char>(character - 'a' + 'A') : character;
}

std::string capitalize(const std::string &word) {
    std::string result = word;
    if (!result.empty()) {
        result[0] = to_ascii_upper(result[0]);
    }
    return result;
}

std::string join(const std::vector<std::string> &words, const std::string &separator) {
    std::string result;
    for (size_t index = 0; index < words.size(); ++index) {
        if (index > 0) {
            result += separator;
        }
        result += words[index];
    }
    return result;
}

// True if text is two or more non-empty segments separated by separator, every
// character satisfies is_member, and the first character satisfies is_first.
template <typename FirstPredicate, typename MemberPredicate>
bool is_segmented(const std::string &text, char separator, FirstPredicate is_first, MemberPredicate is_member) {
    if (text.empty() || !is_first(text[0])) {
        return false;
    }
    size_t segment_count = 1;
    size_t segment_length = 0;
    for (char character : text) {
        if (character == separator) {
            if (segment_length == 0) {
                return false;
            }
            ++segment_count;
            segment_length = 0;
            continue;
        }
        if (!is_member(character)) {
            return false;
        }
        ++segment_length;
    }
    return segment_count >= 2 && segment_length > 0;
}

// First character satisfies is_first, the rest satisfy is_member.
template <typename FirstPredicate, typename MemberPredicate>
bool is_single_word(const std::string &text, FirstPredicate is_first, MemberPredicate is_member) {
    if (text.empty() || !is_first(text[0])) {
        return false;
    }
    return std::all_of(text.begin() + 1, text.end(), is_member);
}

bool is_title_case(const std::string &text) {
    size_t word_count = 0;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(' ', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        // Each word: one capital followed by at least one lowercase letter.
        if (end - start < 2 || !is_ascii_upper(text[start]) ||
            !std::all_of(text.begin() + static_cast<std::ptrdiff_t>(start) + 1,
                         text.begin() + static_cast<std::ptrdiff_t>(end), is_ascii_lower)) {
            return false;
        }
        ++word_count;
        start = end + 1;
    }
    return word_count >= 2;
}

void check_icu_status(UErrorCode status, const char *operation) {
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string(operation) + " failed: " + u_errorName(status));
    }
}

// Compatibility decomposition (NFKD): accents split off their base letter,
// ligatures and fullwidth forms become plain letters.
std::string decompose_compatibility(const std::string &text) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2 *nfkd = icu::Normalizer2::getNFKDInstance(status);
    check_icu_status(status, "loading the NFKD normalizer");

    icu::UnicodeString decomposed = nfkd->normalize(icu::UnicodeString::fromUTF8(text), status);
    check_icu_status(status, "NFKD normalization");

    std::string result;
    decomposed.toUTF8String(result);
    return result;
}

// Unicode Numeric_Type Decimal or Digit (includes superscripts, excludes fractions).
bool is_unicode_digit(UChar32 character) {
    int numeric_type = u_getIntPropertyValue(character, UCHAR_NUMERIC_TYPE);
    return numeric_type == U_NT_DECIMAL || numeric_type == U_NT_DIGIT;
}

bool is_url_terminator(char character) {
    switch (character) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '\v':
    case '\f':
    case '<':
    case '>':
    case '"':
    case '\'':
    case ')':
    case ']':
        return true;
    default:
        return false;
    }
}

bool starts_with_ignoring_case(const std::string &text, size_t position, const std::string &prefix) {
    if (text.size() - position < prefix.size()) {
        return false;
    }
    for (size_t index = 0; index < prefix.size(); ++index) {
        if (to_ascii_lower(text[position + index]) != prefix[index]) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string reverse_text(const std::string &text) {
    std::u32string code_points = utf8::decode(text);
    std::reverse(code_points.begin(), code_points.end());
    return utf8::encode(code_points);
}

TextInfo text_info(const std::string &text) {
    std::u32string code_points = utf8::decode(text);

    TextInfo info;
    info.length = static_cast<int64_t>(code_points.size());
    info.word_count = static_cast<int64_t>(whitespace_words(text).size());
    info.line_count = 1;

    for (char32_t character : code_points) {
        if (character != U' ') {
            ++info.char_count_no_spaces;
        }
        if (character == U'\n') {
            ++info.line_count;
        }
        UChar32 code_point = static_cast<UChar32>(character);
        if (u_isUUppercase(code_point)) {
            ++info.uppercase_count;
        }
        if (u_isULowercase(code_point)) {
            ++info.lowercase_count;
        }
        if (is_unicode_digit(code_point)) {
            ++info.digit_count;
        }
    }

    return info;
}

std::vector<std::string> whitespace_words(const std::string &text) {
    std::vector<std::string> words;
    std::u32string current;
    for (char32_t character : utf8::decode(text)) {
        if (is_space(character)) {
            if (!current.empty()) {
                words.push_back(utf8::encode(current));
                current.clear();
            }
            continue;
        }
        current.push_back(character);
    }
    if (!current.empty()) {
        words.push_back(utf8::encode(current));
    }
    return words;
}

const std::vector<std::string> &supported_case_styles() {
    static const std::vector<std::string> styles = {
        "snake_case", "SCREAMING_SNAKE_CASE", "camelCase", "PascalCase", "kebab-case", "Title Case",
    };
    return styles;
}

std::string detect_case(const std::string &text) {
    auto is_lower_or_digit = [](char character) { return is_ascii_lower(character) || is_ascii_digit(character); };
    auto is_upper_or_digit = [](char character) { return is_ascii_upper(character) || is_ascii_digit(character); };

    if (is_segmented(text, '_', is_ascii_lower, is_lower_or_digit)) {
        return "snake_case";
    }
    if (is_segmented(text, '_', is_ascii_upper, is_upper_or_digit)) {
        return "SCREAMING_SNAKE_CASE";
    }
    if (is_single_word(text, is_ascii_lower, is_ascii_alnum)) {
        return "camelCase";
    }
    if (is_single_word(text, is_ascii_upper, is_ascii_alnum)) {
        return "PascalCase";
    }
    if (is_segmented(text, '-', is_ascii_lower, is_lower_or_digit)) {
        return "kebab-case";
    }
    if (is_title_case(text)) {
        return "Title Case";
    }
    return "unknown";
}

std::vector<std::string> split_words(const std::string &text) {
    // Boundary between a lowercase letter or digit and an uppercase letter: helloWorld.
    std::string marked;
    marked.reserve(text.size() * 2);
    for (size_t index = 0; index < text.size(); ++index) {
        marked += text[index];
        if (index + 1 < text.size() && (is_ascii_lower(text[index]) || is_ascii_digit(text[index])) &&
            is_ascii_upper(text[index + 1])) {
            marked += '_';
        }
    }

    // Boundary before the last capital of an acronym that starts a word: HTTPServer.
    std::string separated;
    separated.reserve(marked.size() * 2);
    for (size_t index = 0; index < marked.size(); ++index) {
        if (index > 0 && index + 1 < marked.size() && is_ascii_upper(marked[index - 1]) &&
            is_ascii_upper(marked[index]) && is_ascii_lower(marked[index + 1])) {
            separated += '_';
        }
        separated += marked[index];
    }

    std::vector<std::string> words;
    std::string current;
    for (char character : separated) {
        if (is_ascii_alnum(character)) {
            current += to_ascii_lower(character);
            continue;
        }
        if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

std::string join_words(const std::vector<std::string> &words, const std::string &target) {
    if (target == "SCREAMING_SNAKE_CASE") {
        std::string joined = join(words, "_");
        std::transform(joined.begin(), joined.end(), joined.begin(), to_ascii_upper);
        return joined;
    }
    if (target == "camelCase") {
        std::string joined;
        for (size_t index = 0; index < words.size(); ++index) {
            joined += (index == 0) ? words[index] : capitalize(words[index]);
        }
        return joined;
    }
    if (target == "PascalCase") {
        std::string joined;
        for (const auto &word : words) {
            joined += capitalize(word);
        }
        return joined;
    }
    if (target == "kebab-case") {
        return join(words, "-");
    }
    if (target == "Title Case") {
        std::vector<std::string> capitalized;
        for (const auto &word : words) {
            capitalized.push_back(capitalize(word));
        }
        return join(capitalized, " ");
    }
    return join(words, "_");
}

CaseResult transform_case(const std::string &text, const std::string &target) {
    CaseResult result;

    const auto &styles = supported_case_styles();
    if (std::find(styles.begin(), styles.end(), target) == styles.end()) {
        result.error_text = "Unknown target case '" + target + "'. Valid: " + join(styles, ", ");
        return result;
    }

    result.success = true;
    result.detected_format = detect_case(text);
    result.text = join_words(split_words(text), target);
    return result;
}

std::string slugify(const std::string &text) {
    std::string slug;
    bool pending_separator = false;

    for (char character : decompose_compatibility(text)) {
        // Whatever is still non-ASCII after decomposition is dropped without a separator.
        if (static_cast<unsigned char>(character) >= 0x80) {
            continue;
        }
        character = to_ascii_lower(character);
        if (is_ascii_lower(character) || is_ascii_digit(character)) {
            if (pending_separator && !slug.empty()) {
                slug += '-';
            }
            pending_separator = false;
            slug += character;
        } else {
            pending_separator = true;
        }
    }

    return slug;
}

std::vector<std::string> extract_urls(const std::string &text) {
    std::vector<std::string> urls;
    size_t position = 0;

    while (position < text.size()) {
        size_t scheme_length = 0;
        if (starts_with_ignoring_case(text, position, "https://")) {
            scheme_length = 8;
        } else if (starts_with_ignoring_case(text, position, "http://")) {
            scheme_length = 7;
        }

        if (scheme_length == 0) {
            ++position;
            continue;
        }

        size_t end = position + scheme_length;
        while (end < text.size() && !is_url_terminator(text[end])) {
            ++end;
        }

        if (end == position + scheme_length) {
            // Scheme with nothing after it.
            ++position;
            continue;
        }

        urls.push_back(text.substr(position, end - position));
        position = end;
    }

    return urls;
}

TruncateResult truncate(const std::string &text, int64_t max_length, const std::string &suffix) {
    TruncateResult result;
    if (max_length < 0) {
        result.error_text = "max_length must be non-negative";
        return result;
    }

    std::u32string code_points = utf8::decode(text);
    result.success = true;

    if (static_cast<int64_t>(code_points.size()) <= max_length) {
        result.text = text;
        return result;
    }

    result.was_truncated = true;
    std::u32string suffix_points = utf8::decode(suffix);
    int64_t limit = max_length - static_cast<int64_t>(suffix_points.size());

    if (limit <= 0) {
        result.text = utf8::encode(suffix_points.substr(0, static_cast<size_t>(max_length)));
        return result;
    }

    std::u32string truncated = code_points.substr(0, static_cast<size_t>(limit));
    size_t last_space = truncated.rfind(U' ');
    if (last_space != std::u32string::npos && last_space > 0) {
        truncated.resize(last_space);
    }
    while (!truncated.empty() && is_space(truncated.back())) {
        truncated.pop_back();
    }

    result.text = utf8::encode(truncated) + suffix;
    return result;
}

TokenEstimate count_tokens(const std::string &text) {
    TokenEstimate estimate;
    estimate.word_count = static_cast<int64_t>(whitespace_words(text).size());
    estimate.char_count = static_cast<int64_t>(utf8::length(text));
    // ceil(words * 1.3) without floating point rounding surprises.
    estimate.estimated_tokens = (estimate.word_count * 13 + 9) / 10;
    return estimate;
}

} // namespace text_tools
