#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace regix::common {

// Number of UTF-8 code points in the input. Continuation bytes are not counted, so malformed
// sequences still produce a bounded, monotonic length.
inline size_t codePointCount(std::string_view input) {
    size_t count = 0;
    for (unsigned char c : input) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

// ASCII-only lower casing. Multi-byte sequences pass through untouched (Hangul has no case).
inline std::string toLowerAscii(std::string_view input) {
    std::string out(input);
    for (auto& ch : out) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            ch = static_cast<char>(std::tolower(c));
        }
    }
    return out;
}

inline bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Decodes the code point starting at pos and stores its byte length in length. Malformed or
// truncated sequences decode as U+FFFD with length 1.
inline char32_t decodeCodePoint(std::string_view s, size_t pos, size_t& length) {
    constexpr char32_t kReplacement = 0xFFFD;
    const auto lead = static_cast<unsigned char>(s[pos]);
    length = 1;
    if (lead < 0x80) {
        return lead;
    }

    size_t extra = 0;
    char32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        return kReplacement;
    }
    if (pos + extra >= s.size()) {
        return kReplacement;
    }
    for (size_t i = 1; i <= extra; ++i) {
        const auto c = static_cast<unsigned char>(s[pos + i]);
        if ((c & 0xC0) != 0x80) {
            return kReplacement;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    length = extra + 1;
    return cp;
}

// Start offset of the code point that ends just before pos (pos > 0).
inline size_t previousCodePointStart(std::string_view s, size_t pos) {
    size_t start = pos - 1;
    for (int steps = 0; steps < 3 && start > 0 &&
                        (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80;
         ++steps) {
        --start;
    }
    return start;
}

// White_Space code points: ASCII, NEL, NBSP, Ogham, the U+2000 block spaces, line and
// paragraph separators, narrow/medium math spaces and the ideographic space.
inline bool isUnicodeSpace(char32_t cp) {
    if (cp < 0x80) {
        return isAsciiSpace(static_cast<unsigned char>(cp));
    }
    return cp == 0x85 || cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

// Word characters: letters, digits and connector punctuation. Non-ASCII code points are word
// characters unless they fall in a punctuation, symbol, control or space range.
inline bool isWordCodePoint(char32_t cp) {
    if (cp < 0x80) {
        const auto c = static_cast<unsigned char>(cp);
        return std::isalnum(c) || c == '_';
    }
    if (isUnicodeSpace(cp)) {
        return false;
    }
    // C1 controls and Latin-1 punctuation/symbols (ª µ º and the fractions stay word)
    if (cp <= 0xBF) {
        return cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 ||
               cp == 0xBA || (cp >= 0xBC && cp <= 0xBE);
    }
    if (cp == 0xD7 || cp == 0xF7) {
        return false;
    }
    // General punctuation (U+203F/U+2040 are connectors), super/subscripts stay word
    if (cp >= 0x2000 && cp <= 0x206F) {
        return cp == 0x203F || cp == 0x2040;
    }
    // Currency, arrows, math operators, technical, box drawing, shapes, dingbats
    if ((cp >= 0x20A0 && cp <= 0x20CF) || (cp >= 0x2190 && cp <= 0x23FF) ||
        (cp >= 0x2500 && cp <= 0x27BF) || (cp >= 0x2900 && cp <= 0x2BFF) ||
        (cp >= 0x2E00 && cp <= 0x2E7F)) {
        return false;
    }
    // CJK symbols and punctuation: 々 〆 〇, Hangzhou numerals and kana repeat marks are word
    if (cp >= 0x3000 && cp <= 0x303F) {
        return (cp >= 0x3005 && cp <= 0x3007) || (cp >= 0x3021 && cp <= 0x3029) ||
               (cp >= 0x3031 && cp <= 0x3035) || (cp >= 0x3038 && cp <= 0x303C);
    }
    // Middle dot variants and CJK compatibility/small forms
    if (cp == 0x30FB || (cp >= 0xFE10 && cp <= 0xFE19) || (cp >= 0xFE30 && cp <= 0xFE6F)) {
        return cp == 0xFE33 || cp == 0xFE34 || cp == 0xFE4D || cp == 0xFE4E || cp == 0xFE4F;
    }
    // Fullwidth ASCII punctuation (fullwidth low line is a connector)
    if ((cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
        (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65)) {
        return cp == 0xFF3F;
    }
    return cp != 0xFFFD;
}

// Split on Unicode whitespace, dropping empty tokens.
inline std::vector<std::string> splitWhitespace(std::string_view input) {
    std::vector<std::string> tokens;
    size_t start = 0;
    size_t i = 0;
    while (i < input.size()) {
        size_t length = 0;
        const char32_t cp = decodeCodePoint(input, i, length);
        if (isUnicodeSpace(cp)) {
            if (i > start) {
                tokens.emplace_back(input.substr(start, i - start));
            }
            start = i + length;
        }
        i += length;
    }
    if (input.size() > start) {
        tokens.emplace_back(input.substr(start));
    }
    return tokens;
}

// Replaces every code point that is neither a word character nor whitespace with a space.
inline std::string replacePunctuation(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        size_t length = 0;
        const char32_t cp = decodeCodePoint(input, i, length);
        if (isWordCodePoint(cp) || isUnicodeSpace(cp)) {
            out.append(input.substr(i, length));
        } else {
            out.push_back(' ');
        }
        i += length;
    }
    return out;
}

// True if needle occurs in haystack bounded by non-word code points (or the string ends) on
// both sides.
inline bool containsWholeWord(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) {
        return false;
    }
    size_t length = 0;
    const bool needleStartsWord = isWordCodePoint(decodeCodePoint(needle, 0, length));
    const bool needleEndsWord = isWordCodePoint(
        decodeCodePoint(needle, previousCodePointStart(needle, needle.size()), length));

    size_t pos = haystack.find(needle);
    while (pos != std::string_view::npos) {
        const size_t end = pos + needle.size();
        bool leftOk = true;
        bool rightOk = true;
        if (needleStartsWord && pos > 0) {
            leftOk = !isWordCodePoint(
                decodeCodePoint(haystack, previousCodePointStart(haystack, pos), length));
        }
        if (needleEndsWord && end < haystack.size()) {
            rightOk = !isWordCodePoint(decodeCodePoint(haystack, end, length));
        }
        if (leftOk && rightOk) {
            return true;
        }
        pos = haystack.find(needle, pos + 1);
    }
    return false;
}

} // namespace regix::common
