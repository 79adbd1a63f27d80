#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace razdel {

// Code point strings are held in std::wstring so boost::wregex can scan them.
// Offsets are code point offsets, which needs a 32-bit wchar_t.
static_assert(sizeof(wchar_t) == 4, "razdel requires a 32-bit wchar_t");

// Blocking windows, in code points
constexpr size_t ABBREVIATION_LOOK_BACK = 10;
constexpr size_t INITIALS_WINDOW = 20;

// Cyrillic Unicode Ranges
constexpr char32_t CYR_UPPER_START = 0x0410; // А
constexpr char32_t CYR_UPPER_END = 0x042F;   // Я
constexpr char32_t CYR_LOWER_START = 0x0430; // а
constexpr char32_t CYR_LOWER_END = 0x044F;   // я
constexpr char32_t CYR_YO_UPPER = 0x0401;    // Ё
constexpr char32_t CYR_YO_LOWER = 0x0451;    // ё

inline bool is_cyrillic_upper(char32_t c) {
    return (c >= CYR_UPPER_START && c <= CYR_UPPER_END) || c == CYR_YO_UPPER;
}

inline bool is_cyrillic_lower(char32_t c) {
    return (c >= CYR_LOWER_START && c <= CYR_LOWER_END) || c == CYR_YO_LOWER;
}

inline bool is_digit(char32_t c) {
    return c >= '0' && c <= '9';
}

// Cased lowercase letters: ASCII, Latin-1, Cyrillic (incl. ѐ-џ)
inline bool is_lower(char32_t c) {
    if (c >= 'a' && c <= 'z') return true;
    if (c >= 0x00DF && c <= 0x00FF && c != 0x00F7) return true;
    return c >= 0x0430 && c <= 0x045F;
}

inline bool is_space(char32_t c) {
    switch (c) {
        case ' ': case '\t': case '\n': case '\r': case '\v': case '\f':
        case 0x001C: case 0x001D: case 0x001E: case 0x001F:
        case 0x0085: // NEL
        case 0x00A0: // NBSP
        case 0x1680:
        case 0x2028: case 0x2029:
        case 0x202F: // narrow NBSP
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

inline bool is_word_char(char32_t c) {
    if (is_digit(c) || c == '_') return true;
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')) return true;
    // Latin-1 letters and Latin Extended-A/B
    if (c >= 0x00C0 && c <= 0x024F && c != 0x00D7 && c != 0x00F7) return true;
    // Cyrillic
    return c >= 0x0400 && c <= 0x04FF;
}

inline bool is_terminal_punct(char32_t c) {
    return c == '.' || c == '!' || c == '?';
}

inline char32_t to_lower(char32_t c) {
    if (c >= 'A' && c <= 'Z') return c + 0x20;
    if (c >= 0x00C0 && c <= 0x00DE && c != 0x00D7) return c + 0x20;
    if (c >= CYR_UPPER_START && c <= CYR_UPPER_END) return c + 0x20;
    // Ѐ-Џ (Ё among them)
    if (c >= 0x0400 && c <= 0x040F) return c + 0x50;
    return c;
}

// Regex bracket-class bodies, shared by the rule table and the blocking checks.
// Spelled out instead of \s and \w so matching does not depend on the locale.
#define RAZDEL_SPACE_CLASS L" \t\n\r\v\f\x1C-\x1F\u0085\u00A0\u1680\u2000-\u200A\u2028\u2029\u202F\u205F\u3000"
#define RAZDEL_WORD_CLASS L"0-9A-Za-z_\u00C0-\u024F\u0400-\u04FF"
#define RAZDEL_CYR_UPPER_CLASS L"\u0410-\u042F\u0401"
#define RAZDEL_CYR_LOWER_CLASS L"\u0430-\u044F\u0451"

// UTF-8 Helper: Get code point and length from string at index
inline std::pair<char32_t, int> get_char_at(std::string_view text, size_t index) {
    if (index >= text.length()) return {0, 0};

    unsigned char c = static_cast<unsigned char>(text[index]);
    if (c < 0x80) return {c, 1};

    auto cont = [&](size_t k) -> char32_t {
        return static_cast<unsigned char>(text[index + k]) & 0x3F;
    };
    // Every trailing byte must be 10xxxxxx, otherwise only the lead byte is dropped
    auto valid_tail = [&](size_t count) {
        for (size_t k = 1; k <= count; ++k) {
            if ((static_cast<unsigned char>(text[index + k]) & 0xC0) != 0x80) return false;
        }
        return true;
    };

    if ((c & 0xE0) == 0xC0) {
        if (index + 1 >= text.length() || !valid_tail(1)) return {0, 0};
        return {((c & 0x1F) << 6) | cont(1), 2};
    }

    if ((c & 0xF0) == 0xE0) {
        if (index + 2 >= text.length() || !valid_tail(2)) return {0, 0};
        return {((c & 0x0F) << 12) | (cont(1) << 6) | cont(2), 3};
    }

    if ((c & 0xF8) == 0xF0) {
        if (index + 3 >= text.length() || !valid_tail(3)) return {0, 0};
        return {((c & 0x07) << 18) | (cont(1) << 12) | (cont(2) << 6) | cont(3), 4};
    }

    return {0, 0}; // Invalid or unsupported
}

// UTF-8 to code points; invalid bytes are skipped
inline void decode_utf8(std::string_view utf8, std::wstring& out) {
    out.clear();
    out.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.length()) {
        auto [c, len] = get_char_at(utf8, i);
        if (len == 0) { i++; continue; }
        out.push_back(static_cast<wchar_t>(c));
        i += len;
    }
}

inline std::wstring decode_utf8(std::string_view utf8) {
    std::wstring out;
    decode_utf8(utf8, out);
    return out;
}

inline void append_utf8(std::string& out, char32_t c) {
    if (c <= 0x7F) {
        out.push_back(static_cast<char>(c));
    } else if (c <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((c >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((c >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | ((c >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
}

// Code point range [start, end) to UTF-8
inline std::string encode_utf8(std::wstring_view cps, size_t start, size_t end) {
    std::string utf8;
    if (end > cps.size()) end = cps.size();
    if (start >= end) return utf8;
    utf8.reserve((end - start) * 2); // Average for Cyrillic
    for (size_t i = start; i < end; ++i) {
        append_utf8(utf8, static_cast<char32_t>(cps[i]));
    }
    return utf8;
}

inline std::string encode_utf8(std::wstring_view cps) {
    return encode_utf8(cps, 0, cps.size());
}

// Lower-case and trim a code point range, returned as UTF-8 (lexicon key form)
inline std::string normalize_key(std::wstring_view cps, size_t start, size_t end) {
    if (end > cps.size()) end = cps.size();
    while (start < end && is_space(static_cast<char32_t>(cps[start]))) ++start;
    while (end > start && is_space(static_cast<char32_t>(cps[end - 1]))) --end;
    std::string key;
    key.reserve((end - start) * 2);
    for (size_t i = start; i < end; ++i) {
        append_utf8(key, to_lower(static_cast<char32_t>(cps[i])));
    }
    return key;
}

inline std::string normalize_key(std::string_view utf8) {
    std::wstring cps = decode_utf8(utf8);
    return normalize_key(cps, 0, cps.size());
}

} // namespace razdel
