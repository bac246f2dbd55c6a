/*
 * File: include/common/sanitize.hpp
 * Project: Battle Relay
 * Purpose: Allow-list filter for scraped text before it becomes a cache key
 *          or is echoed to clients
 * Notes:
 *  - Keeps letters, digits, whitespace, the battle marker and '#'
 *  - Input is UTF-8; malformed sequences are dropped
 *  - Character classes come from ICU, so every script is covered
 * Last updated: 2026-10-18
 */

#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

// U+2694 CROSSED SWORDS
inline constexpr std::string_view kMarkerGlyph = "\xE2\x9A\x94";
inline constexpr UChar32 kMarkerCodePoint = 0x2694;

namespace sanitize_detail
{

// Alphabetic property or any numeric category (Nd, Nl, No).
inline bool is_alnum(UChar32 c)
{
    if (u_hasBinaryProperty(c, UCHAR_ALPHABETIC))
        return true;
    const auto t = u_charType(c);
    return t == U_DECIMAL_DIGIT_NUMBER || t == U_LETTER_NUMBER || t == U_OTHER_NUMBER;
}

inline bool keep(UChar32 c)
{
    return c == '#' || c == kMarkerCodePoint || u_isUWhiteSpace(c) || is_alnum(c);
}

} // namespace sanitize_detail

inline std::string sanitize(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    const auto *bytes = reinterpret_cast<const uint8_t *>(input.data());
    const auto length = static_cast<int32_t>(input.size());
    int32_t i = 0;
    while (i < length)
    {
        const int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0)
            continue; // ill-formed subsequence, already skipped
        if (sanitize_detail::keep(c))
            out.append(input.substr(start, i - start));
    }
    return out;
}

inline bool contains_marker(std::string_view text)
{
    return text.find(kMarkerGlyph) != std::string_view::npos;
}
