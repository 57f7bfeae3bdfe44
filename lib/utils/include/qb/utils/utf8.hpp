/*
Module Name:
- utf8.hpp

Abstract:
- Byte-limit helpers for UTF-8 text headed for chat, where lines are capped in bytes, not characters.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <string_view>

namespace qb
{

    /// Length of the longest prefix of s within max_bytes that ends on a code point boundary.
    [[nodiscard]] constexpr std::size_t utf8_clip_len(std::string_view s, std::size_t max_bytes) noexcept
    {
        if (s.size() <= max_bytes)
        {
            return s.size();
        }
        std::size_t i = max_bytes;
        while (i > 0 && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80)
        {
            --i; // s[i] is a continuation byte: the cut would split its sequence
        }
        return i;
    }

} // namespace qb
