/** @file utf8.hpp **/

#pragma once

#include <string_view>
#include <cstddef>
#include <cstdint>

namespace gzio {
    /** @brief true iff @p b is a utf-8 continuation byte (10xxxxxx) **/
    inline bool
    utf8_is_continuation(char b) {
        return (static_cast<std::uint8_t>(b) & 0xc0) == 0x80;
    }

    /** @brief number of code points in @p s.

        Counts non-continuation bytes;  exact for valid utf-8.
     **/
    std::size_t utf8_length(std::string_view s);

    /** @brief byte offset just past the first @p n_char code points of @p s,
        or @c s.size() if @p s has fewer than @p n_char code points.
     **/
    std::size_t utf8_offset(std::string_view s, std::size_t n_char);

    /** @brief length in bytes of the sequence introduced by lead byte @p b (1 for invalid lead bytes) **/
    std::size_t utf8_sequence_z(char b);

    /** @brief decode the code point starting at @p s[0];  returns U+FFFD for malformed input **/
    std::uint32_t utf8_decode_one(std::string_view s);
} /*namespace gzio*/
