// hex.hpp

#pragma once

#include <iostream>
#include <cctype>
#include <cstdint>

namespace gzio {
    /** @brief print a single byte as two lowercase hex digits,  optionally followed by its character **/
    struct hex {
        explicit hex(std::uint8_t x, bool w_char = false) : x_{x}, with_char_{w_char} {}

        std::uint8_t x_;
        bool with_char_;
    };

    /** @brief print a 32-bit value as @c 0x followed by 8 hex digits (crc values in messages) **/
    struct hex32 {
        explicit hex32(std::uint32_t x) : x_{x} {}

        std::uint32_t x_;
    };

    /** @brief print a byte range as space-separated hex,  e.g. "[1f 8b 08]" **/
    struct hex_view {
        hex_view(std::uint8_t const * lo, std::uint8_t const * hi, bool as_text = false)
            : lo_{lo}, hi_{hi}, as_text_{as_text} {}
        hex_view(char const * lo, char const * hi, bool as_text = false)
            : lo_{reinterpret_cast<std::uint8_t const *>(lo)},
              hi_{reinterpret_cast<std::uint8_t const *>(hi)},
              as_text_{as_text} {}

        std::uint8_t const * lo_;
        std::uint8_t const * hi_;
        bool as_text_;
    };

    inline char
    hex_digit(std::uint8_t nibble) {
        static constexpr char c_digits[] = "0123456789abcdef";

        return c_digits[nibble & 0xf];
    }

    inline std::ostream &
    operator<< (std::ostream & os, hex const & ins) {
        os << hex_digit(ins.x_ >> 4) << hex_digit(ins.x_);

        if (ins.with_char_)
            os << "(" << (std::isprint(ins.x_) ? static_cast<char>(ins.x_) : '?') << ")";

        return os;
    }

    inline std::ostream &
    operator<< (std::ostream & os, hex32 const & ins) {
        os << "0x";
        for (int shift = 28; shift >= 0; shift -= 4)
            os << hex_digit(static_cast<std::uint8_t>(ins.x_ >> shift));
        return os;
    }

    inline std::ostream &
    operator<< (std::ostream & os, hex_view const & ins) {
        os << "[";
        for (std::uint8_t const * p = ins.lo_; p < ins.hi_; ++p) {
            if (p != ins.lo_)
                os << " ";
            os << hex(*p, ins.as_text_);
        }
        os << "]";
        return os;
    }
} /*namespace gzio*/
