// utf8.cpp

#include "textio/utf8.hpp"

using namespace std;

namespace gzio {
    size_t
    utf8_length(string_view s)
    {
        size_t n = 0;

        for (char b : s) {
            if (!utf8_is_continuation(b))
                ++n;
        }

        return n;
    }

    size_t
    utf8_offset(string_view s, size_t n_char)
    {
        size_t n = 0;

        for (size_t i = 0, z = s.size(); i < z; ++i) {
            if (!utf8_is_continuation(s[i])) {
                if (n == n_char)
                    return i;
                ++n;
            }
        }

        return s.size();
    }

    size_t
    utf8_sequence_z(char b)
    {
        uint8_t c = static_cast<uint8_t>(b);

        if (c < 0x80)
            return 1;
        if ((c & 0xe0) == 0xc0)
            return 2;
        if ((c & 0xf0) == 0xe0)
            return 3;
        if ((c & 0xf8) == 0xf0)
            return 4;

        return 1;
    }

    uint32_t
    utf8_decode_one(string_view s)
    {
        constexpr uint32_t c_replacement = 0xfffd;

        if (s.empty())
            return c_replacement;

        size_t z = utf8_sequence_z(s[0]);
        uint8_t c0 = static_cast<uint8_t>(s[0]);

        if (z == 1)
            return (c0 < 0x80) ? c0 : c_replacement;

        if (s.size() < z)
            return c_replacement;

        uint32_t cp = c0 & (0x7f >> z);

        for (size_t i = 1; i < z; ++i) {
            if (!utf8_is_continuation(s[i]))
                return c_replacement;

            cp = (cp << 6) | (static_cast<uint8_t>(s[i]) & 0x3f);
        }

        return cp;
    }
} /*namespace gzio*/

/* end utf8.cpp */
