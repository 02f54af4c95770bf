// gzip_header.cpp

#include "compression/gzip_header.hpp"
#include "compression/error.hpp"
#include "compression/hex.hpp"
#include "compression/tostr.hpp"
#include <zlib.h>
#include <algorithm>
#include <cstring>

using namespace std;

namespace gzio {
    using namespace gzip_format;

    namespace {
        uint32_t
        load_u32le(uint8_t const * p) {
            return (static_cast<uint32_t>(p[0])
                    | (static_cast<uint32_t>(p[1]) << 8)
                    | (static_cast<uint32_t>(p[2]) << 16)
                    | (static_cast<uint32_t>(p[3]) << 24));
        }

        void
        store_u32le(uint32_t x, uint8_t * p) {
            p[0] = static_cast<uint8_t>(x);
            p[1] = static_cast<uint8_t>(x >> 8);
            p[2] = static_cast<uint8_t>(x >> 16);
            p[3] = static_cast<uint8_t>(x >> 24);
        }

        /* find zero-terminated field starting at pos;  returns position of terminator or npos */
        size_t
        find_nul(span<uint8_t const> x, size_t pos) {
            void const * p = ::memchr(x.lo() + pos, 0, x.size() - pos);

            if (!p)
                return string::npos;

            return static_cast<uint8_t const *>(p) - x.lo();
        }
    }

    header_parse_result
    parse_gzip_header(span<uint8_t const> x)
    {
        header_parse_result retval;

        /* reject bad magic as soon as the bytes are visible */
        if ((x.size() >= 1 && x[0] != c_magic0) || (x.size() >= 2 && x[1] != c_magic1)) {
            throw format_error(tostr("Not a gzipped file: bad magic ",
                                     hex_view(x.lo(), x.lo() + std::min<size_t>(x.size(), 2))));
        }

        if (x.size() < c_fixed_header_z)
            return retval;

        if (x[2] != c_method_deflate)
            throw format_error(tostr("Unknown compression method [", static_cast<int>(x[2]), "]"));

        gzip_header & hdr = retval.header;

        hdr.flags = x[3];
        hdr.mtime = load_u32le(x.lo() + 4);
        hdr.xfl = x[8];
        hdr.os = x[9];

        if (hdr.flags & c_freserved)
            throw format_error(tostr("Reserved gzip header flags set [", hex(hdr.flags), "]"));

        size_t pos = c_fixed_header_z;

        if (hdr.flags & c_fextra) {
            if (x.size() < pos + 2)
                return retval;

            size_t xlen = x[pos] | (static_cast<size_t>(x[pos + 1]) << 8);

            pos += 2;

            if (x.size() < pos + xlen)
                return retval;

            hdr.extra.assign(reinterpret_cast<char const *>(x.lo() + pos), xlen);
            pos += xlen;
        }

        if (hdr.flags & c_fname) {
            size_t end = find_nul(x, pos);

            if (end == string::npos)
                return retval;

            hdr.filename = string(reinterpret_cast<char const *>(x.lo() + pos), end - pos);
            pos = end + 1;
        }

        if (hdr.flags & c_fcomment) {
            size_t end = find_nul(x, pos);

            if (end == string::npos)
                return retval;

            hdr.comment = string(reinterpret_cast<char const *>(x.lo() + pos), end - pos);
            pos = end + 1;
        }

        if (hdr.flags & c_fhcrc) {
            if (x.size() < pos + 2)
                return retval;

            uint32_t expected = x[pos] | (static_cast<uint32_t>(x[pos + 1]) << 8);
            uint32_t actual = ::crc32(0L, x.lo(), static_cast<uInt>(pos)) & 0xffff;

            if (expected != actual)
                throw format_error(tostr("Header CRC check failed ", hex32(expected), " != ", hex32(actual)));

            pos += 2;
        }

        retval.complete = true;
        retval.header_z = pos;

        return retval;
    }

    vector<uint8_t>
    encode_gzip_header(string const & filename,
                       uint32_t mtime,
                       int level)
    {
        vector<uint8_t> retval(c_fixed_header_z);

        retval[0] = c_magic0;
        retval[1] = c_magic1;
        retval[2] = c_method_deflate;
        retval[3] = (filename.empty() ? 0 : c_fname);
        store_u32le(mtime, retval.data() + 4);

        if (level == Z_BEST_COMPRESSION)
            retval[8] = c_xfl_max_compression;
        else if (level == Z_BEST_SPEED)
            retval[8] = c_xfl_fastest;
        else
            retval[8] = 0;

        retval[9] = c_os_unknown;

        if (!filename.empty()) {
            retval.insert(retval.end(), filename.begin(), filename.end());
            retval.push_back(0);
        }

        return retval;
    }

    array<uint8_t, c_trailer_z>
    encode_gzip_trailer(gzip_trailer const & x)
    {
        array<uint8_t, c_trailer_z> retval;

        store_u32le(x.crc32, retval.data());
        store_u32le(x.isize, retval.data() + 4);

        return retval;
    }

    gzip_trailer
    decode_gzip_trailer(span<uint8_t const> x)
    {
        gzip_trailer retval;

        retval.crc32 = load_u32le(x.lo());
        retval.isize = load_u32le(x.lo() + 4);

        return retval;
    }

    optional<string>
    utf8_to_latin1(string const & s)
    {
        string retval;
        retval.reserve(s.size());

        for (size_t i = 0, n = s.size(); i < n; ) {
            uint8_t c0 = static_cast<uint8_t>(s[i]);

            if (c0 < 0x80) {
                retval.push_back(static_cast<char>(c0));
                ++i;
            } else if ((c0 & 0xe0) == 0xc0 && (i + 1 < n)) {
                uint8_t c1 = static_cast<uint8_t>(s[i + 1]);

                if ((c1 & 0xc0) != 0x80)
                    return nullopt;

                uint32_t cp = ((c0 & 0x1f) << 6) | (c1 & 0x3f);

                /* overlong forms and code points above U+00FF both rejected */
                if (cp < 0x80 || cp > 0xff)
                    return nullopt;

                retval.push_back(static_cast<char>(cp));
                i += 2;
            } else {
                return nullopt;
            }
        }

        return retval;
    }

    string
    latin1_to_utf8(string const & s)
    {
        string retval;
        retval.reserve(s.size());

        for (char ch : s) {
            uint8_t c = static_cast<uint8_t>(ch);

            if (c < 0x80) {
                retval.push_back(ch);
            } else {
                retval.push_back(static_cast<char>(0xc0 | (c >> 6)));
                retval.push_back(static_cast<char>(0x80 | (c & 0x3f)));
            }
        }

        return retval;
    }

    string
    header_filename(optional<string> const & explicit_name,
                    optional<string> const & path)
    {
        optional<string> const & candidate = (explicit_name ? explicit_name : path);

        if (!candidate)
            return string();

        string base = *candidate;

        size_t slash = base.find_last_of('/');
        if (slash != string::npos)
            base = base.substr(slash + 1);

        constexpr char c_suffix[] = ".gz";
        constexpr size_t c_suffix_z = sizeof(c_suffix) - 1;

        if ((base.size() >= c_suffix_z) && (base.compare(base.size() - c_suffix_z, c_suffix_z, c_suffix) == 0))
            base.resize(base.size() - c_suffix_z);

        optional<string> latin1 = utf8_to_latin1(base);

        return latin1 ? *latin1 : string();
    }
} /*namespace gzio*/

/* end gzip_header.cpp */
