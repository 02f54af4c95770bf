// text_codec.cpp

#include "textio/text_codec.hpp"
#include "textio/utf8.hpp"
#include "compression/error.hpp"
#include "compression/hex.hpp"
#include "compression/tostr.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <sstream>

using namespace std;

namespace gzio {
    namespace {
        /* utf-8 encoding of U+FFFD */
        constexpr char c_replacement_utf8[] = "\xef\xbf\xbd";

        /* map common encoding aliases onto iconv names */
        string
        iconv_name_for(string const & encoding)
        {
            string key;
            key.reserve(encoding.size());
            for (char ch : encoding)
                key.push_back((ch == '_') ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));

            if (key == "utf-8" || key == "utf8" || key == "u8")
                return "UTF-8";
            if (key == "latin-1" || key == "latin1" || key == "l1" || key == "iso-8859-1" || key == "iso8859-1")
                return "ISO-8859-1";
            if (key == "ascii" || key == "us-ascii")
                return "ASCII";

            return encoding;
        }

        string
        hex_code(uint32_t cp, int width)
        {
            ostringstream ss;
            ss << std::hex << std::setw(width) << std::setfill('0') << cp;
            return ss.str();
        }
    }

    newline_mode
    parse_newline(optional<string> const & newline)
    {
        if (!newline)
            return newline_mode::universal;
        if (newline->empty())
            return newline_mode::untranslated;
        if (*newline == "\n")
            return newline_mode::lf;
        if (*newline == "\r")
            return newline_mode::cr;
        if (*newline == "\r\n")
            return newline_mode::crlf;

        string shown;
        for (char ch : *newline)
            shown += tostr(gzio::hex(static_cast<uint8_t>(ch)), " ");

        throw invalid_argument(tostr("illegal newline value: [ ", shown, "]"));
    }

    optional<string>
    newline_option(newline_mode mode)
    {
        switch (mode) {
        case newline_mode::universal:    return nullopt;
        case newline_mode::untranslated: return string();
        case newline_mode::lf:           return string("\n");
        case newline_mode::cr:           return string("\r");
        case newline_mode::crlf:         return string("\r\n");
        }

        return nullopt;
    }

    // ----- iconv_handle -----

    iconv_handle::iconv_handle(string const & to, string const & from)
        : cd_{::iconv_open(to.c_str(), from.c_str())}
    {
        if (cd_ == invalid())
            throw codec_error(tostr("unknown encoding: ", (to == "UTF-8" ? from : to)));
    }

    iconv_handle::iconv_handle(iconv_handle && x) noexcept
        : cd_{x.cd_}
    {
        x.cd_ = invalid();
    }

    iconv_handle::~iconv_handle()
    {
        if (cd_ != invalid())
            ::iconv_close(cd_);
    }

    void
    iconv_handle::reset() const
    {
        if (cd_ != invalid())
            ::iconv(cd_, nullptr, nullptr, nullptr, nullptr);
    }

    iconv_handle &
    iconv_handle::operator= (iconv_handle && x) noexcept
    {
        std::swap(cd_, x.cd_);
        return *this;
    }

    // ----- text_codec -----

    text_codec::text_codec(string encoding, string errors)
        : encoding_{std::move(encoding)},
          errors_{std::move(errors)}
    {
        if (encoding_.empty())
            throw invalid_argument("Encoding cannot be empty");

        iconv_name_ = iconv_name_for(encoding_);

        to_utf8_ = iconv_handle("UTF-8", iconv_name_);
        from_utf8_ = iconv_handle(iconv_name_, "UTF-8");
    }

    void
    text_codec::reset() const
    {
        to_utf8_.reset();
        from_utf8_.reset();
    }

    int
    text_codec::convert(iconv_handle const & cd, char ** in, size_t * in_left, string * out)
    {
        char buf[4096];

        while (*in_left > 0) {
            char * outp = buf;
            size_t out_left = sizeof(buf);

            size_t rc = ::iconv(cd.native_handle(), in, in_left, &outp, &out_left);
            int err = errno;

            out->append(buf, outp - buf);

            if (rc == static_cast<size_t>(-1)) {
                if (err == E2BIG)
                    continue;
                return err;
            }
        }

        return 0;
    }

    string
    text_codec::decode(string_view bytes, bool final, string * pending) const
    {
        string out;
        out.reserve(bytes.size());

        if (pending)
            pending->clear();

        char * in = const_cast<char *>(bytes.data());
        size_t in_left = bytes.size();

        while (in_left > 0) {
            int err = convert(to_utf8_, &in, &in_left, &out);

            if (err == 0)
                break;

            size_t pos = bytes.size() - in_left;

            if (err == EINVAL) {
                /* incomplete multibyte sequence at end of input */
                if (!final && pending) {
                    pending->assign(in, in_left);
                } else {
                    this->on_decode_error(&out, in, in_left, pos, "unexpected end of data");
                }
                in += in_left;
                in_left = 0;
            } else if (err == EILSEQ) {
                this->on_decode_error(&out, in, 1, pos, "invalid byte sequence");
                in += 1;
                in_left -= 1;
            } else {
                throw codec_error(tostr("'", encoding_, "' codec: decode failed in position ", pos, ": ", ::strerror(err)));
            }
        }

        return out;
    }

    void
    text_codec::on_decode_error(string * out, char const * p, size_t n, size_t pos, char const * reason) const
    {
        if (errors_ == "strict") {
            throw codec_error(tostr("'", encoding_, "' codec can't decode byte 0x", gzio::hex(static_cast<uint8_t>(*p)),
                                    " in position ", pos, ": ", reason));
        } else if (errors_ == "ignore") {
            return;
        } else if (errors_ == "replace") {
            out->append(c_replacement_utf8);
        } else if (errors_ == "backslashreplace") {
            for (size_t i = 0; i < n; ++i)
                out->append("\\x" + hex_code(static_cast<uint8_t>(p[i]), 2));
        } else {
            throw codec_error(tostr("unknown error handler name '", errors_, "'"));
        }
    }

    string
    text_codec::encode(string_view text) const
    {
        string out;
        out.reserve(text.size());

        char * in = const_cast<char *>(text.data());
        size_t in_left = text.size();

        while (in_left > 0) {
            int err = convert(from_utf8_, &in, &in_left, &out);

            if (err == 0)
                break;

            if ((err == EILSEQ) || (err == EINVAL)) {
                size_t pos = utf8_length(text.substr(0, text.size() - in_left));
                size_t skip = this->on_encode_error(&out, string_view(in, in_left), pos);

                in += skip;
                in_left -= skip;
            } else {
                throw codec_error(tostr("'", encoding_, "' codec: encode failed: ", ::strerror(err)));
            }
        }

        return out;
    }

    string
    text_codec::encode_final() const
    {
        char buf[64];
        char * outp = buf;
        size_t out_left = sizeof(buf);

        if (::iconv(from_utf8_.native_handle(), nullptr, nullptr, &outp, &out_left) == static_cast<size_t>(-1)) {
            int err = errno;
            throw codec_error(tostr("'", encoding_, "' codec: can't reset encoder state: ", ::strerror(err)));
        }

        return string(buf, outp - buf);
    }

    size_t
    text_codec::on_encode_error(string * out, string_view rest, size_t pos) const
    {
        size_t z = std::min(utf8_sequence_z(rest[0]), rest.size());
        string_view seq = rest.substr(0, z);
        uint32_t cp = utf8_decode_one(seq);
        bool malformed = (cp == 0xfffd) && (seq != c_replacement_utf8);

        if (malformed) {
            z = 1;
            cp = static_cast<uint8_t>(rest[0]);
        }

        string replacement;

        if (errors_ == "strict") {
            throw codec_error(tostr("'", encoding_, "' codec can't encode character U+", hex_code(cp, 4),
                                    " in position ", pos,
                                    (malformed ? ": malformed utf-8 input" : ": character not representable")));
        } else if (errors_ == "ignore") {
            return z;
        } else if (errors_ == "replace") {
            replacement = "?";
        } else if (errors_ == "backslashreplace") {
            if (cp <= 0xff)
                replacement = "\\x" + hex_code(cp, 2);
            else if (cp <= 0xffff)
                replacement = "\\u" + hex_code(cp, 4);
            else
                replacement = "\\U" + hex_code(cp, 8);
        } else if (errors_ == "xmlcharrefreplace") {
            replacement = tostr("&#", cp, ";");
        } else {
            throw codec_error(tostr("unknown error handler name '", errors_, "'"));
        }

        char * in = &replacement[0];
        size_t in_left = replacement.size();

        if (convert(from_utf8_, &in, &in_left, out) != 0)
            throw codec_error(tostr("'", encoding_, "' codec can't encode replacement text [", replacement, "]"));

        return z;
    }
} /*namespace gzio*/

/* end text_codec.cpp */
