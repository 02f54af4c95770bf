// open_options.cpp

#include "gzio/open_options.hpp"
#include "textio/text_codec.hpp"
#include "compression/error.hpp"
#include "compression/tostr.hpp"

using namespace std;

namespace gzio {
    ios_base::openmode
    open_mode::filebuf_mode() const
    {
        ios_base::openmode retval = ios_base::binary;

        switch (kind) {
        case open_kind::read:
            retval |= ios_base::in;
            break;
        case open_kind::write:
        case open_kind::exclusive:
            retval |= ios_base::out | ios_base::trunc;
            break;
        case open_kind::append:
            retval |= ios_base::out | ios_base::app;
            break;
        }

        if (plus)
            retval |= (ios_base::in | ios_base::out);

        return retval;
    }

    open_mode
    parse_mode(string_view mode)
    {
        open_mode retval;
        retval.str = string(mode);

        int n_kind = 0;
        int n_plus = 0;

        for (char ch : mode) {
            switch (ch) {
            case 'r':
                retval.kind = open_kind::read;
                ++n_kind;
                break;
            case 'w':
                retval.kind = open_kind::write;
                ++n_kind;
                break;
            case 'a':
                retval.kind = open_kind::append;
                ++n_kind;
                break;
            case 'x':
                retval.kind = open_kind::exclusive;
                ++n_kind;
                break;
            case 'b':
                if (retval.binary)
                    throw invalid_argument(tostr("invalid mode: '", mode, "' (repeated 'b')"));
                retval.binary = true;
                break;
            case 't':
                if (retval.text)
                    throw invalid_argument(tostr("invalid mode: '", mode, "' (repeated 't')"));
                retval.text = true;
                break;
            case '+':
                ++n_plus;
                retval.plus = true;
                break;
            default:
                throw invalid_argument(tostr("invalid mode: '", mode, "'"));
            }
        }

        if (n_kind != 1)
            throw invalid_argument(tostr("invalid mode: '", mode, "' (need exactly one of r/w/a/x)"));
        if (n_plus > 1)
            throw invalid_argument(tostr("invalid mode: '", mode, "' (repeated '+')"));
        if (retval.binary && retval.text)
            throw invalid_argument(tostr("invalid mode: '", mode, "' (can't have text and binary mode at once)"));

        return retval;
    }

    void
    validate_options(open_mode const & mode, open_options const & opts)
    {
        if (mode.text) {
            if (opts.encoding && opts.encoding->empty())
                throw invalid_argument("Encoding cannot be empty");

            /* throws on bad values */
            parse_newline(opts.newline);
        } else {
            if (opts.encoding)
                throw invalid_argument("Argument 'encoding' not supported in binary mode");
            if (opts.errors)
                throw invalid_argument("Argument 'errors' not supported in binary mode");
            if (opts.newline)
                throw invalid_argument("Argument 'newline' not supported in binary mode");
        }

        if (mode.is_writing()) {
            if ((opts.compresslevel < -1) || (opts.compresslevel > 9))
                throw invalid_argument(tostr("compresslevel must be between -1 and 9, got [", opts.compresslevel, "]"));
        }

        if (opts.chunk_size == 0)
            throw invalid_argument("chunk_size must be positive");

        if (opts.mtime) {
            if ((*opts.mtime < 0) || (*opts.mtime > open_options::c_max_mtime))
                throw invalid_argument(tostr("mtime must be in [0, 2^32-1], got [", *opts.mtime, "]"));
        }

        if (opts.cookie_cache_size == 0)
            throw invalid_argument("cookie_cache_size must be positive");
    }
} /*namespace gzio*/

/* end open_options.cpp */
