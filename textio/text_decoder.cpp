// text_decoder.cpp

#include "textio/text_decoder.hpp"

using namespace std;

namespace gzio {
    namespace {
        /* \r\n -> \n,  then lone \r -> \n;  single pass */
        string
        universal_newlines(string const & text)
        {
            string retval;
            retval.reserve(text.size());

            for (size_t i = 0, n = text.size(); i < n; ++i) {
                char ch = text[i];

                if (ch == '\r') {
                    retval.push_back('\n');
                    if ((i + 1 < n) && (text[i + 1] == '\n'))
                        ++i;
                } else {
                    retval.push_back(ch);
                }
            }

            return retval;
        }

        bool
        holds_trailing_cr(newline_mode mode)
        {
            return (mode == newline_mode::universal
                    || mode == newline_mode::untranslated
                    || mode == newline_mode::crlf);
        }

        string
        replace_lf(string_view text, char const * with)
        {
            string retval;
            retval.reserve(text.size() + text.size() / 16);

            for (char ch : text) {
                if (ch == '\n')
                    retval.append(with);
                else
                    retval.push_back(ch);
            }

            return retval;
        }
    }

    decode_result
    decode_chunk(text_codec const & codec,
                 newline_mode mode,
                 decode_state const & state,
                 string_view bytes,
                 bool final)
    {
        decode_result retval;

        string input;
        input.reserve(state.pending_bytes.size() + bytes.size());
        input.append(state.pending_bytes);
        input.append(bytes.data(), bytes.size());

        string text;
        if (state.pending_cr)
            text.push_back('\r');
        text.append(codec.decode(input, final, &retval.state.pending_bytes));

        if (!final && holds_trailing_cr(mode) && !text.empty() && (text.back() == '\r')) {
            text.pop_back();
            retval.state.pending_cr = true;
        }

        if (mode == newline_mode::universal)
            retval.text = universal_newlines(text);
        else
            retval.text = std::move(text);

        return retval;
    }

    size_t
    find_line_end(newline_mode mode, string_view text, bool at_eof)
    {
        switch (mode) {
        case newline_mode::universal:
        case newline_mode::lf:
        {
            size_t p = text.find('\n');
            return (p == string_view::npos) ? p : p + 1;
        }
        case newline_mode::cr:
        {
            size_t p = text.find('\r');
            return (p == string_view::npos) ? p : p + 1;
        }
        case newline_mode::crlf:
        {
            size_t p = text.find("\r\n");
            return (p == string_view::npos) ? p : p + 2;
        }
        case newline_mode::untranslated:
        {
            size_t p = text.find_first_of("\r\n");

            if (p == string_view::npos)
                return p;
            if (text[p] == '\n')
                return p + 1;

            /* text[p] is \r */
            if (p + 1 < text.size())
                return (text[p + 1] == '\n') ? p + 2 : p + 1;

            /* \r at end of buffer:  wait for more input to see if \n follows */
            return at_eof ? p + 1 : string_view::npos;
        }
        }

        return string_view::npos;
    }

    string
    translate_for_write(newline_mode mode, string_view text)
    {
        switch (mode) {
        case newline_mode::cr:
            return replace_lf(text, "\r");
        case newline_mode::crlf:
            return replace_lf(text, "\r\n");
        case newline_mode::universal:
            /* os line separator;  \n on posix */
        case newline_mode::untranslated:
        case newline_mode::lf:
            break;
        }

        return string(text);
    }
} /*namespace gzio*/

/* end text_decoder.cpp */
