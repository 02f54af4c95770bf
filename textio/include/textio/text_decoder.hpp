/** @file text_decoder.hpp **/

#pragma once

#include "text_codec.hpp"
#include <string>
#include <string_view>

namespace gzio {
    /** @class decode_state textio/text_decoder.hpp

        @brief carry-over between successive @ref decode_chunk calls.

        Opaque to callers;  held by value so it can be stored in a seek checkpoint.
     **/
    struct decode_state {
        /** @brief trailing bytes of an incomplete multibyte sequence **/
        std::string pending_bytes;
        /** @brief last decoded character was a \\r that has not been released yet **/
        bool pending_cr = false;

        bool empty() const { return pending_bytes.empty() && !pending_cr; }

        bool operator== (decode_state const & x) const {
            return (pending_bytes == x.pending_bytes) && (pending_cr == x.pending_cr);
        }
        bool operator!= (decode_state const & x) const { return !(*this == x); }
    };

    /** @brief output of @ref decode_chunk **/
    struct decode_result {
        /** @brief decoded utf-8 text,  newline-translated per mode **/
        std::string text;
        /** @brief state to pass to the next call **/
        decode_state state;
    };

    /** @brief decode one chunk of encoded input.

        Pure with respect to @p state:  the same (state, bytes, final)
        always yields the same result for stateless encodings.

        A multibyte character split across chunks is completed on the next call.
        In @c universal, @c untranslated and @c crlf modes a trailing \\r is held
        back until the next chunk shows whether \\n follows;  at @p final it is released.

        @param codec  character codec
        @param mode   newline mode
        @param state  carry-over from the previous call (default-constructed for the first call)
        @param bytes  next chunk of encoded input (may be empty)
        @param final  true if @p bytes is the last input (end of stream)
     **/
    decode_result decode_chunk(text_codec const & codec,
                               newline_mode mode,
                               decode_state const & state,
                               std::string_view bytes,
                               bool final);

    /** @brief position just past the first line terminator in @p text,  or @c std::string_view::npos.

        For @c untranslated mode a \\r at the very end of @p text is only
        accepted as a terminator when @p at_eof.
     **/
    std::size_t find_line_end(newline_mode mode, std::string_view text, bool at_eof);

    /** @brief translate \\n in @p text for output in @p mode **/
    std::string translate_for_write(newline_mode mode, std::string_view text);
} /*namespace gzio*/
