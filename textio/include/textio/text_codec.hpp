/** @file text_codec.hpp **/

#pragma once

#include <iconv.h>
#include <optional>
#include <string>
#include <string_view>

namespace gzio {
    /** @brief newline handling for a text stream

        | option      | mode          | on read                                | on write        |
        |-------------|---------------|----------------------------------------|-----------------|
        | nullopt     | universal     | \\r, \\n, \\r\\n all become \\n        | \\n unchanged   |
        | ""          | untranslated  | no translation;  any of them ends line | no translation  |
        | "\\n"       | lf            | only \\n ends a line                   | \\n unchanged   |
        | "\\r"       | cr            | only \\r ends a line                   | \\n -> \\r      |
        | "\\r\\n"    | crlf          | only \\r\\n ends a line                | \\n -> \\r\\n   |
     **/
    enum class newline_mode { universal, untranslated, lf, cr, crlf };

    /** @brief map a newline option to a @ref newline_mode;  throws @ref invalid_argument for other values **/
    newline_mode parse_newline(std::optional<std::string> const & newline);

    /** @brief inverse of @ref parse_newline **/
    std::optional<std::string> newline_option(newline_mode mode);

    /**
       @class iconv_handle textio/text_codec.hpp

       @brief owns one @c iconv_t conversion descriptor.
    **/
    class iconv_handle {
    public:
        iconv_handle() = default;
        /** @brief open conversion @p from -> @p to.  Throws @ref codec_error if iconv doesn't know the pair. **/
        iconv_handle(std::string const & to, std::string const & from);
        iconv_handle(iconv_handle const & x) = delete;
        iconv_handle(iconv_handle && x) noexcept;
        ~iconv_handle();

        iconv_t native_handle() const { return cd_; }
        bool is_open() const { return cd_ != invalid(); }

        /** @brief return descriptor to its initial shift state **/
        void reset() const;

        iconv_handle & operator= (iconv_handle const & x) = delete;
        iconv_handle & operator= (iconv_handle && x) noexcept;

    private:
        static iconv_t invalid() { return reinterpret_cast<iconv_t>(-1); }

    private:
        iconv_t cd_ = invalid();
    };

    /**
       @class text_codec textio/text_codec.hpp

       @brief converts between an external character encoding and utf-8.

       All text inside gzio is utf-8.
       Encoding names follow iconv,  with common aliases ("utf-8", "latin-1",
       "ascii") accepted in any case.

       Error handlers (@p errors):
       - "strict":            throw @ref codec_error
       - "ignore":            drop offending input
       - "replace":           U+FFFD on decode,  '?' on encode
       - "backslashreplace":  \\xNN on decode,  \\xNN / \\uNNNN / \\UNNNNNNNN on encode
       - "xmlcharrefreplace": &#N; (encode only)

       Handler names are not checked up front;  an unknown name is reported
       (as @ref codec_error) the first time a handler is actually needed.

       Conversion state (e.g. byte order learned from a utf-16 BOM) persists
       from one call to the next until @ref reset.
    **/
    class text_codec {
    public:
        text_codec(std::string encoding, std::string errors);

        std::string const & encoding() const { return encoding_; }
        std::string const & errors() const { return errors_; }

        /** @brief decode @p bytes to utf-8.

            @param bytes    encoded input
            @param final    true if no more input will follow
            @param pending  [out] incomplete trailing sequence,  to be prepended to the next call's input
                            (always empty when @p final)
         **/
        std::string decode(std::string_view bytes, bool final, std::string * pending) const;

        /** @brief encode utf-8 @p text **/
        std::string encode(std::string_view text) const;

        /** @brief bytes that return the encoder to its initial shift state.
            Empty for stateless encodings;  e.g. ESC ( B for ISO-2022-JP after JIS text.
            Write these before ending a stream.
         **/
        std::string encode_final() const;

        /** @brief return both conversion directions to their initial state (e.g. on rewind) **/
        void reset() const;

    private:
        /** @brief apply decode handler to bad bytes [p, p+n) found at input position @p pos **/
        void on_decode_error(std::string * out, char const * p, std::size_t n, std::size_t pos, char const * reason) const;
        /** @brief apply encode handler to the character at @p p;  @return bytes of input to skip **/
        std::size_t on_encode_error(std::string * out, std::string_view rest, std::size_t pos) const;
        /** @brief run @p in through @p cd,  appending to @p out;  stops at the first error
            @return 0 when all input converted,  otherwise the iconv errno value
         **/
        static int convert(iconv_handle const & cd, char ** in, std::size_t * in_left, std::string * out);

    private:
        std::string encoding_;
        std::string errors_;
        /** @brief iconv name corresponding to @ref encoding_ **/
        std::string iconv_name_;

        iconv_handle to_utf8_;
        iconv_handle from_utf8_;
    };
} /*namespace gzio*/
