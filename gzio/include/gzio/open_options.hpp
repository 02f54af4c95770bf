/** @file open_options.hpp **/

#pragma once

#include <ios>
#include <optional>
#include <string>
#include <string_view>
#include <cstdint>

namespace gzio {
    /** @brief primary mode letter of an open mode string **/
    enum class open_kind {
        /** @brief 'r': read an existing stream **/
        read,
        /** @brief 'w': create or truncate **/
        write,
        /** @brief 'a': append a new member **/
        append,
        /** @brief 'x': create;  fail if the file already exists **/
        exclusive
    };

    /** @class open_mode gzio/open_options.hpp

        @brief parsed form of a mode string like "rb", "wt" or "a+".

        Grammar: exactly one of [rwxa],  at most one of [bt],  at most one '+',
        in any order.
     **/
    struct open_mode {
        open_kind kind = open_kind::read;
        /** @brief 't' given **/
        bool text = false;
        /** @brief 'b' given **/
        bool binary = false;
        /** @brief '+' given **/
        bool plus = false;
        /** @brief mode string as supplied **/
        std::string str;

        bool is_reading() const { return kind == open_kind::read; }
        bool is_writing() const { return kind != open_kind::read; }

        /** @brief openmode for the underlying (compressed) file **/
        std::ios_base::openmode filebuf_mode() const;
    };

    /** @brief parse @p mode;  throws @ref invalid_argument on a malformed string **/
    open_mode parse_mode(std::string_view mode);

    /** @class open_options gzio/open_options.hpp

        @brief configuration for a gzip handle.

        Text-only fields (@ref encoding, @ref errors, @ref newline) must be
        @c nullopt for binary handles.
     **/
    struct open_options {
        static constexpr std::uint64_t c_default_chunk_size = 64UL * 1024UL;
        static constexpr std::size_t c_default_cookie_cache_size = 1000;
        static constexpr std::int64_t c_max_mtime = 0xffffffffLL;

        /** @brief text encoding;  nullopt means utf-8 **/
        std::optional<std::string> encoding;
        /** @brief codec error handler;  nullopt means "strict" **/
        std::optional<std::string> errors;
        /** @brief newline policy;  nullopt means universal newlines **/
        std::optional<std::string> newline;
        /** @brief deflate level in [-1, 9];  checked for writing modes only **/
        int compresslevel = 6;
        /** @brief size of compressed reads and writes **/
        std::uint64_t chunk_size = c_default_chunk_size;
        /** @brief header mtime for writing;  nullopt means current time **/
        std::optional<std::int64_t> mtime;
        /** @brief header filename for writing;  defaults to path basename without ".gz" **/
        std::optional<std::string> original_filename;
        /** @brief close a caller-supplied streambuf when the handle closes **/
        bool closefd = false;
        /** @brief maximum number of seek checkpoints retained **/
        std::size_t cookie_cache_size = c_default_cookie_cache_size;
    };

    /** @brief check @p opts against @p mode.  Throws @ref invalid_argument **/
    void validate_options(open_mode const & mode, open_options const & opts);
} /*namespace gzio*/
