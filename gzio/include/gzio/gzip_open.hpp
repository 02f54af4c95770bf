/** @file gzip_open.hpp **/

#pragma once

#include "binary_file.hpp"
#include "text_file.hpp"
#include <memory>
#include <streambuf>
#include <string>
#include <string_view>
#include <variant>

namespace gzio {
    /** @brief handle returned by @ref open:  binary unless the mode says 't' **/
    using gzip_handle = std::variant<std::unique_ptr<binary_file>, std::unique_ptr<text_file>>;

    /** @brief open gzip file at @p path.

        @param path  filesystem path;  must not be empty
        @param mode  @c [rwxa] with optional @c b or @c t,  optional @c +
        @param opts  see @ref open_options
     **/
    gzip_handle open(std::string const & path,
                     std::string_view mode = "rb",
                     open_options const & opts = open_options());

    /** @brief gzip stream over @p sbuf.  @p sbuf stays open on close unless @c opts.closefd **/
    gzip_handle open(std::streambuf & sbuf,
                     std::string_view mode = "rb",
                     open_options const & opts = open_options());

    /** @brief true iff @p h holds a @ref text_file **/
    inline bool is_text(gzip_handle const & h) { return std::holds_alternative<std::unique_ptr<text_file>>(h); }
} /*namespace gzio*/
