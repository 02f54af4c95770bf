/** @file xfilebuf.hpp **/

#pragma once

#include <fstream>
#include <string>

namespace gzio {
    /** @class basic_xfilebuf gzio/xfilebuf.hpp

       @brief @c std::basic_filebuf that remembers its file descriptor.

       gzio handles report @c fileno() and @c isatty() for files they open by path.
       Before c++26 there is no public api to get the descriptor out of a @c std::filebuf,
       so we reach into gcc's protected @c _M_file member.

       @warning Implementation tested only on linux with libstdc++.
    **/
    template <typename CharT, typename Traits = std::char_traits<CharT>>
    class basic_xfilebuf : public std::basic_filebuf<CharT, Traits> {
    public:
        /** @brief typealias for parent class **/
        using basic_filebuf_type = std::basic_filebuf<CharT, Traits>;
        /** @brief typealias for self **/
        using basic_xfilebuf_type = basic_xfilebuf<CharT, Traits>;
        /** @brief file descriptor type (following c++26 naming) **/
        using native_handle_type = int;

    public:
        basic_xfilebuf() = default;
        basic_xfilebuf(basic_xfilebuf const & x) = delete;
        basic_xfilebuf(basic_xfilebuf &&) = delete;

        /** @brief file descriptor for an open file;  -1 when closed **/
        native_handle_type fd() const {
            if (!this->is_open())
                return -1;

            /* __basic_file_type::fd() isn't declared const in gcc 12 */
            return const_cast<typename basic_filebuf_type::__file_type &>(this->_M_file).fd();
        }
        native_handle_type native_handle() const { return this->fd(); }

        /** @brief as @c std::basic_filebuf::open(),  but returning the most-derived type.
            @return @c this on successful open;  @c nullptr otherwise
         **/
        basic_xfilebuf_type * open(std::string const & s, std::ios_base::openmode mode) {
            if (basic_filebuf_type::open(s, mode))
                return this;
            else
                return nullptr;
        }

        basic_xfilebuf & operator=(basic_xfilebuf const & x) = delete;
        basic_xfilebuf & operator=(basic_xfilebuf &&) = delete;
    };

    /** @brief gzio opens compressed files through this **/
    using xfilebuf = basic_xfilebuf<char>;
} /*namespace gzio*/
