/** @file gzstream.hpp **/

#pragma once

#include "gzstreambuf.hpp"
#include <iostream>
#include <string>

/* note: need to allow out-of-memory-order initialization of gzstream
 * 1. gzstream::rdbuf_ needs to be constructed (so it's in valid, nominal state)
 *    before passing it to (parent) basic_iostream ctor.
 * 2. This is out-of-memory order,  since memory for parent basic_iostream
 *    precedes memory for gzstream members,
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wreorder"

namespace gzio {
    /**
       @class gzstream gzio/gzstream.hpp

       @brief iostream with automatic gzip compression/decompression

       Example 1 - create a @c .gz file
       @code
       gzstream gz("path/to/foo.gz", std::ios::out);

       gz << "Some text to be compressed" << std::endl;
       gz.close();
       @endcode

       Example 2 - read from a @c .gz file
       @code
       gzstream gz("path/to/foo.gz", std::ios::in);

       std::string line;
       while (std::getline(gz, line))
           std::cout << "input: [" << line << "]" << std::endl;
       @endcode

       Failure to open sets @c failbit;  @ref last_error reports why.
    **/
    class gzstream : public std::iostream {
    public:
        /** @brief gzstream in closed state **/
        gzstream()
            : rdbuf_(),
              std::iostream(&rdbuf_)
            {
                /* closed state = empty stream -> eof */
                this->setstate(std::ios_base::eofbit);
            }

        /** @brief gzstream attached to file at @p path
            @param mode  @c ios::in,  @c ios::out or @c ios::out|ios::app
         **/
        gzstream(std::string const & path,
                 std::ios::openmode mode = std::ios::in,
                 open_options const & opts = open_options())
            : rdbuf_(),
              std::iostream(&rdbuf_)
            {
                this->open(path, mode, opts);
            }

        /** @brief gzstream over caller-supplied @p sbuf **/
        gzstream(std::streambuf & sbuf,
                 std::ios::openmode mode = std::ios::in,
                 open_options const & opts = open_options())
            : rdbuf_(),
              std::iostream(&rdbuf_)
            {
                this->open(sbuf, mode, opts);
            }

        ///@{

        /** @name access methods **/

        gzstreambuf * rdbuf() { return &rdbuf_; }
        bool is_open() const { return rdbuf_.is_open(); }
        bool is_closed() const { return rdbuf_.is_closed(); }
        /** @brief message from the last failed open/close;  empty if none **/
        std::string const & last_error() const { return last_error_; }

        ///@}

        /** @brief gzio mode string for iostream openmode @p mode **/
        static char const * mode_string(std::ios::openmode mode) {
            if (mode & std::ios::app)
                return "ab";
            if (mode & std::ios::out)
                return "wb";
            return "rb";
        }

        /** @brief (re)open,  connected to a .gz file
            @post if successful, @c is_open() = @c true;  otherwise @c failbit set
         **/
        void open(std::string const & path,
                  std::ios::openmode mode = std::ios::in,
                  open_options const & opts = open_options())
            {
                /* clear state bits,  in case we previously used this stream for i/o */
                this->clear();
                last_error_.clear();

                try {
                    rdbuf_.adopt(binary_file::open(path, mode_string(mode), opts));
                } catch (gzio::error & ex) {
                    last_error_ = ex.what();
                    this->setstate(std::ios_base::failbit);
                }
            }

        void open(std::streambuf & sbuf,
                  std::ios::openmode mode = std::ios::in,
                  open_options const & opts = open_options())
            {
                this->clear();
                last_error_.clear();

                try {
                    rdbuf_.adopt(binary_file::open(sbuf, mode_string(mode), opts));
                } catch (gzio::error & ex) {
                    last_error_ = ex.what();
                    this->setstate(std::ios_base::failbit);
                }
            }

        /** @brief finish gzip stream and close.  Failure sets @c badbit **/
        void close() {
            try {
                rdbuf_.close();
            } catch (gzio::error & ex) {
                last_error_ = ex.what();
                this->setstate(std::ios_base::badbit);
            }
        }

    private:
        gzstreambuf rdbuf_;
        std::string last_error_;
    };
} /*namespace gzio*/

#pragma GCC diagnostic pop
