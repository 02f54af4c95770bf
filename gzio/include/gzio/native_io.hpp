/** @file native_io.hpp **/

#pragma once

#include "xfilebuf.hpp"
#include "open_options.hpp"
#include <memory>
#include <streambuf>
#include <string>
#include <cstdint>

namespace gzio {
    /**
       @class native_io gzio/native_io.hpp

       @brief the compressed byte source/sink beneath a gzip handle.

       Either a file gzio opened itself (always closed by @ref close),
       or a caller-supplied streambuf (closed only when @c closefd was requested,
       and only when it's a @c std::filebuf).

       Stream offsets handed to @ref seek_to are relative to the streambuf
       position at construction,  so a gzip stream can start part-way into a
       caller's streambuf.
    **/
    class native_io {
    public:
        using native_handle_type = int;

    public:
        native_io() = default;
        native_io(native_io const & x) = delete;
        native_io(native_io && x) noexcept;

        /** @brief open file @p path according to @p mode.

            Throws @ref invalid_argument for an empty path,
            @ref resource_error when the file can't be opened
            (or,  for mode 'x',  already exists).
         **/
        static native_io open_path(std::string const & path, open_mode const & mode);

        /** @brief use caller-supplied @p sbuf;  close it on @ref close iff @p closefd **/
        static native_io borrow(std::streambuf & sbuf, open_mode const & mode, bool closefd);

        std::streambuf * sbuf() const { return sbuf_; }
        /** @brief path,  if opened from one **/
        std::string const & name() const { return name_; }
        /** @brief true iff @ref close will close the streambuf **/
        bool owns_sink() const { return owns_sink_; }
        bool is_open() const { return sbuf_ != nullptr; }
        /** @brief file descriptor if known,  otherwise -1 **/
        native_handle_type fd() const;
        /** @brief true iff @ref seek_to can work **/
        bool seekable() const { return base_pos_ >= 0; }

        /** @brief position streambuf at offset @p z (relative to stream start).  Throws @ref resource_error **/
        void seek_to(std::uint64_t z);

        /** @brief @c pubsync() the streambuf.  Throws @ref resource_error **/
        void sync(std::uint64_t offset);

        /** @brief sync,  then release the streambuf (closing it if owned).  Idempotent **/
        void close(std::uint64_t offset);

        native_io & operator=(native_io const & x) = delete;
        native_io & operator=(native_io && x) noexcept;

    private:
        /** @brief record starting position of @ref sbuf_,  or -1 if it can't seek **/
        void probe_base(open_mode const & mode);

    private:
        /** @brief file opened by path;  null for a borrowed streambuf **/
        std::unique_ptr<xfilebuf> file_;
        std::streambuf * sbuf_ = nullptr;
        std::string name_;
        /** @brief openmode direction used for seeks **/
        std::ios_base::openmode which_ = std::ios_base::in;
        /** @brief streambuf position at construction;  -1 if not seekable **/
        std::int64_t base_pos_ = -1;
        bool owns_sink_ = false;
    };
} /*namespace gzio*/
