/** @file binary_file.hpp **/

#pragma once

#include "capabilities.hpp"
#include "cookie_cache.hpp"
#include "native_io.hpp"
#include "open_options.hpp"
#include "compression/byte_arena.hpp"
#include "compression/member_decoder.hpp"
#include "compression/member_encoder.hpp"
#include <iterator>
#include <memory>
#include <optional>
#include <streambuf>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include <cstdint>

namespace gzio {
    namespace detail {
        template <typename T>
        using data_element_t = std::remove_cv_t<std::remove_pointer_t<decltype(std::data(std::declval<T const &>()))>>;

        template <typename T, typename = void>
        struct is_bytes_like : std::false_type {};

        /* contiguous (std::data + std::size) sequence of one-byte trivially copyable elements */
        template <typename T>
        struct is_bytes_like<T, std::void_t<data_element_t<T>, decltype(std::size(std::declval<T const &>()))>>
            : std::bool_constant<(sizeof(data_element_t<T>) == 1)
                                 && std::is_trivially_copyable_v<data_element_t<T>>> {};
    }

    /** @brief true for types @ref binary_file::write accepts **/
    template <typename T>
    constexpr bool is_bytes_like_v = detail::is_bytes_like<T>::value;

    /**
       @class binary_file gzio/binary_file.hpp

       @brief file-like handle on a gzip stream;  reads and writes uncompressed bytes.

       Example:
       @code
       auto f = binary_file::open("path/to/data.gz", "rb");

       std::string header = f->readline();
       std::string rest = f->read();

       f->close();
       @endcode

       Reading pulls one chunk of compressed input at a time through a
       @ref member_decoder into an internal @ref byte_arena.
       Writing compresses through a @ref member_encoder into the sink.

       Positions are uncompressed byte offsets.
       Absolute seeks are exact:  backward seeks restart at the nearest
       recorded member start (or the beginning) and skip forward.

       @note Only uses calling thread;  not threadsafe.
    **/
    class binary_file : public readable_stream,
                        public writable_stream,
                        public seekable_stream,
                        public peekable_stream
    {
    public:
        using size_type = std::uint64_t;

    public:
        /** @brief open gzip file at @p path.  @p mode must not contain 't' **/
        static std::unique_ptr<binary_file> open(std::string const & path,
                                                 std::string_view mode = "rb",
                                                 open_options const & opts = open_options());
        /** @brief gzip stream over caller-supplied @p sbuf **/
        static std::unique_ptr<binary_file> open(std::streambuf & sbuf,
                                                 std::string_view mode = "rb",
                                                 open_options const & opts = open_options());

        /** @brief attach to @p io.  @p mode and @p opts must already be validated **/
        binary_file(native_io io, open_mode mode, open_options const & opts);
        binary_file(binary_file const & x) = delete;
        /** @brief closes,  reporting (not throwing) any failure **/
        ~binary_file() override;

        ///@{

        /** @name stream_base **/

        std::string const & name() const override { return io_.name(); }
        std::string const & mode() const override { return mode_.str; }
        bool closed() const override { return closed_; }
        bool readable() const override { return mode_.is_reading(); }
        bool writable() const override { return mode_.is_writing(); }
        bool seekable() const override;

        void flush() override;
        void close() override;

        ///@}

        ///@{

        /** @name reading **/

        /** @brief read up to @p n bytes;  all remaining bytes when @p n < 0;  nothing when @p n == 0 **/
        std::string read(std::int64_t n = -1) override;
        /** @brief read up to @p n bytes,  pulling compressed input at most once **/
        std::string read1(std::int64_t n = -1);
        /** @brief read up to @p dest.size() bytes into @p dest.  @return number of bytes stored **/
        size_type readinto(span<std::uint8_t> dest);
        std::string readline(std::int64_t limit = -1) override;
        std::vector<std::string> readlines(std::int64_t hint = -1) override;
        /** @brief iterate over remaining lines **/
        line_range lines() { return line_range(this); }

        /** @brief look ahead without advancing.

            - @p n == 0:  return buffered bytes;  never reads the source
            - @p n < 0:   return buffered bytes,  reading once if nothing is buffered
            - @p n > 0:   return the next min(n, remaining) bytes
         **/
        std::string peek(std::int64_t n = 0) override;

        ///@}

        ///@{

        /** @name writing **/

        std::uint64_t write(std::string_view x) override;

        /** @brief write any contiguous sequence of one-byte elements **/
        template <typename T>
        std::uint64_t write(T const & x) {
            static_assert(is_bytes_like_v<T>,
                          "gzio::binary_file::write: argument must be a contiguous sequence of one-byte trivially copyable"
                          " elements (e.g. std::string, std::string_view, std::vector<uint8_t>, gzio::span<uint8_t const>)");

            if constexpr (std::is_array_v<T> && std::is_same_v<detail::data_element_t<T>, char>) {
                /* char array:  treat as a c string,  so write("abc") writes 3 bytes */
                return this->write(std::string_view(x));
            } else {
                auto const * p = reinterpret_cast<std::uint8_t const *>(std::data(x));

                return this->write_bytes(span<std::uint8_t const>(p, p + std::size(x)));
            }
        }

        void writelines(std::vector<std::string> const & lines) override;

        ///@}

        ///@{

        /** @name positioning **/

        size_type tell() const override;
        /** @brief absolute seek,  or @c seek(0,cur) / @c seek(0,end).
            Other relative seeks throw @ref unsupported_operation.
         **/
        size_type seek(std::int64_t offset, seek_whence whence = seek_whence::set) override;
        /** @brief same as @c seek(0);  read mode only **/
        void rewind();

        ///@}

        ///@{

        /** @name properties **/

        /** @brief mtime from the first member header (read mode,  once parsed),
            or the mtime written (write mode)
         **/
        std::optional<std::uint32_t> mtime() const;
        /** @brief file descriptor of underlying file.  Throws @ref unsupported_operation if unknown **/
        int fileno() const;
        bool isatty() const;
        /** @brief always throws @ref unsupported_operation **/
        [[noreturn]] void truncate(std::optional<std::uint64_t> size = std::nullopt);
        /** @brief always throws @ref unsupported_operation **/
        [[noreturn]] void detach();

        size_type chunk_size() const { return chunk_z_; }
        /** @brief member checkpoints currently recorded (read mode) **/
        std::size_t n_checkpoint() const { return members_.size(); }

        ///@}

#      ifndef NDEBUG
        void set_debug_flag(bool x);
#      endif

        binary_file & operator=(binary_file const & x) = delete;

    private:
        void check_open() const;
        void check_readable() const;
        void check_writable() const;

        size_type write_bytes(span<std::uint8_t const> x);

        /** @brief decode until at least one more byte is buffered.  @return false at end of stream **/
        bool pull();
        /** @brief record checkpoint for a newly-started member **/
        void note_member();
        /** @brief remove and return the first @p z buffered bytes **/
        std::string take(size_type z);
        /** @brief discard up to @p z bytes of output **/
        void skip(size_type z);
        /** @brief restart decoding from the last checkpoint at-or-before @p target **/
        void restart_before(size_type target);

    private:
        native_io io_;
        open_mode mode_;
        size_type chunk_z_ = open_options::c_default_chunk_size;
        bool closed_ = false;

        /* reading */

        std::unique_ptr<member_decoder> decoder_;
        /** @brief decompressed bytes not yet delivered **/
        byte_arena buf_;
        /** @brief uncompressed offset -> member start **/
        cookie_cache<size_type, member_checkpoint> members_;
        /** @brief decoder_->n_member() when @ref note_member last ran **/
        std::uint32_t n_member_seen_ = 0;

        /* writing */

        std::unique_ptr<member_encoder> encoder_;
        std::uint32_t written_mtime_ = 0;

#      ifndef NDEBUG
        bool debug_flag_ = false;
#      endif
    };
} /*namespace gzio*/
