/** @file text_file.hpp **/

#pragma once

#include "binary_file.hpp"
#include "textio/text_codec.hpp"
#include "textio/text_decoder.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gzio {
    /** @brief seek target for a text position;  see @ref text_file **/
    struct text_checkpoint {
        /** @brief uncompressed byte offset where a decode segment begins **/
        std::uint64_t byte_offset = 0;
        /** @brief carry-over state before that segment was decoded **/
        decode_state carry;
        /** @brief characters of that segment already delivered **/
        std::uint64_t skip_chars = 0;
    };

    /**
       @class text_file gzio/text_file.hpp

       @brief file-like handle on a gzip stream;  reads and writes text.

       Sits on top of a @ref binary_file.  Text is utf-8 internally;
       the stream itself uses @ref encoding.  Counts and positions are in
       code points.

       Reading decodes one chunk of uncompressed bytes at a time (a "segment").
       Positions are cookies:  the character position itself.  Every read
       records a checkpoint (segment start byte offset,  carry state before
       the segment,  characters already delivered from the segment) for the
       resulting position,  in a bounded LRU cache.
       @c seek(cookie) restores a checkpoint and re-decodes at most one segment.
       Seeking to a position with no checkpoint (other than 0) throws
       @ref resource_error.

       @code
       auto f = text_file::open("notes.txt.gz", "rt");

       for (std::string const & line : f->lines())
           std::cout << line;
       @endcode
    **/
    class text_file : public readable_stream,
                      public writable_stream,
                      public seekable_stream
    {
    public:
        using size_type = std::uint64_t;

        static constexpr char const * c_default_encoding = "utf-8";
        static constexpr char const * c_default_errors = "strict";

    public:
        /** @brief open gzip text file at @p path.  @p mode must not contain 'b' **/
        static std::unique_ptr<text_file> open(std::string const & path,
                                               std::string_view mode = "rt",
                                               open_options const & opts = open_options());
        /** @brief gzip text stream over caller-supplied @p sbuf **/
        static std::unique_ptr<text_file> open(std::streambuf & sbuf,
                                               std::string_view mode = "rt",
                                               open_options const & opts = open_options());

        /** @brief text layer over @p bin.  @p opts supplies newline,  chunk size and cache size **/
        text_file(std::unique_ptr<binary_file> bin, open_mode mode, text_codec codec, open_options const & opts);
        text_file(text_file const & x) = delete;
        ~text_file() override;

        ///@{

        /** @name stream_base **/

        std::string const & name() const override { return bin_->name(); }
        std::string const & mode() const override { return mode_.str; }
        bool closed() const override { return closed_; }
        bool readable() const override { return mode_.is_reading(); }
        bool writable() const override { return mode_.is_writing(); }
        bool seekable() const override { return bin_->seekable(); }

        void flush() override;
        void close() override;

        ///@}

        ///@{

        /** @name text properties **/

        std::string const & encoding() const { return codec_.encoding(); }
        std::string const & errors() const { return codec_.errors(); }
        /** @brief newline option the handle was opened with **/
        std::optional<std::string> newline() const { return newline_option(newline_); }
        /** @brief binary handle beneath this one **/
        binary_file * buffer() const { return bin_.get(); }
        int fileno() const { return bin_->fileno(); }
        bool isatty() const { return bin_->isatty(); }
        /** @brief text checkpoints currently recorded **/
        std::size_t n_checkpoint() const { return cookies_.size(); }

        ///@}

        ///@{

        /** @name reading **/

        /** @brief read up to @p n characters;  everything when @p n < 0 **/
        std::string read(std::int64_t n = -1) override;
        /** @brief read one line,  per newline mode;  at most @p limit characters when @p limit >= 0 **/
        std::string readline(std::int64_t limit = -1) override;
        std::vector<std::string> readlines(std::int64_t hint = -1) override;
        line_range lines() { return line_range(this); }

        ///@}

        ///@{

        /** @name writing **/

        /** @brief encode and write utf-8 @p text.  @return number of characters in @p text **/
        std::uint64_t write(std::string_view text) override;
        void writelines(std::vector<std::string> const & lines) override;

        ///@}

        ///@{

        /** @name positioning **/

        size_type tell() const override { return pos_; }
        size_type seek(std::int64_t cookie, seek_whence whence = seek_whence::set) override;
        void rewind();

        ///@}

#      ifndef NDEBUG
        void set_debug_flag(bool x);
#      endif

        text_file & operator=(text_file const & x) = delete;

    private:
        /** @brief decode output of one binary read **/
        struct segment {
            std::uint64_t byte_offset = 0;
            decode_state carry_before;
            /** @brief character position of the segment's first character **/
            size_type char_start = 0;
            size_type n_char = 0;
        };

    private:
        void check_open() const;
        void check_readable() const;
        void check_writable() const;

        /** @brief undelivered text **/
        std::string_view pending() const { return std::string_view(text_).substr(text_lo_); }
        /** @brief number of undelivered characters **/
        size_type n_pending() const { return char_end_ - pos_; }

        /** @brief decode one more chunk.  @return false once the stream is exhausted **/
        bool decode_segment();
        /** @brief deliver the next @p n_char characters **/
        std::string take_chars(size_type n_char);
        /** @brief deliver the next @p z bytes of undelivered text (whole characters) **/
        std::string take_bytes(std::size_t z);
        /** @brief checkpoint for the current position **/
        text_checkpoint checkpoint() const;
        /** @brief remember @ref checkpoint for @ref pos_ **/
        void record_position();
        /** @brief forget all read-side state;  next segment decodes from the binary position with @p carry **/
        void reset_decode(decode_state const & carry, size_type pos);

    private:
        std::unique_ptr<binary_file> bin_;
        open_mode mode_;
        text_codec codec_;
        newline_mode newline_ = newline_mode::universal;
        size_type chunk_z_ = open_options::c_default_chunk_size;
        bool closed_ = false;

        /** @brief characters delivered (read) or written so far **/
        size_type pos_ = 0;

        /* reading */

        /** @brief carry state after the last decoded segment **/
        decode_state carry_;
        /** @brief decoded text;  undelivered part starts at @ref text_lo_ **/
        std::string text_;
        std::size_t text_lo_ = 0;
        /** @brief character position just past the end of @ref text_ **/
        size_type char_end_ = 0;
        /** @brief segments with undelivered text,  oldest first **/
        std::deque<segment> segments_;
        /** @brief decoder has seen end of stream **/
        bool eof_ = false;
        cookie_cache<size_type, text_checkpoint> cookies_;

#      ifndef NDEBUG
        bool debug_flag_ = false;
#      endif
    };
} /*namespace gzio*/
