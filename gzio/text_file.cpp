// text_file.cpp

#include "gzio/text_file.hpp"
#include "textio/utf8.hpp"
#include "compression/error.hpp"
#include "compression/tostr.hpp"
#include <algorithm>
#include <iostream>

using namespace std;

namespace gzio {
    namespace {
        /* mode for the binary handle beneath a text handle */
        open_mode
        binary_mode_of(open_mode const & m)
        {
            open_mode retval = m;
            retval.text = false;
            retval.binary = true;

            switch (m.kind) {
            case open_kind::read:      retval.str = "rb"; break;
            case open_kind::write:     retval.str = "wb"; break;
            case open_kind::append:    retval.str = "ab"; break;
            case open_kind::exclusive: retval.str = "xb"; break;
            }

            if (m.plus)
                retval.str += "+";

            return retval;
        }

        open_mode
        text_mode_of(string_view mode)
        {
            open_mode retval = parse_mode(mode);

            if (retval.binary)
                throw invalid_argument(tostr("text mode cannot include 'b': '", mode, "'"));

            retval.text = true;

            return retval;
        }

        open_options
        binary_options_of(open_options const & opts)
        {
            open_options retval = opts;
            retval.encoding.reset();
            retval.errors.reset();
            retval.newline.reset();

            return retval;
        }
    }

    unique_ptr<text_file>
    text_file::open(string const & path, string_view mode, open_options const & opts)
    {
        open_mode m = text_mode_of(mode);

        validate_options(m, opts);

        /* codec first:  an unknown encoding shouldn't create or truncate anything */
        text_codec codec(opts.encoding.value_or(c_default_encoding),
                         opts.errors.value_or(c_default_errors));

        open_mode bm = binary_mode_of(m);

        unique_ptr<binary_file> bin(new binary_file(native_io::open_path(path, bm), bm, binary_options_of(opts)));

        return unique_ptr<text_file>(new text_file(std::move(bin), m, std::move(codec), opts));
    }

    unique_ptr<text_file>
    text_file::open(std::streambuf & sbuf, string_view mode, open_options const & opts)
    {
        open_mode m = text_mode_of(mode);

        validate_options(m, opts);

        text_codec codec(opts.encoding.value_or(c_default_encoding),
                         opts.errors.value_or(c_default_errors));

        open_mode bm = binary_mode_of(m);

        unique_ptr<binary_file> bin(new binary_file(native_io::borrow(sbuf, bm, opts.closefd), bm, binary_options_of(opts)));

        return unique_ptr<text_file>(new text_file(std::move(bin), m, std::move(codec), opts));
    }

    text_file::text_file(unique_ptr<binary_file> bin, open_mode mode, text_codec codec, open_options const & opts)
        : bin_{std::move(bin)},
          mode_{std::move(mode)},
          codec_{std::move(codec)},
          newline_{parse_newline(opts.newline)},
          chunk_z_{opts.chunk_size},
          cookies_{opts.cookie_cache_size}
    {
        if (!bin_)
            throw invalid_argument("text_file: binary handle required");
    }

    text_file::~text_file()
    {
        try {
            this->close();
        } catch (std::exception & ex) {
            std::cerr << "gzio::text_file: error closing [" << this->name() << "]: " << ex.what() << std::endl;
        }
    }

    void
    text_file::check_open() const
    {
        if (closed_)
            throw unsupported_operation("I/O operation on closed file");
    }

    void
    text_file::check_readable() const
    {
        this->check_open();

        if (!mode_.is_reading())
            throw unsupported_operation(tostr("File not open for reading (mode '", mode_.str, "')"));
    }

    void
    text_file::check_writable() const
    {
        this->check_open();

        if (!mode_.is_writing())
            throw unsupported_operation(tostr("File not open for writing (mode '", mode_.str, "')"));
    }

    void
    text_file::flush()
    {
        this->check_open();

        bin_->flush();
    }

    void
    text_file::close()
    {
        if (closed_)
            return;

        closed_ = true;

        if (mode_.is_writing()) {
            /* stateful encodings (ISO-2022-*) need a closing shift sequence */
            string tail = codec_.encode_final();

            if (!tail.empty())
                bin_->write(tail);
        }

        bin_->close();
    }

    // ----- reading -----

    bool
    text_file::decode_segment()
    {
        if (eof_)
            return false;

        uint64_t byte_offset = bin_->tell();
        string raw = bin_->read(chunk_z_);
        bool final = raw.empty();

        decode_result r = decode_chunk(codec_, newline_, carry_, raw, final);

        if (!r.text.empty()) {
            size_type n_char = utf8_length(r.text);

            segments_.push_back(segment{byte_offset, carry_, char_end_, n_char});

            if (text_lo_ > 0) {
                text_.erase(0, text_lo_);
                text_lo_ = 0;
            }

            text_.append(r.text);
            char_end_ += n_char;
        }

#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "text_file::decode_segment: byte_offset " << byte_offset
                      << " raw " << raw.size() << " text " << r.text.size()
                      << " char_end " << char_end_ << (final ? " (final)" : "") << std::endl;
#      endif

        carry_ = std::move(r.state);

        if (final)
            eof_ = true;

        return true;
    }

    string
    text_file::take_bytes(size_t z)
    {
        string retval = text_.substr(text_lo_, z);

        text_lo_ += retval.size();
        pos_ += utf8_length(retval);

        while (!segments_.empty()
               && (segments_.front().char_start + segments_.front().n_char <= pos_))
        {
            segments_.pop_front();
        }

        if (text_lo_ == text_.size()) {
            text_.clear();
            text_lo_ = 0;
        }

        return retval;
    }

    string
    text_file::take_chars(size_type n_char)
    {
        return this->take_bytes(utf8_offset(this->pending(), n_char));
    }

    text_checkpoint
    text_file::checkpoint() const
    {
        if (segments_.empty()) {
            /* nothing buffered:  next segment starts at the binary position */
            return text_checkpoint{bin_->tell(), carry_, 0};
        }

        segment const & s = segments_.front();

        return text_checkpoint{s.byte_offset, s.carry_before, pos_ - s.char_start};
    }

    void
    text_file::record_position()
    {
        cookies_.insert(pos_, this->checkpoint());
    }

    void
    text_file::reset_decode(decode_state const & carry, size_type pos)
    {
        carry_ = carry;
        text_.clear();
        text_lo_ = 0;
        segments_.clear();
        eof_ = false;
        pos_ = pos;
        char_end_ = pos;
    }

    string
    text_file::read(int64_t n)
    {
        this->check_readable();

        if (n == 0)
            return string();

        string retval;

        if (n < 0) {
            while (this->decode_segment())
                ;

            retval = this->take_bytes(this->pending().size());
        } else {
            size_type want = static_cast<size_type>(n);

            while ((this->n_pending() < want) && this->decode_segment())
                ;

            retval = this->take_chars(std::min(want, this->n_pending()));
        }

        this->record_position();

        return retval;
    }

    string
    text_file::readline(int64_t limit)
    {
        this->check_readable();

        if (limit == 0)
            return string();

        string retval;

        while (true) {
            string_view t = this->pending();
            size_t end = find_line_end(newline_, t, eof_);

            if (end != string_view::npos) {
                if (limit > 0)
                    end = std::min(end, utf8_offset(t, limit));

                retval = this->take_bytes(end);
                break;
            }

            if ((limit > 0) && (this->n_pending() >= static_cast<size_type>(limit))) {
                retval = this->take_chars(limit);
                break;
            }

            if (!this->decode_segment()) {
                retval = this->take_bytes(this->pending().size());
                break;
            }
        }

        this->record_position();

        return retval;
    }

    vector<string>
    text_file::readlines(int64_t hint)
    {
        this->check_readable();

        vector<string> retval;
        size_type total = 0;

        while (true) {
            string line = this->readline();

            if (line.empty())
                break;

            total += utf8_length(line);
            retval.push_back(std::move(line));

            if ((hint > 0) && (total >= static_cast<size_type>(hint)))
                break;
        }

        return retval;
    }

    // ----- writing -----

    uint64_t
    text_file::write(string_view text)
    {
        this->check_writable();

        string encoded = codec_.encode(translate_for_write(newline_, text));

        bin_->write(string_view(encoded));

        size_type n_char = utf8_length(text);
        pos_ += n_char;

        return n_char;
    }

    void
    text_file::writelines(vector<string> const & lines)
    {
        this->check_writable();

        for (string const & line : lines)
            this->write(string_view(line));
    }

    // ----- positioning -----

    auto
    text_file::seek(int64_t cookie, seek_whence whence) -> size_type
    {
        this->check_open();

        if (whence == seek_whence::cur) {
            if (cookie != 0)
                throw unsupported_operation("can't do nonzero cur-relative seeks");

            return pos_;
        }

        if (mode_.is_writing())
            throw unsupported_operation("can't seek a text stream open for writing");

        if (whence == seek_whence::end) {
            if (cookie != 0)
                throw unsupported_operation("can't do nonzero end-relative seeks");

            while (this->decode_segment())
                this->take_bytes(this->pending().size());

            this->take_bytes(this->pending().size());
            this->record_position();

            return pos_;
        }

        if (cookie < 0)
            throw invalid_argument(tostr("negative seek position [", cookie, "]"));

        if (cookie == 0) {
            bin_->seek(0);
            codec_.reset();
            this->reset_decode(decode_state(), 0);

            return pos_;
        }

        size_type target = static_cast<size_type>(cookie);
        text_checkpoint const * p = cookies_.find(target);

        if (!p)
            throw resource_error("seek", target,
                                 "Cannot seek to uncached text cookie; call tell() near the target position");

        /* copy:  reading below may evict the entry */
        text_checkpoint ck = *p;

#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "text_file::seek: cookie " << target << " -> byte_offset " << ck.byte_offset
                      << " skip_chars " << ck.skip_chars << std::endl;
#      endif

        bin_->seek(ck.byte_offset);
        this->reset_decode(ck.carry, target - ck.skip_chars);

        while ((this->n_pending() < ck.skip_chars) && this->decode_segment())
            ;

        if (this->n_pending() < ck.skip_chars)
            throw resource_error("seek", target, "stream ended before checkpoint position");

        this->take_chars(ck.skip_chars);

        return pos_;
    }

    void
    text_file::rewind()
    {
        if (!mode_.is_reading())
            throw unsupported_operation("can't rewind in write mode");

        this->seek(0);
    }

#ifndef NDEBUG
    void
    text_file::set_debug_flag(bool x)
    {
        debug_flag_ = x;
        bin_->set_debug_flag(x);
    }
#endif
} /*namespace gzio*/

/* end text_file.cpp */
