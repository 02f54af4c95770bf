// binary_file.cpp

#include "gzio/binary_file.hpp"
#include "compression/error.hpp"
#include "compression/gzip_header.hpp"
#include "compression/tostr.hpp"
#include <algorithm>
#include <iostream>
#include <cstring>
#include <ctime>
#include <unistd.h>

using namespace std;

namespace gzio {
    unique_ptr<binary_file>
    binary_file::open(string const & path, string_view mode, open_options const & opts)
    {
        open_mode m = parse_mode(mode);

        if (m.text)
            throw invalid_argument(tostr("binary mode cannot include 't': '", mode, "'"));

        validate_options(m, opts);

        return unique_ptr<binary_file>(new binary_file(native_io::open_path(path, m), m, opts));
    }

    unique_ptr<binary_file>
    binary_file::open(std::streambuf & sbuf, string_view mode, open_options const & opts)
    {
        open_mode m = parse_mode(mode);

        if (m.text)
            throw invalid_argument(tostr("binary mode cannot include 't': '", mode, "'"));

        validate_options(m, opts);

        return unique_ptr<binary_file>(new binary_file(native_io::borrow(sbuf, m, opts.closefd), m, opts));
    }

    binary_file::binary_file(native_io io, open_mode mode, open_options const & opts)
        : io_{std::move(io)},
          mode_{std::move(mode)},
          chunk_z_{opts.chunk_size},
          members_{opts.cookie_cache_size}
    {
        if (mode_.is_reading()) {
            decoder_.reset(new member_decoder(chunk_z_));
        } else {
            encoder_.reset(new member_encoder(opts.compresslevel, chunk_z_));

            if (opts.mtime)
                written_mtime_ = static_cast<uint32_t>(*opts.mtime);
            else
                written_mtime_ = static_cast<uint32_t>(::time(nullptr));

            optional<string> path;
            if (!io_.name().empty())
                path = io_.name();

            string fname = header_filename(opts.original_filename, path);

            encoder_->begin(io_.sbuf(), encode_gzip_header(fname, written_mtime_, opts.compresslevel));
        }
    }

    binary_file::~binary_file()
    {
        try {
            this->close();
        } catch (std::exception & ex) {
            std::cerr << "gzio::binary_file: error closing [" << this->name() << "]: " << ex.what() << std::endl;
        }
    }

    bool
    binary_file::seekable() const
    {
        if (mode_.is_reading())
            return io_.seekable();

        /* forward seeks only */
        return true;
    }

    void
    binary_file::check_open() const
    {
        if (closed_)
            throw unsupported_operation("I/O operation on closed file");
    }

    void
    binary_file::check_readable() const
    {
        this->check_open();

        if (!mode_.is_reading())
            throw unsupported_operation(tostr("File not open for reading (mode '", mode_.str, "')"));
    }

    void
    binary_file::check_writable() const
    {
        this->check_open();

        if (!mode_.is_writing())
            throw unsupported_operation(tostr("File not open for writing (mode '", mode_.str, "')"));
    }

    void
    binary_file::flush()
    {
        this->check_open();

        if (!encoder_)
            return;

#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "binary_file::flush: uc_offset " << encoder_->uc_offset() << std::endl;
#      endif

        encoder_->flush(io_.sbuf());
        io_.sync(encoder_->z_offset());
    }

    void
    binary_file::close()
    {
        if (closed_)
            return;

        /* mark first:  a failure below must not lead to a second trailer */
        closed_ = true;

        if (encoder_) {
            encoder_->finish(io_.sbuf());
            io_.close(encoder_->z_offset());
        } else {
            io_.close(decoder_->z_offset());
        }
    }

    // ----- reading -----

    bool
    binary_file::pull()
    {
        while (!decoder_->eof()) {
            size_type z_read = decoder_->z_read();
            size_type z_offset = decoder_->z_offset();

            size_type n = decoder_->fill(io_.sbuf(), buf_);

            this->note_member();

            if (n > 0)
                return true;

            if (!decoder_->eof()
                && (decoder_->z_read() == z_read)
                && (decoder_->z_offset() == z_offset))
            {
                throw resource_error("read", z_read, "gzip decoder made no progress");
            }
        }

        return false;
    }

    void
    binary_file::note_member()
    {
        if (decoder_->n_member() == n_member_seen_)
            return;

        n_member_seen_ = decoder_->n_member();

        member_checkpoint const & ck = decoder_->member_start();

        /* several (empty) members may start at the same uncompressed offset;  keep the earliest */
        members_.insert_if_absent(ck.uc_offset, ck);
    }

    string
    binary_file::take(size_type z)
    {
        span<uint8_t> c = buf_.contents().prefix(z);
        string retval(reinterpret_cast<char const *>(c.lo()), c.size());

        buf_.consume(z);

        return retval;
    }

    string
    binary_file::read(int64_t n)
    {
        this->check_readable();

        if (n == 0)
            return string();

        if (n < 0) {
            while (this->pull())
                ;

            return this->take(buf_.size());
        }

        size_type want = static_cast<size_type>(n);

        while ((buf_.size() < want) && this->pull())
            ;

        return this->take(std::min(want, buf_.size()));
    }

    string
    binary_file::read1(int64_t n)
    {
        this->check_readable();

        if (n == 0)
            return string();

        if (buf_.empty())
            this->pull();

        if (n < 0)
            return this->take(buf_.size());

        return this->take(std::min(static_cast<size_type>(n), buf_.size()));
    }

    auto
    binary_file::readinto(span<uint8_t> dest) -> size_type
    {
        this->check_readable();

        while ((buf_.size() < dest.size()) && this->pull())
            ;

        size_type z = std::min(dest.size(), buf_.size());

        if (z > 0)
            ::memcpy(dest.lo(), buf_.contents().lo(), z);

        buf_.consume(z);

        return z;
    }

    string
    binary_file::peek(int64_t n)
    {
        this->check_readable();

        if (n > 0) {
            size_type want = static_cast<size_type>(n);

            while ((buf_.size() < want) && this->pull())
                ;

            span<uint8_t> c = buf_.contents().prefix(std::min(want, buf_.size()));

            return string(reinterpret_cast<char const *>(c.lo()), c.size());
        }

        if ((n < 0) && buf_.empty())
            this->pull();

        span<uint8_t> c = buf_.contents();

        return string(reinterpret_cast<char const *>(c.lo()), c.size());
    }

    string
    binary_file::readline(int64_t limit)
    {
        this->check_readable();

        if (limit == 0)
            return string();

        /* buffered bytes before this position are known not to contain \n */
        size_type from = 0;

        while (true) {
            size_type p = buf_.find('\n', from);

            if (p != byte_arena::npos) {
                size_type z = p + 1;

                if ((limit > 0) && (z > static_cast<size_type>(limit)))
                    z = limit;

                return this->take(z);
            }

            if ((limit > 0) && (buf_.size() >= static_cast<size_type>(limit)))
                return this->take(limit);

            from = buf_.size();

            if (!this->pull())
                return this->take(buf_.size());
        }
    }

    vector<string>
    binary_file::readlines(int64_t hint)
    {
        this->check_readable();

        vector<string> retval;
        size_type total = 0;

        while (true) {
            string line = this->readline();

            if (line.empty())
                break;

            total += line.size();
            retval.push_back(std::move(line));

            if ((hint > 0) && (total >= static_cast<size_type>(hint)))
                break;
        }

        return retval;
    }

    // ----- writing -----

    auto
    binary_file::write_bytes(span<uint8_t const> x) -> size_type
    {
        this->check_writable();

        encoder_->write(io_.sbuf(), x);

        return x.size();
    }

    uint64_t
    binary_file::write(string_view x)
    {
        auto const * p = reinterpret_cast<uint8_t const *>(x.data());

        return this->write_bytes(span<uint8_t const>(p, p + x.size()));
    }

    void
    binary_file::writelines(vector<string> const & lines)
    {
        this->check_writable();

        for (string const & line : lines)
            this->write(string_view(line));
    }

    // ----- positioning -----

    auto
    binary_file::tell() const -> size_type
    {
        if (encoder_)
            return encoder_->uc_offset();

        return decoder_->uc_offset() - buf_.size();
    }

    void
    binary_file::skip(size_type z)
    {
        while (z > 0) {
            if (buf_.empty() && !this->pull())
                break;

            size_type k = std::min(z, buf_.size());

            buf_.consume(k);
            z -= k;
        }
    }

    void
    binary_file::restart_before(size_type target)
    {
        member_checkpoint ck;

        if (auto fl = members_.floor(target))
            ck = fl->second;

#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "binary_file::restart_before: target " << target
                      << " -> member at z_offset " << ck.z_offset << " uc_offset " << ck.uc_offset << std::endl;
#      endif

        io_.seek_to(ck.z_offset);

        decoder_->restart(ck);
        n_member_seen_ = 0;
        buf_.clear();
    }

    auto
    binary_file::seek(int64_t offset, seek_whence whence) -> size_type
    {
        this->check_open();

        if (whence != seek_whence::set) {
            if (offset != 0)
                throw unsupported_operation(tostr("can't do nonzero ",
                                                  (whence == seek_whence::cur) ? "cur" : "end",
                                                  "-relative seeks"));

            if ((whence == seek_whence::end) && decoder_) {
                while (this->pull())
                    buf_.clear();
                buf_.clear();
            }

            return this->tell();
        }

        if (offset < 0)
            throw invalid_argument(tostr("negative seek position [", offset, "]"));

        size_type target = static_cast<size_type>(offset);

        if (encoder_) {
            size_type pos = this->tell();

            if (target < pos)
                throw resource_error("seek", pos, tostr("negative seek in write mode: target [", target, "] before position [", pos, "]"));

            static string const s_zeros(1024, '\0');

            while (pos < target) {
                size_type k = std::min(target - pos, static_cast<size_type>(s_zeros.size()));

                this->write(string_view(s_zeros.data(), k));
                pos += k;
            }

            return this->tell();
        }

        if (target < this->tell())
            this->restart_before(target);

        this->skip(target - this->tell());

        return this->tell();
    }

    void
    binary_file::rewind()
    {
        if (!mode_.is_reading())
            throw unsupported_operation("can't rewind in write mode");

        this->seek(0);
    }

    // ----- properties -----

    optional<uint32_t>
    binary_file::mtime() const
    {
        if (encoder_)
            return written_mtime_;

        if (decoder_->first_header())
            return decoder_->first_header()->mtime;

        return nullopt;
    }

    int
    binary_file::fileno() const
    {
        int fd = io_.fd();

        if (fd < 0)
            throw unsupported_operation("fileno() not supported by underlying stream");

        return fd;
    }

    bool
    binary_file::isatty() const
    {
        int fd = io_.fd();

        return (fd >= 0) && (::isatty(fd) != 0);
    }

    void
    binary_file::truncate(optional<uint64_t>)
    {
        throw unsupported_operation("truncate");
    }

    void
    binary_file::detach()
    {
        throw unsupported_operation("detach");
    }

#ifndef NDEBUG
    void
    binary_file::set_debug_flag(bool x)
    {
        debug_flag_ = x;

        if (decoder_)
            decoder_->set_debug_flag(x);
        if (encoder_)
            encoder_->set_debug_flag(x);
    }
#endif
} /*namespace gzio*/

/* end binary_file.cpp */
