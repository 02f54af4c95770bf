// member_decoder.cpp

#include "compression/member_decoder.hpp"
#include "compression/error.hpp"
#include "compression/hex.hpp"
#include "compression/tostr.hpp"
#include <zlib.h>
#include <algorithm>
#include <iostream>

using namespace std;

namespace gzio {
    using namespace gzip_format;

    member_decoder::member_decoder(size_type chunk_z)
        : chunk_z_{chunk_z},
          z_in_{chunk_z}
    {
        if (chunk_z == 0)
            throw invalid_argument("member_decoder: chunk size must be positive");
    }

    auto
    member_decoder::fill(std::streambuf * src, byte_arena & out) -> size_type
    {
        if (phase_ == phase::done)
            return 0;

        size_type uc_pre = uc_offset_;

        /* don't let compressed input pile up:  only read when less than one chunk is buffered,
         * or when a header/trailer straddles the buffered input and can't be parsed without more
         */
        bool src_eof = false;
        if ((z_in_.size() < chunk_z_) || (phase_ == phase::header) || (phase_ == phase::trailer))
            src_eof = (this->read_chunk(src) == 0);

        this->decode_buffered(out);

        if (src_eof)
            this->finish_at_eof();

        return uc_offset_ - uc_pre;
    }

    void
    member_decoder::restart(member_checkpoint const & ck)
    {
#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "member_decoder::restart: z_offset " << ck.z_offset << " uc_offset " << ck.uc_offset << std::endl;
#      endif

        z_in_.clear();
        zs_.rebuild();

        phase_ = phase::header;
        crc_ = 0;
        isize_ = 0;
        z_read_ = ck.z_offset;
        z_consumed_ = ck.z_offset;
        uc_offset_ = ck.uc_offset;
        n_member_ = 0;
        member_start_ = ck;
    }

    auto
    member_decoder::read_chunk(std::streambuf * src) -> size_type
    {
        if (!src)
            throw unsupported_operation("member_decoder: no compressed source attached");

        span<uint8_t> dest = z_in_.reserve(chunk_z_).prefix(chunk_z_);

        std::streamsize n = 0;
        try {
            n = src->sgetn(reinterpret_cast<char *>(dest.lo()),
                           static_cast<std::streamsize>(dest.size()));
        } catch (std::exception &) {
            rethrow_as_resource_error("read", z_read_);
        }

        if (n < 0)
            throw resource_error("read", z_read_, "source reported negative read count");

        z_in_.produce(n);
        z_read_ += n;

#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "member_decoder::read_chunk: read " << n << " compressed bytes (allowing space for " << dest.size() << ")" << std::endl;
#      endif

        return n;
    }

    void
    member_decoder::consume_z(size_type z)
    {
        z_in_.consume(z);
        z_consumed_ += z;
    }

    void
    member_decoder::decode_buffered(byte_arena & out)
    {
        while (true) {
            switch (phase_) {
            case phase::header:
            {
                if (z_in_.empty())
                    return;

                header_parse_result hp = parse_gzip_header(z_in_.contents());

                if (!hp.complete)
                    return;

#              ifndef NDEBUG
                if (debug_flag_) {
                    span<uint8_t> hdr = z_in_.contents().prefix(hp.header_z);
                    std::cerr << "member_decoder: member " << n_member_
                              << " at z_offset " << z_consumed_
                              << " uc_offset " << uc_offset_
                              << " header " << hex_view(hdr.lo(), hdr.hi()) << std::endl;
                }
#              endif

                if (!first_header_)
                    first_header_ = hp.header;

                member_start_ = member_checkpoint{z_consumed_, uc_offset_};
                ++n_member_;

                this->consume_z(hp.header_z);

                zs_.rebuild();
                crc_ = ::crc32(0L, Z_NULL, 0);
                isize_ = 0;

                phase_ = phase::body;
                break;
            }
            case phase::body:
            {
                span<uint8_t> dest = out.reserve(chunk_z_).prefix(chunk_z_);

                zs_.provide_input(z_in_.contents());
                zs_.provide_output(dest);

                auto pr = zs_.inflate_chunk();

                bool output_full = zs_.output_empty();

                this->consume_z(pr.first.size());
                out.produce(pr.second.size());

                if (!pr.second.empty()) {
                    crc_ = ::crc32(crc_, pr.second.lo(), static_cast<uInt>(pr.second.size()));
                    isize_ += static_cast<uint32_t>(pr.second.size());
                    uc_offset_ += pr.second.size();
                }

                if (zs_.stream_end()) {
                    phase_ = phase::trailer;
                    break;
                }

                if (z_in_.empty() && !output_full)
                    return;
                if (pr.first.empty() && pr.second.empty())
                    return;

                break;
            }
            case phase::trailer:
            {
                if (z_in_.size() < c_trailer_z)
                    return;

                gzip_trailer tr = decode_gzip_trailer(z_in_.contents());

                if (tr.crc32 != crc_)
                    throw format_error(tostr("CRC check failed ", hex32(tr.crc32), " != ", hex32(crc_)));

                if (tr.isize != isize_)
                    throw format_error(tostr("Incorrect length of data produced: trailer [", tr.isize, "] != actual [", isize_, "]"));

                this->consume_z(c_trailer_z);

#              ifndef NDEBUG
                if (debug_flag_)
                    std::cerr << "member_decoder: member " << n_member_ - 1 << " complete, crc " << hex32(crc_) << " size " << isize_ << std::endl;
#              endif

                phase_ = phase::padding;
                break;
            }
            case phase::padding:
            {
                /* gzip permits zero padding between/after members */
                span<uint8_t> z = z_in_.contents();
                size_type n_zero = std::find_if(z.lo(), z.hi(), [](uint8_t b) { return b != 0; }) - z.lo();

                this->consume_z(n_zero);

                if (z_in_.empty())
                    return;

                phase_ = phase::header;
                break;
            }
            case phase::done:
                return;
            }
        }
    }

    void
    member_decoder::finish_at_eof()
    {
        switch (phase_) {
        case phase::header:
            if (z_in_.empty()) {
                phase_ = phase::done;
                return;
            }
            break;
        case phase::padding:
            /* decode_buffered left phase=padding only with z_in_ empty */
            phase_ = phase::done;
            return;
        case phase::body:
        case phase::trailer:
            break;
        case phase::done:
            return;
        }

        throw format_error(tostr("Compressed file ended before the end-of-stream marker was reached"
                                 " (at compressed offset ", z_read_, ")"));
    }
} /*namespace gzio*/

/* end member_decoder.cpp */
