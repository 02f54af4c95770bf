// member_encoder.cpp

#include "compression/member_encoder.hpp"
#include "compression/error.hpp"
#include "compression/hex.hpp"
#include "compression/tostr.hpp"
#include <zlib.h>
#include <iostream>

using namespace std;

namespace gzio {
    member_encoder::member_encoder(int level, size_type chunk_z)
        : chunk_z_{chunk_z},
          zs_{level},
          z_out_{chunk_z}
    {
        if (chunk_z == 0)
            throw invalid_argument("member_encoder: chunk size must be positive");

        crc_ = ::crc32(0L, Z_NULL, 0);
    }

    void
    member_encoder::begin(std::streambuf * sink, vector<uint8_t> const & header)
    {
        if (started_)
            throw unsupported_operation("member_encoder::begin: member already started");

#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "member_encoder::begin: header " << hex_view(header.data(), header.data() + header.size()) << std::endl;
#      endif

        started_ = true;

        this->emit(sink, span<uint8_t const>(header.data(), header.data() + header.size()));
    }

    void
    member_encoder::write(std::streambuf * sink, span<uint8_t const> x)
    {
        if (!started_ || finished_)
            throw unsupported_operation("member_encoder::write: member not open for writing");

        if (x.empty())
            return;

        crc_ = ::crc32(crc_, x.lo(), static_cast<uInt>(x.size()));
        uc_offset_ += x.size();

        zs_.provide_input(x);
        this->pump(sink, deflate_flush::none);
    }

    void
    member_encoder::flush(std::streambuf * sink)
    {
        if (!started_ || finished_)
            return;

#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "member_encoder::flush: uc_offset " << uc_offset_ << std::endl;
#      endif

        zs_.provide_input(span<uint8_t const>());
        this->pump(sink, deflate_flush::sync);
        this->emit_staged(sink);
    }

    void
    member_encoder::finish(std::streambuf * sink)
    {
        if (!started_ || finished_)
            return;

        /* mark first:  a failing sink must not cause a second trailer later */
        finished_ = true;

        zs_.provide_input(span<uint8_t const>());
        this->pump(sink, deflate_flush::finish);
        this->emit_staged(sink);

        auto trailer = encode_gzip_trailer(gzip_trailer{crc_, static_cast<uint32_t>(uc_offset_)});

#      ifndef NDEBUG
        if (debug_flag_)
            std::cerr << "member_encoder::finish: crc " << hex32(crc_) << " size " << uc_offset_ << std::endl;
#      endif

        this->emit(sink, span<uint8_t const>(trailer.data(), trailer.data() + trailer.size()));
    }

    void
    member_encoder::pump(std::streambuf * sink, deflate_flush flush)
    {
        while (true) {
            span<uint8_t> dest = z_out_.reserve(chunk_z_).prefix(chunk_z_);

            zs_.provide_output(dest);

            auto pr = zs_.deflate_chunk(flush);

            /* avail_out == 0: zlib may be holding more output */
            bool output_full = zs_.output_empty();

            z_out_.produce(pr.second.size());

            if (z_out_.size() >= chunk_z_)
                this->emit_staged(sink);

            if (flush == deflate_flush::finish) {
                if (zs_.stream_end())
                    break;
            } else if (zs_.input_empty() && !output_full) {
                break;
            }
        }
    }

    void
    member_encoder::emit_staged(std::streambuf * sink)
    {
        if (z_out_.empty())
            return;

        this->emit(sink, z_out_.contents());
        z_out_.clear();
    }

    void
    member_encoder::emit(std::streambuf * sink, span<uint8_t const> x)
    {
        if (!sink)
            throw unsupported_operation("member_encoder: no compressed sink attached");

        std::streamsize n = 0;
        try {
            n = sink->sputn(reinterpret_cast<char const *>(x.lo()),
                            static_cast<std::streamsize>(x.size()));
        } catch (std::exception &) {
            rethrow_as_resource_error("write", z_written_);
        }

        if (n != static_cast<std::streamsize>(x.size()))
            throw resource_error("write", z_written_ + n,
                                 tostr("short write to sink: [", n, "] of [", x.size(), "] bytes"));

        z_written_ += n;
    }
} /*namespace gzio*/

/* end member_encoder.cpp */
