/** @file member_encoder.hpp **/

#pragma once

#include "deflate_zstream.hpp"
#include "byte_arena.hpp"
#include "gzip_header.hpp"
#include <streambuf>
#include <cstdint>

namespace gzio {
    /**
       @class member_encoder compression/member_encoder.hpp

       @brief writes one gzip member to a @c std::streambuf.

       Lifecycle:
       @code
       member_encoder enc(6, 64*1024);
       enc.begin(sink, encode_gzip_header("data", mtime, 6));
       enc.write(sink, bytes);     // repeat
       enc.flush(sink);            // optional;  Z_SYNC_FLUSH
       enc.finish(sink);           // Z_FINISH + crc32/size trailer;  exactly once
       @endcode

       Compressed output is staged in an arena and handed to the sink in
       pieces of (at least) @c chunk_z bytes,  except on flush/finish.
    **/
    class member_encoder {
    public:
        using size_type = std::uint64_t;

        static constexpr size_type c_default_chunk_z = 64UL * 1024UL;

    public:
        member_encoder(int level = 6, size_type chunk_z = c_default_chunk_z);
        member_encoder(member_encoder const & x) = delete;

        int level() const { return zs_.level(); }
        size_type chunk_z() const { return chunk_z_; }
        bool started() const { return started_; }
        bool finished() const { return finished_; }

        /** @brief uncompressed bytes accepted so far **/
        size_type uc_offset() const { return uc_offset_; }
        /** @brief compressed bytes handed to the sink so far (header and trailer included) **/
        size_type z_offset() const { return z_written_; }
        /** @brief running crc32 of uncompressed input **/
        std::uint32_t crc() const { return crc_; }

        /** @brief write member header @p header to @p sink.  Must precede @ref write **/
        void begin(std::streambuf * sink, std::vector<std::uint8_t> const & header);

        /** @brief compress @p x;  full chunks of compressed output go to @p sink **/
        void write(std::streambuf * sink, span<std::uint8_t const> x);

        /** @brief sync-flush compressor and write all staged output to @p sink.  Does not end the member. **/
        void flush(std::streambuf * sink);

        /** @brief complete the deflate stream,  write remaining output and the trailer.
            Second and later calls do nothing.
         **/
        void finish(std::streambuf * sink);

#      ifndef NDEBUG
        void set_debug_flag(bool x) { debug_flag_ = x; }
#      endif

    private:
        /** @brief run compressor until input is consumed (and @p flush,  if any,  completes) **/
        void pump(std::streambuf * sink, deflate_flush flush);
        /** @brief hand all of @p x to @p sink;  a short write is a @ref resource_error **/
        void emit(std::streambuf * sink, span<std::uint8_t const> x);
        /** @brief hand staged output to @p sink **/
        void emit_staged(std::streambuf * sink);

    private:
        size_type chunk_z_ = c_default_chunk_z;
        deflate_zstream zs_;
        /** @brief compressed output not yet handed to sink **/
        byte_arena z_out_;

        std::uint32_t crc_ = 0;
        size_type uc_offset_ = 0;
        size_type z_written_ = 0;

        bool started_ = false;
        bool finished_ = false;

#      ifndef NDEBUG
        bool debug_flag_ = false;
#      endif
    };
} /*namespace gzio*/
