/** @file member_decoder.hpp **/

#pragma once

#include "inflate_zstream.hpp"
#include "byte_arena.hpp"
#include "gzip_header.hpp"
#include <streambuf>
#include <optional>
#include <cstdint>

namespace gzio {
    /** @brief restart point at the beginning of a gzip member **/
    struct member_checkpoint {
        /** @brief offset (relative to start of compressed stream) of the member's first header byte **/
        std::uint64_t z_offset = 0;
        /** @brief uncompressed stream offset at which the member's output begins **/
        std::uint64_t uc_offset = 0;
    };

    /**
       @class member_decoder compression/member_decoder.hpp

       @brief multi-member gzip decompression state machine.

       Pulls compressed bytes from a @c std::streambuf,  one chunk per @ref fill,
       and appends decompressed bytes to a caller-owned @ref byte_arena.

       @code
                  +--------+   header parsed    +------+  deflate end  +---------+
       start ---> | header | -----------------> | body | ------------> | trailer |
                  +--------+                    +------+               +---------+
                      ^                                                     |
                      |  non-zero byte   +---------+   crc + size verified  |
                      +----------------- | padding | <----------------------+
                                         +---------+
                                              | source exhausted
                                              v
                                           [ done ]
       @endcode

       A source that ends in @c header state with no buffered input,  or in
       @c padding state,  is a clean end of stream.
       Ending anywhere else is a @ref format_error.

       @note Only uses calling thread;  not threadsafe.
    **/
    class member_decoder {
    public:
        using size_type = std::uint64_t;

        /** @brief states of the member state machine **/
        enum class phase { header, body, trailer, padding, done };

        static constexpr size_type c_default_chunk_z = 64UL * 1024UL;

    public:
        explicit member_decoder(size_type chunk_z = c_default_chunk_z);
        member_decoder(member_decoder const & x) = delete;

        size_type chunk_z() const { return chunk_z_; }
        phase current_phase() const { return phase_; }
        /** @brief true once the end of the last member has been reached **/
        bool eof() const { return phase_ == phase::done; }

        /** @brief header of the first member decoded since construction;  empty until parsed **/
        std::optional<gzip_header> const & first_header() const { return first_header_; }
        /** @brief number of member headers parsed since construction or @ref restart **/
        std::uint32_t n_member() const { return n_member_; }
        /** @brief checkpoint for the member most recently started **/
        member_checkpoint const & member_start() const { return member_start_; }

        /** @brief compressed bytes consumed by the state machine (relative to stream start) **/
        size_type z_offset() const { return z_consumed_; }
        /** @brief compressed bytes read from source (relative to stream start) **/
        size_type z_read() const { return z_read_; }
        /** @brief total uncompressed bytes produced (relative to stream start) **/
        size_type uc_offset() const { return uc_offset_; }

        /** @brief read up to one chunk of compressed input from @p src and decode it into @p out.

            @return number of uncompressed bytes appended to @p out
            (may be 0 before eof,  e.g. when the chunk held only header bytes).
            Each call before eof either reads from @p src or decodes buffered input.

            Throws @ref format_error for corrupt or truncated input,
            @ref resource_error when @p src fails.
         **/
        size_type fill(std::streambuf * src, byte_arena & out);

        /** @brief discard decoding state and resume at member checkpoint @p ck.

            Caller is responsible for positioning the source at @p ck.z_offset.
         **/
        void restart(member_checkpoint const & ck);

#      ifndef NDEBUG
        void set_debug_flag(bool x) { debug_flag_ = x; }
#      endif

    private:
        /** @brief read one chunk from @p src into @ref z_in_.  @return bytes read (0 at end of source) **/
        size_type read_chunk(std::streambuf * src);
        /** @brief advance the state machine as far as buffered input allows **/
        void decode_buffered(byte_arena & out);
        /** @brief source exhausted:  decide between clean eof and truncation **/
        void finish_at_eof();
        void consume_z(size_type z);

    private:
        size_type chunk_z_ = c_default_chunk_z;
        phase phase_ = phase::header;

        /** @brief raw deflate engine for the current member body **/
        inflate_zstream zs_;
        /** @brief compressed bytes read from source,  not yet consumed **/
        byte_arena z_in_;

        /** @brief running crc32 of current member's output **/
        std::uint32_t crc_ = 0;
        /** @brief running size of current member's output (mod 2^32) **/
        std::uint32_t isize_ = 0;

        /** @brief compressed bytes read from source since stream start **/
        size_type z_read_ = 0;
        /** @brief compressed bytes consumed since stream start **/
        size_type z_consumed_ = 0;
        size_type uc_offset_ = 0;

        std::uint32_t n_member_ = 0;
        member_checkpoint member_start_;
        std::optional<gzip_header> first_header_;

#      ifndef NDEBUG
        bool debug_flag_ = false;
#      endif
    };
} /*namespace gzio*/
