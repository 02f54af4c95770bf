/** @file deflate_zstream.hpp **/

#pragma once

#include "base_zstream.hpp"
#include <utility>

namespace gzio {
    /** @brief flush behavior for @ref deflate_zstream::deflate_chunk **/
    enum class deflate_flush {
        /** let zlib decide when to emit output **/
        none,
        /** emit all pending output,  aligned to a byte boundary (Z_SYNC_FLUSH) **/
        sync,
        /** complete the deflate stream (Z_FINISH) **/
        finish
    };

    /**
       @class deflate_zstream compression/deflate_zstream.hpp

       @brief accept uncompressed input and deflate (i.e. compress) it to raw deflate.

       Example
       @code
       deflate_zstream zs(6);
       zs.provide_input(uc_span);

       do {
           zs.provide_output(z_arena.reserve(4096));
           auto pr = zs.deflate_chunk(deflate_flush::none);
           z_arena.produce(pr.second.size());
       } while (zs.have_input());
       @endcode
    **/
    class deflate_zstream : public base_zstream {
    public:
        /** @param level  compression level in [-1, 9];  -1 for zlib default **/
        explicit deflate_zstream(int level = Z_DEFAULT_COMPRESSION);
        deflate_zstream(deflate_zstream const & x) = delete;
        /** @brief destructor; calls @c zlib @c deflateEnd() **/
        virtual ~deflate_zstream();

        int level() const { return level_; }
        /** @brief true once a @c deflate_flush::finish call completed the stream **/
        bool stream_end() const { return stream_end_; }

        /** @brief reset to begin a new deflate stream at the same level **/
        void rebuild();

        /** @brief Deflate some input.

            @param flush  flush behavior;  with @c sync or @c finish,  repeat
                          until @ref base_zstream::output_empty is false after the call
                          (i.e. zlib did not run out of output space)

            @return pair with:
            @c .first  = span for uncompressed bytes consumed
            @c .second = span for compressed bytes produced
        **/
        std::pair<input_span_type, span_type> deflate_chunk(deflate_flush flush);

    private:
        void setup();
        void teardown();

    private:
        int level_ = Z_DEFAULT_COMPRESSION;
        bool stream_end_ = false;
    };
} /*namespace gzio*/
