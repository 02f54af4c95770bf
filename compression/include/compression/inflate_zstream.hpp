/** @file inflate_zstream.hpp **/

#pragma once

#include "base_zstream.hpp"
#include <utility>

namespace gzio {
    /**
       @class inflate_zstream compression/inflate_zstream.hpp

       @brief accept raw deflate input and inflate (i.e. uncompress) it.

       Caller supplies buffer space for compressed input and uncompressed output.

       Example
       @code
       inflate_zstream zs;
       zs.provide_input(z_arena.contents());
       zs.provide_output(uc_arena.reserve(4096));

       auto pr = zs.inflate_chunk();

       z_arena.consume(pr.first.size());
       uc_arena.produce(pr.second.size());

       if (zs.stream_end()) {
           // deflate stream complete;  any remaining input follows the deflate payload
       }
       @endcode
    **/
    class inflate_zstream : public base_zstream {
    public:
        inflate_zstream();
        inflate_zstream(inflate_zstream const & x) = delete;
        /** @brief destructor; calls @c zlib @c inflateEnd() **/
        virtual ~inflate_zstream();

        /** @brief true once inflate reported end of the deflate stream (since last @ref rebuild) **/
        bool stream_end() const { return stream_end_; }

        /** @brief reset to start a new deflate stream.  Discards attached input/output. **/
        void rebuild();

        /** @brief Inflate some input.

            @return pair with:
            @c .first  = span for compressed bytes consumed
            @c .second = span for uncompressed bytes produced

            Throws @ref format_error on corrupt input,
            @ref resource_error on zlib memory/state failure.

            @pre input attached with @c provide_input()
            @pre output space attached with @c provide_output()
        **/
        std::pair<input_span_type, span_type> inflate_chunk();

    private:
        /** @brief calls @c zlib @c inflateInit2() for raw deflate **/
        void setup();
        /** @brief calls @c zlib @c inflateEnd() **/
        void teardown();

    private:
        bool stream_end_ = false;
    };
} /*namespace gzio*/
