// deflate_zstream.cpp

#include "compression/deflate_zstream.hpp"
#include "compression/tostr.hpp"

using namespace std;

namespace gzio {
    deflate_zstream::deflate_zstream(int level)
        : level_{level}
    {
        this->setup();
    }

    deflate_zstream::~deflate_zstream() {
        this->teardown();
    }

    void
    deflate_zstream::rebuild() {
        z_stream * const pzs = p_native_zs_.get();

        pzs->avail_in = 0;
        pzs->next_in = Z_NULL;
        pzs->avail_out = 0;
        pzs->next_out = Z_NULL;

        if (::deflateReset(pzs) != Z_OK)
            throw resource_error("deflate_reset", 0, "zlib deflateReset failed");

        stream_end_ = false;
    }

    auto
    deflate_zstream::deflate_chunk(deflate_flush flush) -> pair<input_span_type, span_type>
    {
        /* U = uncompressed data,  Z = compressed data
         *
         * input:  UUUUUUUUUUUUUUUUUUUUUUUUUUU       output:  ZZZZZZZZZZZZZ......................
         *         ^        ^                                 ^            ^
         *         uc_pre   uc_post                           z_pre        z_post
         *
         *         < .first >                                 < .second    >
         */

        z_stream * const pzs = p_native_zs_.get();

        uint8_t const * uc_pre = pzs->next_in;
        uint8_t * z_pre = pzs->next_out;

        int zflush = Z_NO_FLUSH;
        switch (flush) {
        case deflate_flush::none:   zflush = Z_NO_FLUSH;   break;
        case deflate_flush::sync:   zflush = Z_SYNC_FLUSH; break;
        case deflate_flush::finish: zflush = Z_FINISH;     break;
        }

        int err = ::deflate(pzs, zflush);

        switch (err) {
        case Z_OK:
        case Z_BUF_ERROR:
            /* Z_BUF_ERROR: no progress possible this call;  not fatal */
            break;
        case Z_STREAM_END:
            stream_end_ = true;
            break;
        default:
            throw resource_error("deflate", this->n_in_total(),
                                 tostr("unexpected zlib deflate result [", err, "] ", this->last_msg()));
        }

        uint8_t const * uc_post = pzs->next_in;
        uint8_t * z_post = pzs->next_out;

        return pair<input_span_type, span_type>(input_span_type(uc_pre, uc_post),
                                                span_type(z_pre, z_post));
    }

    void
    deflate_zstream::setup() {
        int ret = ::deflateInit2(p_native_zs_.get(),
                                 level_,
                                 Z_DEFLATED,
                                 -MAX_WBITS /* negative: raw deflate;  gzip framing written by member_encoder */,
                                 8 /*memlevel 1-9; higher to spend memory for more speed+compression. default=8*/,
                                 Z_DEFAULT_STRATEGY);

        if (ret != Z_OK)
            throw resource_error("deflate_init", 0, tostr("zlib deflateInit2 failed [", ret, "] for level [", level_, "]"));
    }

    void
    deflate_zstream::teardown() {
        ::deflateEnd(p_native_zs_.get());
    }
} /*namespace gzio*/

/* end deflate_zstream.cpp */
