// inflate_zstream.cpp

#include "compression/inflate_zstream.hpp"
#include "compression/tostr.hpp"

using namespace std;

namespace gzio {
    inflate_zstream::inflate_zstream() {
        this->setup();
    }

    inflate_zstream::~inflate_zstream() {
        this->teardown();
    }

    void
    inflate_zstream::rebuild() {
        z_stream * const pzs = p_native_zs_.get();

        pzs->avail_in = 0;
        pzs->next_in = Z_NULL;
        pzs->avail_out = 0;
        pzs->next_out = Z_NULL;

        if (::inflateReset(pzs) != Z_OK)
            throw resource_error("inflate_reset", 0, "zlib inflateReset failed");

        stream_end_ = false;
    }

    auto
    inflate_zstream::inflate_chunk() -> pair<input_span_type, span_type>
    {
        /* Z = compressed data,  U = uncompressed data
         *
         * input:  ZZZZZZZZZZZZZZZZZZZZZZZZZZZ       output:  UUUUUUUUUUUUU......................
         *         ^        ^                                 ^            ^
         *         z_pre    z_post                            uc_pre       uc_post
         *
         *         < .first >                                 < .second    >
         */

        z_stream * const pzs = p_native_zs_.get();

        uint8_t const * z_pre = pzs->next_in;
        uint8_t * uc_pre = pzs->next_out;

        int err = ::inflate(pzs, Z_NO_FLUSH);

        switch (err) {
        case Z_OK:
            break;
        case Z_STREAM_END:
            stream_end_ = true;
            break;
        case Z_BUF_ERROR:
            /* no progress possible;  caller must supply input or output space */
            break;
        case Z_NEED_DICT:
        case Z_DATA_ERROR:
            throw format_error(tostr("invalid deflate data: ", this->last_msg()));
        case Z_MEM_ERROR:
            throw resource_error("inflate", this->n_in_total(), "zlib out of memory");
        default:
            throw resource_error("inflate", this->n_in_total(),
                                 tostr("unexpected zlib inflate result [", err, "] ", this->last_msg()));
        }

        uint8_t const * z_post = pzs->next_in;
        uint8_t * uc_post = pzs->next_out;

        return pair<input_span_type, span_type>(input_span_type(z_pre, z_post),
                                                span_type(uc_pre, uc_post));
    }

    void
    inflate_zstream::setup() {
        int ret = ::inflateInit2(p_native_zs_.get(),
                                 -MAX_WBITS /* negative: raw deflate,  no zlib/gzip wrapper */);

        if (ret != Z_OK)
            throw resource_error("inflate_init", 0, tostr("zlib inflateInit2 failed [", ret, "]"));
    }

    void
    inflate_zstream::teardown() {
        ::inflateEnd(p_native_zs_.get());
    }
} /*namespace gzio*/

/* end inflate_zstream.cpp */
