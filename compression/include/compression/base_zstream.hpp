/** @file base_zstream.hpp **/

#pragma once

#include "span.hpp"
#include "error.hpp"
#include <zlib.h>
#include <utility>
#include <memory>

namespace gzio {
    /**
       @class base_zstream compression/base_zstream.hpp

       @brief manage a @c z_stream struct (from @c zlib) in raw-deflate mode.

       gzip framing (header, trailer) is handled by @ref member_decoder and
       @ref member_encoder;  zlib sees only the raw deflate payload.

       See <a href="https://www.zlib.net/manual.html">Zlib manual</a> for @c z_stream API.
    **/
    class base_zstream {
    public:
        /** @brief span type for zlib output (always bytes) **/
        using span_type = span<std::uint8_t>;
        /** @brief span type for zlib input **/
        using input_span_type = span<std::uint8_t const>;

    public:
        base_zstream(base_zstream const & x) = delete;

        /** @brief true iff zlib has consumed all input supplied so far **/
        bool input_empty() const { return (p_native_zs_->avail_in == 0); }
        bool have_input() const { return (p_native_zs_->avail_in > 0); }
        /** @brief true iff supplied output space is exhausted **/
        bool output_empty() const { return (p_native_zs_->avail_out == 0); }
        /** @brief number of unconsumed input bytes still attached **/
        std::uint64_t avail_in() const { return p_native_zs_->avail_in; }

        /** @brief total number of bytes consumed since last (re)initialization **/
        std::uint64_t n_in_total() const { return p_native_zs_->total_in; }
        /** @brief total number of bytes produced since last (re)initialization **/
        std::uint64_t n_out_total() const { return p_native_zs_->total_out; }

        /**
           @brief attach a new input memory range.

           Discards any unconsumed input;  invoke only when @c .input_empty() is true,
           or when deliberately replacing input.
        **/
        void provide_input(input_span_type const & x) {
            /* zlib does not modify input;  next_in lacks const unless built with ZLIB_CONST */
            p_native_zs_->next_in = const_cast<Bytef *>(x.lo());
            p_native_zs_->avail_in = static_cast<uInt>(x.size());
        }

        /** @brief attach new output memory range. **/
        void provide_output(span_type const & x) {
            p_native_zs_->next_out = x.lo();
            p_native_zs_->avail_out = static_cast<uInt>(x.size());
        }

        void swap(base_zstream & x) noexcept {
            std::swap(p_native_zs_, x.p_native_zs_);
        }

    protected:
        /** @brief ctor.  allocates a @c zlib @c z_stream struct in @c .p_native_zs_ **/
        base_zstream() : p_native_zs_(new z_stream) {
            z_stream * const pzs = p_native_zs_.get();

            pzs->zalloc    = Z_NULL;
            pzs->zfree     = Z_NULL;
            pzs->opaque    = Z_NULL;
            pzs->avail_in  = 0;
            pzs->next_in   = Z_NULL;
            pzs->avail_out = 0;
            pzs->next_out  = Z_NULL;
            pzs->msg       = Z_NULL;

            /* derived class must call ::inflateInit2() / ::deflateInit2() */
        }

        virtual ~base_zstream() = default;

        /** @brief message text zlib attached to its last error (or empty) **/
        char const * last_msg() const {
            return p_native_zs_->msg ? p_native_zs_->msg : "";
        }

    protected:
        /**
         *  @brief zlib control state.
         *
         *  @warning @c z_stream is not movable;  zlib keeps a back pointer to it.
         */
        std::unique_ptr<z_stream> p_native_zs_;
    };
} /*namespace gzio*/
