/** @file cooperative_streambuf.hpp **/

#pragma once

#include <streambuf>
#include <cstdint>

namespace gzio {
    /**
       @class cooperative_streambuf gzio/cooperative_streambuf.hpp

       @brief unbuffered streambuf that forwards to another streambuf,
       yielding the current fiber before every forwarded call.

       Put one of these between a gzip handle and its source/sink to make
       each i/o call a suspension point.  Two handles driven from separate
       @c boost::fibers::fiber instances then interleave at chunk boundaries.

       @code
       std::stringbuf src(gz_bytes, std::ios::in | std::ios::binary);
       cooperative_streambuf coop(src);

       boost::fibers::fiber f([&coop] {
           auto h = binary_file::open(coop, "rb");
           h->read();
       });
       f.join();
       @endcode

       Calling from outside any fiber is fine:  yield then returns immediately.

       @note does not own @p inner.
    **/
    class cooperative_streambuf : public std::streambuf {
    public:
        explicit cooperative_streambuf(std::streambuf & inner) : inner_{&inner} {}
        cooperative_streambuf(cooperative_streambuf const & x) = delete;

        std::streambuf * inner() const { return inner_; }
        /** @brief number of times this streambuf has yielded **/
        std::uint64_t n_yield() const { return n_yield_; }

        cooperative_streambuf & operator=(cooperative_streambuf const & x) = delete;

    protected:
        std::streamsize showmanyc() override;
        int_type underflow() override;
        int_type uflow() override;
        std::streamsize xsgetn(char_type * s, std::streamsize n) override;

        int_type overflow(int_type ch) override;
        std::streamsize xsputn(char_type const * s, std::streamsize n) override;
        int sync() override;

        pos_type seekoff(off_type offset, std::ios_base::seekdir way, std::ios_base::openmode which) override;
        pos_type seekpos(pos_type pos, std::ios_base::openmode which) override;

    private:
        void yield();

    private:
        std::streambuf * inner_ = nullptr;
        std::uint64_t n_yield_ = 0;
    };
} /*namespace gzio*/
