// cooperative_streambuf.cpp

#include "gzio/cooperative_streambuf.hpp"
#include <boost/fiber/operations.hpp>

using namespace std;

namespace gzio {
    void
    cooperative_streambuf::yield()
    {
        ++n_yield_;
        boost::this_fiber::yield();
    }

    /* no get area of our own:  report what inner has */
    streamsize
    cooperative_streambuf::showmanyc()
    {
        return inner_->in_avail();
    }

    auto
    cooperative_streambuf::underflow() -> int_type
    {
        this->yield();

        return inner_->sgetc();
    }

    auto
    cooperative_streambuf::uflow() -> int_type
    {
        this->yield();

        return inner_->sbumpc();
    }

    streamsize
    cooperative_streambuf::xsgetn(char_type * s, streamsize n)
    {
        this->yield();

        return inner_->sgetn(s, n);
    }

    auto
    cooperative_streambuf::overflow(int_type ch) -> int_type
    {
        if (traits_type::eq_int_type(ch, traits_type::eof()))
            return traits_type::not_eof(ch);

        this->yield();

        return inner_->sputc(traits_type::to_char_type(ch));
    }

    streamsize
    cooperative_streambuf::xsputn(char_type const * s, streamsize n)
    {
        this->yield();

        return inner_->sputn(s, n);
    }

    int
    cooperative_streambuf::sync()
    {
        this->yield();

        return inner_->pubsync();
    }

    auto
    cooperative_streambuf::seekoff(off_type offset, ios_base::seekdir way, ios_base::openmode which) -> pos_type
    {
        this->yield();

        return inner_->pubseekoff(offset, way, which);
    }

    auto
    cooperative_streambuf::seekpos(pos_type pos, ios_base::openmode which) -> pos_type
    {
        this->yield();

        return inner_->pubseekpos(pos, which);
    }
} /*namespace gzio*/

/* end cooperative_streambuf.cpp */
