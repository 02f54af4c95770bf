// byte_arena.cpp

#include "compression/byte_arena.hpp"
#include "compression/error.hpp"
#include "compression/tostr.hpp"
#include <algorithm>
#include <cstring>

using namespace std;

namespace gzio {
    namespace {
        /* smallest allocation;  avoids repeated doubling from tiny sizes */
        constexpr byte_arena::size_type c_min_alloc_z = 256;
    }

    byte_arena::byte_arena(size_type capacity,
                           double compact_fraction)
        : buf_{capacity ? new uint8_t[capacity] : nullptr},
          capacity_{capacity},
          compact_fraction_{compact_fraction}
    {
        if (!(compact_fraction > 0.0 && compact_fraction <= 1.0))
            throw invalid_argument(tostr("byte_arena: compact_fraction [", compact_fraction, "] must be in (0,1]"));
    }

    byte_arena::byte_arena(byte_arena && x) noexcept
        : buf_{std::move(x.buf_)},
          capacity_{x.capacity_},
          lo_pos_{x.lo_pos_},
          hi_pos_{x.hi_pos_},
          compact_fraction_{x.compact_fraction_},
          n_compaction_{x.n_compaction_}
    {
        x.capacity_ = 0;
        x.lo_pos_ = 0;
        x.hi_pos_ = 0;
    }

    auto
    byte_arena::reserve(size_type z) -> span_type
    {
        if (capacity_ - hi_pos_ < z) {
            if (capacity_ - this->size() >= z) {
                /* consumed prefix alone makes room */
                this->compact();
            } else {
                /* grow geometrically,  so repeated small appends are amortized O(1) */
                size_type new_z = std::max(std::max(capacity_ * 2, this->size() + z), c_min_alloc_z);

                this->grow(new_z);
            }
        }

        return this->avail();
    }

    void
    byte_arena::produce(size_type z)
    {
        if (hi_pos_ + z > capacity_)
            throw invalid_argument(tostr("byte_arena::produce: [", z, "] bytes exceeds available space [", capacity_ - hi_pos_, "]"));

        hi_pos_ += z;
    }

    void
    byte_arena::append(span<uint8_t const> x)
    {
        if (x.empty())
            return;

        span_type dest = this->reserve(x.size());

        ::memcpy(dest.lo(), x.lo(), x.size());
        this->produce(x.size());
    }

    void
    byte_arena::consume(size_type z)
    {
        if (z > this->size())
            throw invalid_argument(tostr("byte_arena::consume: [", z, "] bytes exceeds contents [", this->size(), "]"));

        lo_pos_ += z;

        if (lo_pos_ == hi_pos_) {
            /* free reset: no data to move */
            lo_pos_ = 0;
            hi_pos_ = 0;
        } else if (static_cast<double>(lo_pos_) > compact_fraction_ * static_cast<double>(capacity_)) {
            this->compact();
        }
    }

    auto
    byte_arena::find(uint8_t ch, size_type from) const -> size_type
    {
        if (from >= this->size())
            return npos;

        uint8_t const * lo = buf_.get() + lo_pos_ + from;
        void const * p = ::memchr(lo, ch, this->size() - from);

        if (!p)
            return npos;

        return from + (static_cast<uint8_t const *>(p) - lo);
    }

    void
    byte_arena::compact()
    {
        size_type n = this->size();

        ::memmove(buf_.get(), buf_.get() + lo_pos_, n);

        lo_pos_ = 0;
        hi_pos_ = n;

        ++n_compaction_;
    }

    void
    byte_arena::grow(size_type new_z)
    {
        std::unique_ptr<uint8_t[]> new_buf(new uint8_t[new_z]);
        size_type n = this->size();

        if (n > 0)
            ::memcpy(new_buf.get(), buf_.get() + lo_pos_, n);

        buf_ = std::move(new_buf);
        capacity_ = new_z;
        lo_pos_ = 0;
        hi_pos_ = n;
    }

    void
    byte_arena::swap(byte_arena & x) noexcept
    {
        std::swap(buf_, x.buf_);
        std::swap(capacity_, x.capacity_);
        std::swap(lo_pos_, x.lo_pos_);
        std::swap(hi_pos_, x.hi_pos_);
        std::swap(compact_fraction_, x.compact_fraction_);
        std::swap(n_compaction_, x.n_compaction_);
    }

    byte_arena &
    byte_arena::operator= (byte_arena && x) noexcept
    {
        byte_arena tmp(std::move(x));

        this->swap(tmp);

        return *this;
    }
} /*namespace gzio*/

/* end byte_arena.cpp */
