// byte_arena.hpp

#pragma once

#include "span.hpp"
#include <memory>
#include <cstdint>

namespace gzio {
    /*
     *  .buf
     *
     *    +------------------------------------------+
     *    |  |  ...  |  | X|  ... | X|  |    ...  |  |
     *    +------------------------------------------+
     *     ^             ^            ^               ^
     *     0             .lo          .hi             .capacity
     *
     *     <- consumed -> <- valid  -> <-   avail    ->
     *
     * invariant: 0 <= .lo <= .hi <= .capacity
     *
     * arena does not support wrapped content.
     *
     * Consumed prefix is reclaimed in one of three ways:
     * 1. arena empties:  .lo, .hi reset to 0 (no data movement)
     * 2. .lo passes .compact_fraction * .capacity:  valid bytes moved to index 0
     * 3. .reserve() needs more space than follows .hi:  compact in place if
     *    .capacity - size suffices,  otherwise reallocate.
     *    Valid bytes land at index 0 in both cases.
     *
     * Example:
     *   byte_arena arena(64*1024);
     *   span<uint8_t> dest = arena.reserve(4096);
     *   n = fill_from_somewhere(dest.lo(), dest.size());
     *   arena.produce(n);
     *
     *   use(arena.contents().prefix(k));
     *   arena.consume(k);
     */

    /** @class byte_arena compression/byte_arena.hpp

        @brief growable byte buffer with offset + length bookkeeping.

        Holds decompressed bytes not yet delivered to the caller.
        Consuming from the front is O(1);  data movement happens only
        under the compaction policy above.
     **/
    class byte_arena {
    public:
        using size_type = std::uint64_t;
        using span_type = span<std::uint8_t>;

        /** @brief npos: sentinel returned by @ref find **/
        static constexpr size_type npos = static_cast<size_type>(-1);
        /** @brief default compaction threshold,  as a fraction of capacity **/
        static constexpr double c_default_compact_fraction = 0.5;

    public:
        explicit byte_arena(size_type capacity = 0,
                            double compact_fraction = c_default_compact_fraction);
        byte_arena(byte_arena const & x) = delete;
        byte_arena(byte_arena && x) noexcept;

        size_type capacity() const { return capacity_; }
        /** @brief offset of first valid byte **/
        size_type lo_pos() const { return lo_pos_; }
        /** @brief offset one past last valid byte **/
        size_type hi_pos() const { return hi_pos_; }
        size_type size() const { return hi_pos_ - lo_pos_; }
        bool empty() const { return lo_pos_ == hi_pos_; }
        double compact_fraction() const { return compact_fraction_; }
        /** @brief number of compactions (data moves within existing storage) so far **/
        std::uint32_t n_compaction() const { return n_compaction_; }

        std::uint8_t const & operator[](size_type i) const { return buf_[lo_pos_ + i]; }

        /** @brief valid (unconsumed) bytes **/
        span_type contents() const { return span_type(buf_.get() + lo_pos_, buf_.get() + hi_pos_); }
        /** @brief writable space following valid bytes **/
        span_type avail() const { return span_type(buf_.get() + hi_pos_, buf_.get() + capacity_); }

        /** @brief ensure at least @p z bytes available after valid bytes;  may compact or reallocate.
            @return span for all available space (at least @p z bytes)
         **/
        span_type reserve(size_type z);

        /** @brief commit @p z bytes written to the front of @ref avail **/
        void produce(size_type z);

        /** @brief append copy of @p x **/
        void append(span<std::uint8_t const> x);

        /** @brief discard the first @p z valid bytes **/
        void consume(size_type z);

        /** @brief position (relative to start of valid bytes) of first occurrence of @p ch,
            searching from relative position @p from.
            @return @ref npos if not present
         **/
        size_type find(std::uint8_t ch, size_type from = 0) const;

        /** @brief discard all contents;  keeps storage **/
        void clear() { lo_pos_ = 0; hi_pos_ = 0; }

        void swap(byte_arena & x) noexcept;

        byte_arena & operator= (byte_arena const & x) = delete;
        byte_arena & operator= (byte_arena && x) noexcept;

    private:
        /** @brief move valid bytes to start of storage **/
        void compact();
        /** @brief reallocate with room for at least @p new_z bytes **/
        void grow(size_type new_z);

    private:
        std::unique_ptr<std::uint8_t[]> buf_;
        size_type capacity_ = 0;
        size_type lo_pos_ = 0;
        size_type hi_pos_ = 0;
        double compact_fraction_ = c_default_compact_fraction;
        std::uint32_t n_compaction_ = 0;
    };

    inline void
    swap(byte_arena & x, byte_arena & y) noexcept {
        x.swap(y);
    }
} /*namespace gzio*/
