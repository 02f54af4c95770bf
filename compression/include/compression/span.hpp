/** @file span.hpp **/

#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>

namespace gzio {
    /** @class span compression/span.hpp

        @brief Contiguous memory range [lo, hi),  without ownership.

        Used throughout gzio for byte ranges handed to/from zlib and the
        external streambuf.  @c CharT may be const-qualified.

        @tparam CharT type for elements referred to by this span.
    **/
    template <typename CharT>
    class span {
    public:
        /** @brief typealias for span size (in units of CharT) **/
        using size_type = std::uint64_t;
        using element_type = CharT;

    public:
        span() = default;
        /** @brief create span for the contiguous memory range [@p lo, @p hi) **/
        span(CharT * lo, CharT * hi) : lo_{lo}, hi_{hi} {}
        /** @brief create span for the @p z elements starting at @p lo **/
        span(CharT * lo, size_type z) : lo_{lo}, hi_{lo + z} {}

        /** @brief a span over mutable elements converts to a span over const elements **/
        template <typename OtherT,
                  typename = std::enable_if_t<!std::is_same_v<CharT, OtherT>
                                              && std::is_same_v<CharT, OtherT const>>>
        span(span<OtherT> const & x) : lo_{x.lo()}, hi_{x.hi()} {}

        ///@{

        /** @name getters **/

        CharT * lo() const { return lo_; }
        CharT * hi() const { return hi_; }
        CharT * data() const { return lo_; }

        ///@}

        CharT & operator[](size_type i) const { return lo_[i]; }

        /** @brief reinterpret endpoints as pointers to @p OtherT (must have the same size as CharT) **/
        template <typename OtherT>
        span<OtherT>
        cast() const {
            static_assert(sizeof(OtherT) == sizeof(CharT), "span::cast: element sizes must agree");

            return span<OtherT>(reinterpret_cast<OtherT *>(lo_),
                                reinterpret_cast<OtherT *>(hi_));
        }

        /** @brief span comprising the first @p z members of this span. **/
        span prefix(size_type z) const { return span(lo_, lo_ + z); }
        /** @brief span comprising everything after the first @p z members of this span **/
        span after(size_type z) const { return span(lo_ + z, hi_); }

        bool empty() const { return lo_ == hi_; }
        size_type size() const { return hi_ - lo_; }

    private:
        /** @brief start of span (inclusive) **/
        CharT * lo_ = nullptr;
        /** @brief end of span (exclusive) **/
        CharT * hi_ = nullptr;
    };

    /** @brief span of read-only bytes;  used for caller-supplied input **/
    using byte_view = span<std::uint8_t const>;
} /*namespace gzio*/

/* end span.hpp */
