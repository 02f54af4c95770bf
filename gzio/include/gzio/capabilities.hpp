/** @file capabilities.hpp **/

#pragma once

#include <iterator>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace gzio {
    /** @brief reference point for @ref seekable_stream::seek **/
    enum class seek_whence { set, cur, end };

    /** @class stream_base gzio/capabilities.hpp

        @brief operations common to every gzip handle.
     **/
    class stream_base {
    public:
        virtual ~stream_base() = default;

        /** @brief path the handle was opened with;  empty for a caller-supplied streambuf **/
        virtual std::string const & name() const = 0;
        /** @brief mode string the handle was opened with **/
        virtual std::string const & mode() const = 0;

        virtual bool closed() const = 0;
        virtual bool readable() const = 0;
        virtual bool writable() const = 0;
        virtual bool seekable() const = 0;

        /** @brief write buffered compressed output to the sink (no-op when reading) **/
        virtual void flush() = 0;
        /** @brief finish the stream and release the sink;  idempotent **/
        virtual void close() = 0;
    };

    /** @class readable_stream gzio/capabilities.hpp

        @brief read side.  Counts are bytes (binary handles) or code points (text handles).
     **/
    class readable_stream : public virtual stream_base {
    public:
        /** @brief read up to @p n units;  @p n < 0 reads to end of stream **/
        virtual std::string read(std::int64_t n = -1) = 0;
        /** @brief read one line,  including its terminator;  at most @p limit units when @p limit >= 0 **/
        virtual std::string readline(std::int64_t limit = -1) = 0;
        /** @brief read lines until eof,  or until their total size reaches @p hint (when @p hint > 0) **/
        virtual std::vector<std::string> readlines(std::int64_t hint = -1) = 0;
    };

    /** @class writable_stream gzio/capabilities.hpp **/
    class writable_stream : public virtual stream_base {
    public:
        /** @brief write @p x;  @return units accepted **/
        virtual std::uint64_t write(std::string_view x) = 0;
        virtual void writelines(std::vector<std::string> const & lines) = 0;
    };

    /** @class seekable_stream gzio/capabilities.hpp **/
    class seekable_stream : public virtual stream_base {
    public:
        /** @brief current logical position **/
        virtual std::uint64_t tell() const = 0;
        /** @brief move to @p offset relative to @p whence.  @return new position **/
        virtual std::uint64_t seek(std::int64_t offset, seek_whence whence = seek_whence::set) = 0;
    };

    /** @class peekable_stream gzio/capabilities.hpp **/
    class peekable_stream : public virtual stream_base {
    public:
        /** @brief look ahead without advancing **/
        virtual std::string peek(std::int64_t n = 0) = 0;
    };

    /**
       @class line_iterator gzio/capabilities.hpp

       @brief input iterator over the lines of a @ref readable_stream.

       Equal to the default-constructed (end) iterator once @c readline()
       returns an empty string.
    **/
    class line_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = std::string const *;
        using reference = std::string const &;

    public:
        line_iterator() = default;
        explicit line_iterator(readable_stream * s) : s_{s} { this->next(); }

        reference operator*() const { return line_; }
        pointer operator->() const { return &line_; }

        line_iterator & operator++() { this->next(); return *this; }

        bool operator==(line_iterator const & x) const { return s_ == x.s_; }
        bool operator!=(line_iterator const & x) const { return s_ != x.s_; }

    private:
        void next() {
            line_ = s_->readline();
            if (line_.empty())
                s_ = nullptr;
        }

    private:
        readable_stream * s_ = nullptr;
        std::string line_;
    };

    /** @brief range adapter;  @code for (std::string const & line : f->lines()) { ... } @endcode **/
    class line_range {
    public:
        explicit line_range(readable_stream * s) : s_{s} {}

        line_iterator begin() const { return line_iterator(s_); }
        line_iterator end() const { return line_iterator(); }

    private:
        readable_stream * s_ = nullptr;
    };
} /*namespace gzio*/
