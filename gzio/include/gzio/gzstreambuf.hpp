/** @file gzstreambuf.hpp **/

#pragma once

#include "binary_file.hpp"
#include "compression/error.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <streambuf>
#include <string>
#include <vector>

namespace gzio {
    /**
       @class gzstreambuf gzio/gzstreambuf.hpp

       @brief @c std::streambuf over a @ref binary_file,  for use with iostreams.

       Example:
       @code
       gzstreambuf sbuf(binary_file::open("path/to/foo.gz", "wb"));
       std::ostream os(&sbuf);

       os << "Some text to be compressed" << std::endl;
       sbuf.close();
       @endcode

       Get area holds the last chunk returned by @ref binary_file::read1.
       Put area collects up to one chunk before handing it to @ref binary_file::write.
       @c sync() forwards to @ref binary_file::flush.

       @note Only uses calling thread;  not threadsafe.
    **/
    class gzstreambuf : public std::streambuf {
    public:
        using size_type = std::uint64_t;

    public:
        /** @brief streambuf in closed state **/
        gzstreambuf() = default;
        explicit gzstreambuf(std::unique_ptr<binary_file> file) { this->adopt(std::move(file)); }
        gzstreambuf(gzstreambuf const & x) = delete;
        /** @brief closes,  reporting (not throwing) any failure **/
        ~gzstreambuf() override {
            try {
                this->close();
            } catch (std::exception & ex) {
                std::cerr << "gzio::gzstreambuf: error closing: " << ex.what() << std::endl;
            }
        }

        ///@{

        /** @name access methods **/

        bool is_open() const { return file_ && !file_->closed(); }
        bool is_closed() const { return !this->is_open(); }
        binary_file * file() const { return file_.get(); }

        ///@}

        /** @brief attach @p file,  closing any previous one **/
        void adopt(std::unique_ptr<binary_file> file) {
            this->close();

            file_ = std::move(file);
            gbuf_.clear();
            this->setg(nullptr, nullptr, nullptr);

            if (file_ && file_->writable()) {
                pbuf_.resize(file_->chunk_size());
                this->setp(pbuf_.data(), pbuf_.data() + pbuf_.size());
            } else {
                pbuf_.clear();
                this->setp(nullptr, nullptr);
            }
        }

        /** @brief flush pending output and close the gzip stream.  Idempotent. **/
        void close() {
            if (!file_ || file_->closed())
                return;

            if (file_->writable())
                this->write_pending();

            this->setg(nullptr, nullptr, nullptr);
            this->setp(nullptr, nullptr);

            file_->close();
        }

        gzstreambuf & operator=(gzstreambuf const & x) = delete;

    protected:
        int_type underflow() override {
            if (!this->is_open() || !file_->readable())
                return traits_type::eof();

            if (this->gptr() < this->egptr())
                return traits_type::to_int_type(*this->gptr());

            gbuf_ = file_->read1(file_->chunk_size());

            if (gbuf_.empty()) {
                this->setg(nullptr, nullptr, nullptr);
                return traits_type::eof();
            }

            this->setg(gbuf_.data(), gbuf_.data(), gbuf_.data() + gbuf_.size());

            return traits_type::to_int_type(*this->gptr());
        }

        int_type overflow(int_type ch) override {
            if (!this->is_open() || !file_->writable())
                return traits_type::eof();

            this->write_pending();

            if (!traits_type::eq_int_type(ch, traits_type::eof())) {
                *this->pptr() = traits_type::to_char_type(ch);
                this->pbump(1);
            }

            return traits_type::not_eof(ch);
        }

        std::streamsize xsputn(char_type const * s, std::streamsize n) override {
            if (!this->is_open() || !file_->writable())
                return 0;

            if (n <= (this->epptr() - this->pptr())) {
                ::memcpy(this->pptr(), s, n);
                this->pbump(static_cast<int>(n));
                return n;
            }

            /* larger than remaining space:  bypass put area */
            this->write_pending();
            file_->write(std::string_view(s, n));

            return n;
        }

        int sync() override {
            if (!this->is_open())
                return 0;

            if (file_->writable())
                this->write_pending();

            file_->flush();

            return 0;
        }

        /** @brief position in uncompressed stream.
            Supports @c tellg / @c tellp (@c seekoff(0,cur));  other offsets resolve to an absolute seek.
         **/
        pos_type seekoff(off_type offset, std::ios_base::seekdir way, std::ios_base::openmode which) override {
            if (!this->is_open())
                return pos_type(off_type(-1));

            if ((offset == 0) && (way == std::ios_base::cur)) {
                if (file_->writable())
                    return pos_type(off_type(file_->tell() + (this->pptr() - this->pbase())));

                return pos_type(off_type(file_->tell() - (this->egptr() - this->gptr())));
            }

            if (way == std::ios_base::beg)
                return this->seekpos(pos_type(offset), which);

            return pos_type(off_type(-1));
        }

        pos_type seekpos(pos_type pos, std::ios_base::openmode /*which*/) override {
            if (!this->is_open() || (off_type(pos) < 0))
                return pos_type(off_type(-1));

            if (file_->writable())
                this->write_pending();

            /* drop get area;  binary_file position is authoritative */
            this->setg(nullptr, nullptr, nullptr);

            return pos_type(off_type(file_->seek(off_type(pos))));
        }

    private:
        void write_pending() {
            std::streamsize n = this->pptr() - this->pbase();

            if (n > 0)
                file_->write(std::string_view(this->pbase(), n));

            this->setp(pbuf_.data(), pbuf_.data() + pbuf_.size());
        }

    private:
        std::unique_ptr<binary_file> file_;
        /** @brief get area storage **/
        std::string gbuf_;
        /** @brief put area storage **/
        std::vector<char> pbuf_;
    };
} /*namespace gzio*/
