// native_io.cpp

#include "gzio/native_io.hpp"
#include "compression/error.hpp"
#include "compression/tostr.hpp"
#include <fstream>
#include <cerrno>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

using namespace std;

namespace gzio {
    native_io::native_io(native_io && x) noexcept
        : file_{std::move(x.file_)},
          sbuf_{std::exchange(x.sbuf_, nullptr)},
          name_{std::move(x.name_)},
          which_{x.which_},
          base_pos_{x.base_pos_},
          owns_sink_{x.owns_sink_}
    {}

    native_io
    native_io::open_path(string const & path, open_mode const & mode)
    {
        if (path.empty())
            throw invalid_argument("native_io::open_path: empty path");

        if (mode.kind == open_kind::exclusive) {
            /* create atomically;  filebuf has no O_EXCL equivalent */
            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);

            if (fd < 0) {
                int err = errno;

                if (err == EEXIST)
                    throw resource_error("open", 0, tostr("File exists: '", path, "'"));

                throw resource_error("open", 0, tostr("can't open '", path, "': ", ::strerror(err)));
            }

            ::close(fd);
        }

        native_io retval;
        retval.file_.reset(new xfilebuf());

        if (!retval.file_->open(path, mode.filebuf_mode())) {
            int err = errno;
            throw resource_error("open", 0, tostr("can't open '", path, "': ", ::strerror(err)));
        }

        retval.sbuf_ = retval.file_.get();
        retval.name_ = path;
        retval.owns_sink_ = true;
        retval.probe_base(mode);

        return retval;
    }

    native_io
    native_io::borrow(std::streambuf & sbuf, open_mode const & mode, bool closefd)
    {
        native_io retval;

        retval.sbuf_ = &sbuf;
        retval.owns_sink_ = closefd;
        retval.probe_base(mode);

        return retval;
    }

    void
    native_io::probe_base(open_mode const & mode)
    {
        which_ = mode.is_reading() ? ios_base::in : ios_base::out;

        std::streampos p = sbuf_->pubseekoff(0, ios_base::cur, which_);

        base_pos_ = (p == std::streampos(std::streamoff(-1))) ? -1 : static_cast<int64_t>(std::streamoff(p));
    }

    auto
    native_io::fd() const -> native_handle_type
    {
        if (file_)
            return file_->fd();

        /* borrowed streambuf:  may still be one of ours */
        if (auto * xf = dynamic_cast<xfilebuf *>(sbuf_))
            return xf->fd();

        return -1;
    }

    void
    native_io::seek_to(uint64_t z)
    {
        if (!sbuf_)
            throw unsupported_operation("I/O operation on closed file");

        if (base_pos_ < 0)
            throw resource_error("seek", z, "underlying stream is not seekable");

        std::streampos target = std::streampos(std::streamoff(base_pos_ + static_cast<int64_t>(z)));
        std::streampos p;

        try {
            p = sbuf_->pubseekpos(target, which_);
        } catch (std::exception &) {
            rethrow_as_resource_error("seek", z);
        }

        if (p != target)
            throw resource_error("seek", z, "underlying stream refused to seek");
    }

    void
    native_io::sync(uint64_t offset)
    {
        if (!sbuf_)
            return;

        int rc = 0;

        try {
            rc = sbuf_->pubsync();
        } catch (std::exception &) {
            rethrow_as_resource_error("flush", offset);
        }

        if (rc != 0)
            throw resource_error("flush", offset, "underlying stream sync failed");
    }

    void
    native_io::close(uint64_t offset)
    {
        if (!sbuf_)
            return;

        this->sync(offset);

        std::streambuf * sbuf = sbuf_;
        sbuf_ = nullptr;

        if (!owns_sink_)
            return;

        /* only file-like streambufs have a notion of closing */
        if (auto * fb = dynamic_cast<std::filebuf *>(sbuf)) {
            if (fb->is_open() && !fb->close())
                throw resource_error("close", offset, tostr("close failed for '", name_, "'"));
        }

        file_.reset();
    }

    native_io &
    native_io::operator=(native_io && x) noexcept
    {
        file_ = std::move(x.file_);
        sbuf_ = std::exchange(x.sbuf_, nullptr);
        name_ = std::move(x.name_);
        which_ = x.which_;
        base_pos_ = x.base_pos_;
        owns_sink_ = x.owns_sink_;

        return *this;
    }
} /*namespace gzio*/

/* end native_io.cpp */
