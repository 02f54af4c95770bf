/** @file error.hpp **/

#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace gzio {
    /** @class error compression/error.hpp

        @brief Base class for all exceptions thrown by gzio.
    **/
    class error : public std::runtime_error {
    public:
        explicit error(std::string const & msg) : std::runtime_error(msg) {}
    };

    /** @brief compressed stream is corrupt or truncated
        (bad magic,  bad deflate data,  crc or length mismatch)
     **/
    class format_error : public error {
    public:
        explicit format_error(std::string const & msg) : error(msg) {}
    };

    /** @brief operation not available on this handle in its current mode/state **/
    class unsupported_operation : public error {
    public:
        explicit unsupported_operation(std::string const & msg) : error(msg) {}
    };

    /** @brief caller-supplied configuration or argument is malformed **/
    class invalid_argument : public error {
    public:
        explicit invalid_argument(std::string const & msg) : error(msg) {}
    };

    /** @brief character encode/decode failure,  unknown encoding,  or unknown error-handler name **/
    class codec_error : public error {
    public:
        explicit codec_error(std::string const & msg) : error(msg) {}
    };

    /** @class resource_error compression/error.hpp

        @brief failure of an underlying resource (external streambuf,  zlib internals,  filesystem).

        Carries the name of the operation that failed,  and the stream offset at
        which it failed.  When raised in response to a lower-level exception,
        that exception is attached as a nested exception
        (see @c std::rethrow_if_nested).
    **/
    class resource_error : public error {
    public:
        resource_error(std::string operation,
                       std::uint64_t offset,
                       std::string const & detail);

        /** @brief name of the failed operation,  e.g. "read" **/
        std::string const & operation() const { return operation_; }
        /** @brief stream offset (compressed bytes for source/sink i/o) at which the failure occurred **/
        std::uint64_t offset() const { return offset_; }

    private:
        std::string operation_;
        std::uint64_t offset_ = 0;
    };

    /** @brief translate the in-flight exception into a @ref resource_error.

        Must be called from within a catch block.
        gzio exceptions propagate unchanged;
        any other @c std::exception is nested inside a new @ref resource_error
        tagged with @p operation and @p offset.
     **/
    [[noreturn]] void rethrow_as_resource_error(std::string const & operation,
                                                std::uint64_t offset);
} /*namespace gzio*/
