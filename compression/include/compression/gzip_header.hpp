/** @file gzip_header.hpp **/

#pragma once

#include "span.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace gzio {
    /*
     * gzip member layout (RFC 1952):
     *
     *   +---+---+---+---+---+---+---+---+---+---+
     *   |x1f|x8b| CM|FLG|     MTIME     |XFL| OS|   fixed 10 bytes;  MTIME little-endian
     *   +---+---+---+---+---+---+---+---+---+---+
     *   [FEXTRA:   XLEN (2 bytes LE) + XLEN bytes]
     *   [FNAME:    zero-terminated latin-1 string]
     *   [FCOMMENT: zero-terminated latin-1 string]
     *   [FHCRC:    low 16 bits of crc32 over preceding header bytes]
     *   ... raw deflate payload ...
     *   +---+---+---+---+---+---+---+---+
     *   |     CRC32     |     ISIZE     |         trailer;  both little-endian
     *   +---+---+---+---+---+---+---+---+
     */
    namespace gzip_format {
        constexpr std::uint8_t c_magic0 = 0x1f;
        constexpr std::uint8_t c_magic1 = 0x8b;
        constexpr std::uint8_t c_method_deflate = 8;

        constexpr std::uint8_t c_ftext = 0x01;
        constexpr std::uint8_t c_fhcrc = 0x02;
        constexpr std::uint8_t c_fextra = 0x04;
        constexpr std::uint8_t c_fname = 0x08;
        constexpr std::uint8_t c_fcomment = 0x10;
        constexpr std::uint8_t c_freserved = 0xe0;

        /** @brief XFL values written by the encoder **/
        constexpr std::uint8_t c_xfl_max_compression = 2;
        constexpr std::uint8_t c_xfl_fastest = 4;

        /** @brief OS byte: unknown **/
        constexpr std::uint8_t c_os_unknown = 255;

        constexpr std::size_t c_fixed_header_z = 10;
        constexpr std::size_t c_trailer_z = 8;
    }

    /** @class gzip_header compression/gzip_header.hpp

        @brief decoded gzip member header.

        String fields hold raw (latin-1) header bytes.
     **/
    struct gzip_header {
        std::uint8_t flags = 0;
        std::uint32_t mtime = 0;
        std::uint8_t xfl = 0;
        std::uint8_t os = gzip_format::c_os_unknown;
        std::string extra;
        std::optional<std::string> filename;
        std::optional<std::string> comment;
    };

    /** @brief outcome of @ref parse_gzip_header on a possibly-incomplete prefix **/
    struct header_parse_result {
        /** @brief false if more input is needed to finish the header **/
        bool complete = false;
        /** @brief number of bytes occupied by the header (when @c complete) **/
        std::size_t header_z = 0;
        gzip_header header;
    };

    /** @brief gzip member trailer **/
    struct gzip_trailer {
        std::uint32_t crc32 = 0;
        /** @brief uncompressed size mod 2^32 **/
        std::uint32_t isize = 0;
    };

    /** @brief parse a gzip member header from the start of @p x.

        Returns @c complete=false when @p x is a valid but incomplete prefix.
        Throws @ref format_error on bad magic,  unknown compression method,
        reserved flag bits,  or header crc mismatch.
     **/
    header_parse_result parse_gzip_header(span<std::uint8_t const> x);

    /** @brief build header bytes for a new member.

        @param filename  latin-1 bytes for FNAME;  empty to omit FNAME
        @param mtime     modification time (seconds since epoch)
        @param level     compression level;  determines XFL
     **/
    std::vector<std::uint8_t> encode_gzip_header(std::string const & filename,
                                                 std::uint32_t mtime,
                                                 int level);

    std::array<std::uint8_t, gzip_format::c_trailer_z> encode_gzip_trailer(gzip_trailer const & x);

    /** @pre @p x has at least @ref gzip_format::c_trailer_z bytes **/
    gzip_trailer decode_gzip_trailer(span<std::uint8_t const> x);

    /** @brief choose the FNAME value for a new member.

        Uses @p explicit_name if present,  otherwise @p path.
        Takes the final path component,  drops a trailing ".gz",
        and converts from utf-8 to latin-1.
        Returns empty string when there is no candidate,  or when the
        candidate has characters outside latin-1.
     **/
    std::string header_filename(std::optional<std::string> const & explicit_name,
                                std::optional<std::string> const & path);

    /** @brief convert utf-8 @p s to latin-1;  nullopt if @p s is not valid utf-8 or has code points above U+00FF **/
    std::optional<std::string> utf8_to_latin1(std::string const & s);
    /** @brief convert latin-1 @p s to utf-8 **/
    std::string latin1_to_utf8(std::string const & s);
} /*namespace gzio*/
