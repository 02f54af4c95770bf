#include "compression/gzip_header.hpp"
#include "compression/error.hpp"
#include "compression/tostr.hpp"
#include <catch2/catch.hpp>
#include <zlib.h>
#include <vector>
#include <string>

using namespace std;
using namespace gzio::gzip_format;

namespace {
    gzio::span<uint8_t const>
    as_span(vector<uint8_t> const & v, size_t n)
    {
        return gzio::span<uint8_t const>(v.data(), v.data() + n);
    }

    /* hand-built header with every optional field present */
    vector<uint8_t>
    full_header()
    {
        vector<uint8_t> v = { c_magic0, c_magic1, c_method_deflate,
                              static_cast<uint8_t>(c_fextra | c_fname | c_fcomment | c_fhcrc),
                              0x78, 0x56, 0x34, 0x12, /*mtime*/
                              0, 3 /*xfl, os*/ };

        /* FEXTRA: xlen=4 */
        v.push_back(4);
        v.push_back(0);
        v.insert(v.end(), { 'A', 'B', 2, 0 });

        string name = "notes.txt";
        v.insert(v.end(), name.begin(), name.end());
        v.push_back(0);

        string comment = "hi";
        v.insert(v.end(), comment.begin(), comment.end());
        v.push_back(0);

        uint32_t hcrc = ::crc32(0L, v.data(), v.size()) & 0xffff;
        v.push_back(static_cast<uint8_t>(hcrc));
        v.push_back(static_cast<uint8_t>(hcrc >> 8));

        return v;
    }
}

TEST_CASE("gzip-header-encode", "[gzip_header]") {
    vector<uint8_t> hdr = gzio::encode_gzip_header("", 0x01020304, 6);

    REQUIRE(hdr.size() == c_fixed_header_z);
    CHECK(hdr[0] == 0x1f);
    CHECK(hdr[1] == 0x8b);
    CHECK(hdr[2] == 8);
    CHECK(hdr[3] == 0);
    CHECK(hdr[4] == 0x04);
    CHECK(hdr[5] == 0x03);
    CHECK(hdr[6] == 0x02);
    CHECK(hdr[7] == 0x01);
    CHECK(hdr[8] == 0);
    CHECK(hdr[9] == 255);
}

TEST_CASE("gzip-header-encode-xfl", "[gzip_header]") {
    CHECK(gzio::encode_gzip_header("", 0, 9)[8] == 2);
    CHECK(gzio::encode_gzip_header("", 0, 1)[8] == 4);
    CHECK(gzio::encode_gzip_header("", 0, -1)[8] == 0);
    CHECK(gzio::encode_gzip_header("", 0, 0)[8] == 0);
}

TEST_CASE("gzip-header-encode-fname", "[gzip_header]") {
    vector<uint8_t> hdr = gzio::encode_gzip_header("data.txt", 7, 6);

    REQUIRE(hdr.size() == c_fixed_header_z + 9);
    CHECK(hdr[3] == c_fname);
    CHECK(string(hdr.begin() + 10, hdr.end() - 1) == "data.txt");
    CHECK(hdr.back() == 0);

    gzio::header_parse_result hp = gzio::parse_gzip_header(as_span(hdr, hdr.size()));

    REQUIRE(hp.complete);
    REQUIRE(hp.header_z == hdr.size());
    REQUIRE(hp.header.mtime == 7);
    REQUIRE(hp.header.filename);
    REQUIRE(*hp.header.filename == "data.txt");
    REQUIRE(!hp.header.comment);
}

TEST_CASE("gzip-header-parse-all-fields", "[gzip_header]") {
    vector<uint8_t> hdr = full_header();

    gzio::header_parse_result hp = gzio::parse_gzip_header(as_span(hdr, hdr.size()));

    REQUIRE(hp.complete);
    REQUIRE(hp.header_z == hdr.size());
    CHECK(hp.header.mtime == 0x12345678);
    CHECK(hp.header.os == 3);
    CHECK(hp.header.extra == string("AB\x02\x00", 4));
    CHECK(*hp.header.filename == "notes.txt");
    CHECK(*hp.header.comment == "hi");
}

TEST_CASE("gzip-header-parse-incomplete", "[gzip_header]") {
    vector<uint8_t> hdr = full_header();

    /* every proper prefix is valid but incomplete */
    for (size_t n = 0; n < hdr.size(); ++n) {
        INFO(gzio::tostr("prefix size n=", n));

        gzio::header_parse_result hp = gzio::parse_gzip_header(as_span(hdr, n));

        REQUIRE(!hp.complete);
    }
}

TEST_CASE("gzip-header-parse-errors", "[gzip_header]") {
    SECTION("bad magic") {
        vector<uint8_t> v = { 'P', 'K', 3, 4 };
        REQUIRE_THROWS_AS(gzio::parse_gzip_header(as_span(v, v.size())), gzio::format_error);
        REQUIRE_THROWS_WITH(gzio::parse_gzip_header(as_span(v, v.size())),
                            Catch::Matchers::Contains("Not a gzipped file"));
    }
    SECTION("bad second magic byte") {
        vector<uint8_t> v = { 0x1f, 0x00 };
        REQUIRE_THROWS_AS(gzio::parse_gzip_header(as_span(v, v.size())), gzio::format_error);
    }
    SECTION("unknown method") {
        vector<uint8_t> v = gzio::encode_gzip_header("", 0, 6);
        v[2] = 7;
        REQUIRE_THROWS_WITH(gzio::parse_gzip_header(as_span(v, v.size())),
                            Catch::Matchers::Contains("Unknown compression method"));
    }
    SECTION("reserved flags") {
        vector<uint8_t> v = gzio::encode_gzip_header("", 0, 6);
        v[3] = 0x20;
        REQUIRE_THROWS_AS(gzio::parse_gzip_header(as_span(v, v.size())), gzio::format_error);
    }
    SECTION("header crc mismatch") {
        vector<uint8_t> v = full_header();
        v.back() ^= 0xff;
        REQUIRE_THROWS_WITH(gzio::parse_gzip_header(as_span(v, v.size())),
                            Catch::Matchers::Contains("Header CRC"));
    }
}

TEST_CASE("gzip-trailer", "[gzip_header]") {
    auto t = gzio::encode_gzip_trailer(gzio::gzip_trailer{0xcafef00d, 0x10});

    CHECK(t[0] == 0x0d);
    CHECK(t[3] == 0xca);
    CHECK(t[4] == 0x10);
    CHECK(t[7] == 0);

    gzio::gzip_trailer back = gzio::decode_gzip_trailer(gzio::span<uint8_t const>(t.data(), t.data() + t.size()));

    CHECK(back.crc32 == 0xcafef00d);
    CHECK(back.isize == 0x10);
}

TEST_CASE("gzip-header-filename", "[gzip_header]") {
    using std::nullopt;

    CHECK(gzio::header_filename(nullopt, nullopt) == "");
    CHECK(gzio::header_filename(nullopt, string("/tmp/data.csv.gz")) == "data.csv");
    CHECK(gzio::header_filename(nullopt, string("archive")) == "archive");
    CHECK(gzio::header_filename(string("custom.gz"), string("/tmp/other.gz")) == "custom");
    CHECK(gzio::header_filename(string(""), string("/tmp/other.gz")) == "");
    /* latin-1 representable:  e-acute becomes one byte */
    CHECK(gzio::header_filename(nullopt, string("caf\xc3\xa9.gz")) == string("caf\xe9"));
    /* not representable in latin-1:  omitted */
    CHECK(gzio::header_filename(nullopt, string("\xe2\x82\xac.gz")) == "");
}

TEST_CASE("latin1-utf8", "[gzip_header]") {
    CHECK(gzio::latin1_to_utf8(string("caf\xe9")) == string("caf\xc3\xa9"));
    CHECK(gzio::utf8_to_latin1(string("plain")) == string("plain"));
    CHECK(!gzio::utf8_to_latin1(string("\xff")));
}
