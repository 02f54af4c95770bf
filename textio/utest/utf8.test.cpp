#include "textio/utf8.hpp"
#include <catch2/catch.hpp>
#include <string>

using namespace std;

TEST_CASE("utf8-length", "[utf8]") {
    CHECK(gzio::utf8_length("") == 0);
    CHECK(gzio::utf8_length("abc") == 3);
    /* e-acute (2 bytes),  euro sign (3 bytes),  U+1F600 (4 bytes) */
    CHECK(gzio::utf8_length("\xc3\xa9\xe2\x82\xac\xf0\x9f\x98\x80") == 3);
}

TEST_CASE("utf8-offset", "[utf8]") {
    string s = "a\xc3\xa9\xe2\x82\xac" "b";

    CHECK(gzio::utf8_offset(s, 0) == 0);
    CHECK(gzio::utf8_offset(s, 1) == 1);
    CHECK(gzio::utf8_offset(s, 2) == 3);
    CHECK(gzio::utf8_offset(s, 3) == 6);
    CHECK(gzio::utf8_offset(s, 4) == 7);
    CHECK(gzio::utf8_offset(s, 99) == 7);
}

TEST_CASE("utf8-decode-one", "[utf8]") {
    CHECK(gzio::utf8_decode_one("A") == 0x41);
    CHECK(gzio::utf8_decode_one("\xc3\xa9") == 0xe9);
    CHECK(gzio::utf8_decode_one("\xe2\x82\xac") == 0x20ac);
    CHECK(gzio::utf8_decode_one("\xf0\x9f\x98\x80") == 0x1f600);
    /* truncated and stray continuation bytes */
    CHECK(gzio::utf8_decode_one("\xe2\x82") == 0xfffd);
    CHECK(gzio::utf8_decode_one("\x80") == 0xfffd);
    CHECK(gzio::utf8_sequence_z('\xf0') == 4);
    CHECK(gzio::utf8_sequence_z('\x80') == 1);
}
