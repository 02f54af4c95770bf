#include "textio/text_codec.hpp"
#include "compression/error.hpp"
#include <catch2/catch.hpp>
#include <string>

using namespace std;
using gzio::text_codec;

TEST_CASE("newline-parse", "[text_codec]") {
    CHECK(gzio::parse_newline(nullopt) == gzio::newline_mode::universal);
    CHECK(gzio::parse_newline(string("")) == gzio::newline_mode::untranslated);
    CHECK(gzio::parse_newline(string("\n")) == gzio::newline_mode::lf);
    CHECK(gzio::parse_newline(string("\r")) == gzio::newline_mode::cr);
    CHECK(gzio::parse_newline(string("\r\n")) == gzio::newline_mode::crlf);

    REQUIRE_THROWS_AS(gzio::parse_newline(string("\n\r")), gzio::invalid_argument);
    REQUIRE_THROWS_AS(gzio::parse_newline(string("x")), gzio::invalid_argument);

    CHECK(gzio::newline_option(gzio::newline_mode::crlf) == string("\r\n"));
    CHECK(!gzio::newline_option(gzio::newline_mode::universal));
}

TEST_CASE("codec-unknown-encoding", "[text_codec]") {
    REQUIRE_THROWS_AS(text_codec("no-such-encoding-xyz", "strict"), gzio::codec_error);
    REQUIRE_THROWS_AS(text_codec("", "strict"), gzio::invalid_argument);
}

TEST_CASE("codec-aliases", "[text_codec]") {
    for (char const * name : { "utf-8", "UTF8", "utf_8", "latin-1", "Latin_1", "iso-8859-1", "ascii" }) {
        INFO(name);
        text_codec codec(name, "strict");

        CHECK(codec.decode("plain", true, nullptr) == "plain");
        CHECK(codec.encoding() == name);
    }
}

TEST_CASE("codec-decode-latin1", "[text_codec]") {
    text_codec codec("latin-1", "strict");

    CHECK(codec.decode("caf\xe9", true, nullptr) == "caf\xc3\xa9");
    CHECK(codec.encode("caf\xc3\xa9") == "caf\xe9");
}

TEST_CASE("codec-decode-partial", "[text_codec]") {
    text_codec codec("utf-8", "strict");

    string pending;
    /* euro sign split after its first byte */
    CHECK(codec.decode("ab\xe2", false, &pending) == "ab");
    CHECK(pending == "\xe2");

    CHECK(codec.decode(pending + "\x82\xac" "c", false, &pending) == "\xe2\x82\xac" "c");
    CHECK(pending.empty());
}

TEST_CASE("codec-decode-errors", "[text_codec]") {
    string bad = "a\xff" "b";

    SECTION("strict") {
        text_codec codec("utf-8", "strict");
        REQUIRE_THROWS_AS(codec.decode(bad, true, nullptr), gzio::codec_error);
        REQUIRE_THROWS_WITH(codec.decode(bad, true, nullptr), Catch::Matchers::Contains("can't decode byte 0xff in position 1"));
    }
    SECTION("ignore") {
        text_codec codec("utf-8", "ignore");
        CHECK(codec.decode(bad, true, nullptr) == "ab");
    }
    SECTION("replace") {
        text_codec codec("utf-8", "replace");
        CHECK(codec.decode(bad, true, nullptr) == "a\xef\xbf\xbd" "b");
    }
    SECTION("backslashreplace") {
        text_codec codec("utf-8", "backslashreplace");
        CHECK(codec.decode(bad, true, nullptr) == "a\\xffb");
    }
    SECTION("truncated at end of stream") {
        text_codec codec("utf-8", "replace");
        CHECK(codec.decode("a\xe2\x82", true, nullptr) == "a\xef\xbf\xbd");
    }
    SECTION("unknown handler is accepted until needed") {
        text_codec codec("utf-8", "no-such-handler");

        CHECK(codec.decode("fine", true, nullptr) == "fine");
        REQUIRE_THROWS_WITH(codec.decode(bad, true, nullptr), Catch::Matchers::Contains("unknown error handler"));
    }
}

TEST_CASE("codec-encode-errors", "[text_codec]") {
    /* "a" + euro sign + "b" */
    string text = "a\xe2\x82\xac" "b";

    SECTION("strict") {
        text_codec codec("ascii", "strict");
        REQUIRE_THROWS_WITH(codec.encode(text), Catch::Matchers::Contains("can't encode character U+20ac in position 1"));
    }
    SECTION("ignore") {
        CHECK(text_codec("ascii", "ignore").encode(text) == "ab");
    }
    SECTION("replace") {
        CHECK(text_codec("latin-1", "replace").encode(text) == "a?b");
    }
    SECTION("backslashreplace") {
        CHECK(text_codec("ascii", "backslashreplace").encode(text) == "a\\u20acb");
    }
    SECTION("xmlcharrefreplace") {
        CHECK(text_codec("ascii", "xmlcharrefreplace").encode(text) == "a&#8364;b");
    }
    SECTION("unknown handler") {
        text_codec codec("ascii", "bogus");

        CHECK(codec.encode("ok") == "ok");
        REQUIRE_THROWS_AS(codec.encode(text), gzio::codec_error);
    }
}
