#include "textio/text_decoder.hpp"
#include "compression/tostr.hpp"
#include <catch2/catch.hpp>
#include <string>
#include <vector>

using namespace std;
using gzio::decode_state;
using gzio::newline_mode;

namespace {
    /* feed text through decode_chunk in pieces split at the given offsets */
    string
    decode_split(gzio::text_codec const & codec,
                 newline_mode mode,
                 string const & bytes,
                 vector<size_t> const & cuts)
    {
        decode_state st;
        string retval;
        size_t pos = 0;

        for (size_t cut : cuts) {
            gzio::decode_result r = gzio::decode_chunk(codec, mode, st, string_view(bytes).substr(pos, cut - pos), false);
            retval += r.text;
            st = r.state;
            pos = cut;
        }

        gzio::decode_result r = gzio::decode_chunk(codec, mode, st, string_view(bytes).substr(pos), false);
        retval += r.text;
        st = r.state;

        /* end of stream */
        r = gzio::decode_chunk(codec, mode, st, string_view(), true);
        retval += r.text;
        REQUIRE(r.state.empty());

        return retval;
    }
}

TEST_CASE("decode-split-multibyte", "[text_decoder]") {
    gzio::text_codec codec("utf-8", "strict");

    /* 3-byte and 4-byte characters split at every offset */
    string text = "x\xe2\x82\xacy\xf0\x9f\x98\x80z";

    for (size_t cut = 0; cut <= text.size(); ++cut) {
        INFO(gzio::tostr("cut=", cut));

        REQUIRE(decode_split(codec, newline_mode::universal, text, { cut }) == text);
    }

    /* and split at every pair of offsets */
    for (size_t c1 = 0; c1 <= text.size(); ++c1) {
        for (size_t c2 = c1; c2 <= text.size(); ++c2) {
            INFO(gzio::tostr("c1=", c1, " c2=", c2));

            REQUIRE(decode_split(codec, newline_mode::lf, text, { c1, c2 }) == text);
        }
    }
}

TEST_CASE("decode-carry-state", "[text_decoder]") {
    gzio::text_codec codec("utf-8", "strict");

    gzio::decode_result r1 = gzio::decode_chunk(codec, newline_mode::universal, decode_state(), "ab\xe2\x82", false);

    CHECK(r1.text == "ab");
    CHECK(r1.state.pending_bytes == "\xe2\x82");
    CHECK(!r1.state.pending_cr);

    /* same state,  same bytes:  same result */
    gzio::decode_result r2a = gzio::decode_chunk(codec, newline_mode::universal, r1.state, "\xac\r", false);
    gzio::decode_result r2b = gzio::decode_chunk(codec, newline_mode::universal, r1.state, "\xac\r", false);

    CHECK(r2a.text == "\xe2\x82\xac");
    CHECK(r2a.state.pending_cr);
    CHECK(r2a.text == r2b.text);
    CHECK(r2a.state == r2b.state);
}

TEST_CASE("decode-crlf-split", "[text_decoder]") {
    gzio::text_codec codec("utf-8", "strict");
    string bytes = "one\r\ntwo\rthree\nfour\r";

    /* split right between \r and \n */
    vector<size_t> cuts = { 4 };

    CHECK(decode_split(codec, newline_mode::universal, bytes, cuts) == "one\ntwo\nthree\nfour\n");
    CHECK(decode_split(codec, newline_mode::untranslated, bytes, cuts) == bytes);
    CHECK(decode_split(codec, newline_mode::crlf, bytes, cuts) == bytes);
    CHECK(decode_split(codec, newline_mode::lf, bytes, cuts) == bytes);

    /* universal:  every split position gives the same answer */
    for (size_t cut = 0; cut <= bytes.size(); ++cut) {
        INFO(gzio::tostr("cut=", cut));
        REQUIRE(decode_split(codec, newline_mode::universal, bytes, { cut }) == "one\ntwo\nthree\nfour\n");
    }
}

TEST_CASE("decode-holds-trailing-cr", "[text_decoder]") {
    gzio::text_codec codec("utf-8", "strict");

    gzio::decode_result r = gzio::decode_chunk(codec, newline_mode::untranslated, decode_state(), "line\r", false);

    CHECK(r.text == "line");
    CHECK(r.state.pending_cr);

    gzio::decode_result r2 = gzio::decode_chunk(codec, newline_mode::untranslated, r.state, "\nnext", false);

    CHECK(r2.text == "\r\nnext");
    CHECK(!r2.state.pending_cr);

    /* cr mode never holds back */
    gzio::decode_result r3 = gzio::decode_chunk(codec, newline_mode::cr, decode_state(), "line\r", false);
    CHECK(r3.text == "line\r");
    CHECK(!r3.state.pending_cr);
}

TEST_CASE("find-line-end", "[text_decoder]") {
    constexpr size_t npos = string_view::npos;

    CHECK(gzio::find_line_end(newline_mode::universal, "ab\ncd", false) == 3);
    CHECK(gzio::find_line_end(newline_mode::universal, "abcd", false) == npos);
    CHECK(gzio::find_line_end(newline_mode::lf, "a\rb\n", false) == 4);
    CHECK(gzio::find_line_end(newline_mode::cr, "a\nb\rc", false) == 4);
    CHECK(gzio::find_line_end(newline_mode::crlf, "a\rb\nc\r\nd", false) == 7);
    CHECK(gzio::find_line_end(newline_mode::crlf, "a\r", true) == npos);

    CHECK(gzio::find_line_end(newline_mode::untranslated, "a\r\nb", false) == 3);
    CHECK(gzio::find_line_end(newline_mode::untranslated, "a\rb", false) == 2);
    CHECK(gzio::find_line_end(newline_mode::untranslated, "a\nb", false) == 2);
    CHECK(gzio::find_line_end(newline_mode::untranslated, "a\r", false) == npos);
    CHECK(gzio::find_line_end(newline_mode::untranslated, "a\r", true) == 2);
}

TEST_CASE("translate-for-write", "[text_decoder]") {
    CHECK(gzio::translate_for_write(newline_mode::universal, "a\nb") == "a\nb");
    CHECK(gzio::translate_for_write(newline_mode::untranslated, "a\nb\r") == "a\nb\r");
    CHECK(gzio::translate_for_write(newline_mode::lf, "a\nb") == "a\nb");
    CHECK(gzio::translate_for_write(newline_mode::cr, "a\nb\n") == "a\rb\r");
    CHECK(gzio::translate_for_write(newline_mode::crlf, "a\nb\n") == "a\r\nb\r\n");
}
