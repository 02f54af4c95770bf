#include "compression/byte_arena.hpp"
#include "compression/error.hpp"
#include "compression/tostr.hpp"
#include <catch2/catch.hpp>
#include <cstring>
#include <string>

using namespace std;
using gzio::byte_arena;

namespace {
    void
    append_text(byte_arena & arena, string const & s)
    {
        arena.append(gzio::span<uint8_t const>(reinterpret_cast<uint8_t const *>(s.data()),
                                               reinterpret_cast<uint8_t const *>(s.data() + s.size())));
    }

    string
    contents_str(byte_arena const & arena)
    {
        auto c = arena.contents();
        return string(reinterpret_cast<char const *>(c.lo()), c.size());
    }
}

TEST_CASE("byte_arena-empty", "[byte_arena]") {
    byte_arena arena;

    REQUIRE(arena.empty());
    REQUIRE(arena.size() == 0);
    REQUIRE(arena.capacity() == 0);
    REQUIRE(arena.contents().empty());
    REQUIRE(arena.find('x') == byte_arena::npos);
}

TEST_CASE("byte_arena-produce-consume", "[byte_arena]") {
    byte_arena arena(64);

    auto dest = arena.reserve(5);
    REQUIRE(dest.size() >= 5);
    ::memcpy(dest.lo(), "hello", 5);
    arena.produce(5);

    REQUIRE(contents_str(arena) == "hello");

    arena.consume(2);
    REQUIRE(contents_str(arena) == "llo");
    REQUIRE(arena.lo_pos() == 2);

    /* draining resets offsets without moving data */
    arena.consume(3);
    REQUIRE(arena.empty());
    REQUIRE(arena.lo_pos() == 0);
    REQUIRE(arena.hi_pos() == 0);
    REQUIRE(arena.n_compaction() == 0);
}

TEST_CASE("byte_arena-overconsume", "[byte_arena]") {
    byte_arena arena(16);

    append_text(arena, "abc");

    REQUIRE_THROWS_AS(arena.consume(4), gzio::invalid_argument);
    REQUIRE_THROWS_AS(arena.produce(1000), gzio::invalid_argument);
}

TEST_CASE("byte_arena-compaction-threshold", "[byte_arena]") {
    /* capacity 100,  compaction once offset passes 50 */
    byte_arena arena(100, 0.5);

    append_text(arena, string(100, 'a'));

    arena.consume(40);
    REQUIRE(arena.n_compaction() == 0);
    REQUIRE(arena.lo_pos() == 40);

    arena.consume(10);
    /* offset == 50: not yet past threshold */
    REQUIRE(arena.n_compaction() == 0);
    REQUIRE(arena.lo_pos() == 50);

    arena.consume(1);
    REQUIRE(arena.n_compaction() == 1);
    REQUIRE(arena.lo_pos() == 0);
    REQUIRE(arena.size() == 49);
    REQUIRE(contents_str(arena) == string(49, 'a'));
}

TEST_CASE("byte_arena-reserve-compacts", "[byte_arena]") {
    /* threshold 1.0,  so consume() leaves the prefix in place */
    byte_arena arena(100, 1.0);

    append_text(arena, string(80, 'a') + "0123456789");
    arena.consume(80);

    REQUIRE(arena.lo_pos() == 80);
    REQUIRE(arena.n_compaction() == 0);

    /* 10 bytes follow hi,  90 once the consumed prefix is reclaimed */
    auto dest = arena.reserve(50);

    REQUIRE(dest.size() >= 50);
    REQUIRE(arena.capacity() == 100);
    REQUIRE(arena.n_compaction() == 1);
    REQUIRE(arena.lo_pos() == 0);
    REQUIRE(contents_str(arena) == "0123456789");

    /* more than capacity - size:  must reallocate */
    arena.reserve(95);

    REQUIRE(arena.capacity() >= 105);
    REQUIRE(arena.n_compaction() == 1);
    REQUIRE(contents_str(arena) == "0123456789");
}

TEST_CASE("byte_arena-bad-fraction", "[byte_arena]") {
    REQUIRE_THROWS_AS(byte_arena(16, 0.0), gzio::invalid_argument);
    REQUIRE_THROWS_AS(byte_arena(16, 1.5), gzio::invalid_argument);
}

TEST_CASE("byte_arena-grow", "[byte_arena]") {
    byte_arena arena(4);

    string expected;
    for (int i = 0; i < 100; ++i) {
        string piece = gzio::tostr("[", i, "]");

        append_text(arena, piece);
        expected += piece;

        if (i % 7 == 0) {
            arena.consume(2);
            expected.erase(0, 2);
        }

        INFO(gzio::tostr("i=", i));
        REQUIRE(contents_str(arena) == expected);
        REQUIRE(arena.lo_pos() + arena.size() <= arena.capacity());
    }
}

TEST_CASE("byte_arena-find", "[byte_arena]") {
    byte_arena arena(32);

    append_text(arena, "xxone\ntwo\nthree");
    arena.consume(2);

    REQUIRE(arena.find('\n') == 3);
    REQUIRE(arena.find('\n', 4) == 7);
    REQUIRE(arena.find('\n', 8) == byte_arena::npos);
    REQUIRE(arena.find('z') == byte_arena::npos);
    REQUIRE(arena.find('o', 100) == byte_arena::npos);
}

TEST_CASE("byte_arena-move", "[byte_arena]") {
    byte_arena a(16);
    append_text(a, "payload");

    byte_arena b(std::move(a));

    REQUIRE(contents_str(b) == "payload");
    REQUIRE(a.empty());

    byte_arena c;
    c = std::move(b);
    REQUIRE(contents_str(c) == "payload");
}
