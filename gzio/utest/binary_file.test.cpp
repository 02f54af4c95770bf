#include "gzio/binary_file.hpp"
#include "compression/error.hpp"
#include "compression/tostr.hpp"
#include <catch2/catch.hpp>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using namespace std;
using gzio::binary_file;
using gzio::open_options;
using gzio::seek_whence;

namespace {
    /* moderately compressible text,  several chunks long */
    string
    sample_text(size_t n)
    {
        string retval;
        retval.reserve(n);

        uint32_t x = 4242;
        while (retval.size() < n) {
            x = x * 1103515245 + 12345;
            retval += gzio::tostr("record ", (x >> 8) % 10000, ": lorem ipsum dolor sit amet\n");
        }
        retval.resize(n);

        return retval;
    }

    open_options
    with_chunk(size_t chunk_z)
    {
        open_options retval;
        retval.chunk_size = chunk_z;

        return retval;
    }

    string
    gz_compress(string const & data, open_options const & opts = open_options())
    {
        stringbuf sink(ios::out | ios::binary);

        auto f = binary_file::open(sink, "wb", opts);
        f->write(data);
        f->close();

        return sink.str();
    }

    /* refuses to seek */
    class forward_only_stringbuf : public std::stringbuf {
    public:
        explicit forward_only_stringbuf(string const & s) : std::stringbuf(s, ios::in | ios::binary) {}

    protected:
        pos_type seekoff(off_type, ios_base::seekdir, ios_base::openmode) override { return pos_type(off_type(-1)); }
        pos_type seekpos(pos_type, ios_base::openmode) override { return pos_type(off_type(-1)); }
    };

    struct TestCase {
        TestCase(size_t text_z, size_t chunk_z) : text_z_{text_z}, chunk_z_{chunk_z} {}

        size_t text_z_ = 0;
        size_t chunk_z_ = 0;
    };

    static vector<TestCase> s_testcase_v = {
        TestCase(0, 1),
        TestCase(0, 65536),
        TestCase(1, 1),
        TestCase(1000, 1),
        TestCase(1000, 7),
        TestCase(50000, 7),
        TestCase(50000, 65536),
        TestCase(200000, 65536),
    };
}

TEST_CASE("binary-roundtrip", "[binary_file]") {
    for (size_t i_tc = 0; i_tc < s_testcase_v.size(); ++i_tc) {
        TestCase const & tc = s_testcase_v[i_tc];

        INFO(gzio::tostr("i_tc=", i_tc, " text_z=", tc.text_z_, " chunk_z=", tc.chunk_z_));

        string text = sample_text(tc.text_z_);
        string z = gz_compress(text, with_chunk(tc.chunk_z_));

        stringbuf src(z, ios::in | ios::binary);
        auto f = binary_file::open(src, "rb", with_chunk(tc.chunk_z_));

        REQUIRE(f->readable());
        REQUIRE(!f->writable());
        REQUIRE(f->chunk_size() == tc.chunk_z_);
        REQUIRE(f->read() == text);
        REQUIRE(f->tell() == text.size());
        REQUIRE(f->read() == "");
    }
}

TEST_CASE("binary-header-longer-than-chunk", "[binary_file]") {
    open_options wopts;
    wopts.original_filename = "a-rather-long-original-file-name-0123456789.txt";
    wopts.mtime = 86400;

    string text = sample_text(3000);
    string z = gz_compress(text, wopts) + gz_compress("tail\n", wopts);

    for (size_t chunk_z : { 1, 7, 10, 16, 32 }) {
        INFO(gzio::tostr("chunk_z=", chunk_z));

        stringbuf src(z, ios::in | ios::binary);
        auto f = binary_file::open(src, "rb", with_chunk(chunk_z));

        REQUIRE(f->read() == text + "tail\n");
        REQUIRE(f->mtime() == 86400u);
        REQUIRE(f->read() == "");
    }
}

TEST_CASE("binary-read-sizes", "[binary_file]") {
    string text = sample_text(5000);
    string z = gz_compress(text);

    stringbuf src(z, ios::in | ios::binary);
    auto f = binary_file::open(src, "rb", with_chunk(7));

    /* read(0) consumes nothing */
    REQUIRE(f->read(0) == "");
    REQUIRE(f->tell() == 0);

    REQUIRE(f->read(10) == text.substr(0, 10));
    REQUIRE(f->read1(5).size() <= 5);

    size_t pos = f->tell();
    REQUIRE(pos >= 10);

    /* read(-1) after partial reads returns exactly the remainder */
    REQUIRE(f->read(-1) == text.substr(pos));
    REQUIRE(f->read(10) == "");
}

TEST_CASE("binary-readinto", "[binary_file]") {
    string text = sample_text(300);
    string z = gz_compress(text);

    stringbuf src(z, ios::in | ios::binary);
    auto f = binary_file::open(src, "rb", with_chunk(16));

    vector<uint8_t> dest(100);
    REQUIRE(f->readinto(gzio::span<uint8_t>(dest.data(), dest.data() + dest.size())) == 100);
    REQUIRE(string(dest.begin(), dest.end()) == text.substr(0, 100));

    vector<uint8_t> big(1000);
    REQUIRE(f->readinto(gzio::span<uint8_t>(big.data(), big.data() + big.size())) == 200);
}

TEST_CASE("binary-peek", "[binary_file]") {
    string z = gz_compress("hello world");

    stringbuf src(z, ios::in | ios::binary);
    auto f = binary_file::open(src, "rb", with_chunk(7));

    SECTION("peek(0) never reads the source") {
        REQUIRE(f->peek(0) == "");
        REQUIRE(src.pubseekoff(0, ios::cur, ios::in) == streampos(0));
        REQUIRE(f->tell() == 0);
    }
    SECTION("peek(n) does not advance") {
        REQUIRE(f->peek(3) == "hel");
        REQUIRE(f->tell() == 0);
        REQUIRE(f->read(5) == "hello");
        REQUIRE(f->peek(100) == " world");
        REQUIRE(f->read() == " world");
        REQUIRE(f->peek(5) == "");
        REQUIRE(f->peek(-1) == "");
    }
    SECTION("peek(-1) returns at least one byte before eof") {
        string p = f->peek(-1);

        REQUIRE(!p.empty());
        REQUIRE(string("hello world").substr(0, p.size()) == p);
        REQUIRE(f->peek(0) == p);
    }
}

TEST_CASE("binary-readline", "[binary_file]") {
    string z = gz_compress("abcdef\nxy\n\nlast");

    stringbuf src(z, ios::in | ios::binary);
    auto f = binary_file::open(src, "rb", with_chunk(3));

    REQUIRE(f->readline(3) == "abc");
    REQUIRE(f->readline() == "def\n");
    REQUIRE(f->readline(0) == "");
    REQUIRE(f->readline() == "xy\n");
    REQUIRE(f->readline() == "\n");
    REQUIRE(f->readline() == "last");
    REQUIRE(f->readline() == "");
}

TEST_CASE("binary-readlines", "[binary_file]") {
    string text = "one\ntwo\nthree\nfour\n";
    string z = gz_compress(text);

    SECTION("all") {
        stringbuf src(z, ios::in | ios::binary);
        auto f = binary_file::open(src, "rb", with_chunk(5));

        REQUIRE(f->readlines() == vector<string>{ "one\n", "two\n", "three\n", "four\n" });
    }
    SECTION("hint") {
        stringbuf src(z, ios::in | ios::binary);
        auto f = binary_file::open(src, "rb", with_chunk(5));

        REQUIRE(f->readlines(5) == vector<string>{ "one\n", "two\n" });
        REQUIRE(f->readline() == "three\n");
    }
    SECTION("lines") {
        stringbuf src(z, ios::in | ios::binary);
        auto f = binary_file::open(src, "rb", with_chunk(5));

        string joined;
        size_t n = 0;
        for (string const & line : f->lines()) {
            joined += line;
            ++n;
        }

        REQUIRE(n == 4);
        REQUIRE(joined == text);
    }
}

TEST_CASE("binary-write-byte-sequences", "[binary_file]") {
    stringbuf sink(ios::out | ios::binary);

    {
        auto f = binary_file::open(sink, "wb");

        REQUIRE(f->write("abc") == 3);
        REQUIRE(f->write(string("de")) == 2);
        REQUIRE(f->write(vector<uint8_t>{ 'f', 'g' }) == 2);
        REQUIRE(f->write(string_view("h")) == 1);
        f->writelines({ "i\n", "j\n" });
        REQUIRE(f->tell() == 12);
    }

    stringbuf src(sink.str(), ios::in | ios::binary);
    auto f = binary_file::open(src, "rb");

    REQUIRE(f->read() == "abcdefghi\nj\n");
}

TEST_CASE("binary-concatenated-members", "[binary_file]") {
    string z = gz_compress("A") + gz_compress("B");

    for (size_t chunk_z : { 1, 7, 65536 }) {
        INFO(gzio::tostr("chunk_z=", chunk_z));

        stringbuf src(z, ios::in | ios::binary);
        auto f = binary_file::open(src, "rb", with_chunk(chunk_z));

        REQUIRE(f->read() == "AB");
    }
}

TEST_CASE("binary-trailing-zeros", "[binary_file]") {
    string z = gz_compress("payload") + string(16, '\0');

    stringbuf src(z, ios::in | ios::binary);
    auto f = binary_file::open(src, "rb", with_chunk(7));

    REQUIRE(f->read() == "payload");
}

TEST_CASE("binary-corrupt", "[binary_file]") {
    string z = gz_compress(sample_text(2000));
    string bad = z;
    bad[bad.size() - 8] ^= 0x01;

    stringbuf src(bad, ios::in | ios::binary);
    auto f = binary_file::open(src, "rb");

    REQUIRE_THROWS_AS(f->read(), gzio::format_error);
}

TEST_CASE("binary-empty-source", "[binary_file]") {
    stringbuf src(string(), ios::in | ios::binary);
    auto f = binary_file::open(src, "rb");

    REQUIRE(f->read() == "");
    REQUIRE(f->peek(10) == "");
    REQUIRE(!f->mtime());
}

TEST_CASE("binary-seek", "[binary_file]") {
    string first = "first member;";
    string second = "second member";
    string z = gz_compress(first) + gz_compress(second);
    string all = first + second;

    stringbuf src(z, ios::in | ios::binary);
    auto f = binary_file::open(src, "rb", with_chunk(7));

    REQUIRE(f->seekable());

    SECTION("backward across members") {
        REQUIRE(f->read() == all);
        REQUIRE(f->n_checkpoint() >= 1);

        REQUIRE(f->seek(15) == 15);
        REQUIRE(f->read() == all.substr(15));

        REQUIRE(f->seek(3) == 3);
        REQUIRE(f->read(5) == all.substr(3, 5));
    }
    SECTION("forward") {
        REQUIRE(f->read(2) == "fi");
        REQUIRE(f->seek(20) == 20);
        REQUIRE(f->tell() == 20);
        REQUIRE(f->read() == all.substr(20));
    }
    SECTION("past end") {
        REQUIRE(f->seek(1000) == all.size());
        REQUIRE(f->read() == "");
    }
    SECTION("relative") {
        REQUIRE(f->read(4) == "firs");
        REQUIRE(f->seek(0, seek_whence::cur) == 4);
        REQUIRE(f->seek(0, seek_whence::end) == all.size());
        REQUIRE_THROWS_AS(f->seek(1, seek_whence::cur), gzio::unsupported_operation);
        REQUIRE_THROWS_AS(f->seek(-1, seek_whence::end), gzio::unsupported_operation);
        REQUIRE_THROWS_AS(f->seek(-1), gzio::invalid_argument);
    }
    SECTION("rewind") {
        REQUIRE(f->read(20) == all.substr(0, 20));
        f->rewind();
        REQUIRE(f->tell() == 0);
        REQUIRE(f->read() == all);
    }
}

TEST_CASE("binary-seek-not-seekable", "[binary_file]") {
    forward_only_stringbuf src(gz_compress(sample_text(1000)));
    auto f = binary_file::open(src, "rb", with_chunk(16));

    REQUIRE(!f->seekable());

    /* forward seeks still work:  they decode and discard */
    REQUIRE(f->seek(100) == 100);
    REQUIRE(f->read(10) == sample_text(1000).substr(100, 10));

    REQUIRE_THROWS_AS(f->rewind(), gzio::resource_error);
}

TEST_CASE("binary-write-seek", "[binary_file]") {
    stringbuf sink(ios::out | ios::binary);

    {
        auto f = binary_file::open(sink, "wb");

        REQUIRE(f->seekable());

        f->write("ab");
        REQUIRE(f->seek(5) == 5);
        f->write("c");
        REQUIRE(f->seek(0, seek_whence::cur) == 6);

        REQUIRE_THROWS_AS(f->seek(2), gzio::resource_error);
        REQUIRE_THROWS_AS(f->rewind(), gzio::unsupported_operation);
    }

    stringbuf src(sink.str(), ios::in | ios::binary);
    auto f = binary_file::open(src, "rb");

    REQUIRE(f->read() == string("ab\0\0\0c", 6));
}

TEST_CASE("binary-mtime", "[binary_file]") {
    open_options opts;
    opts.mtime = 1700000000;

    stringbuf sink(ios::out | ios::binary);
    {
        auto f = binary_file::open(sink, "wb", opts);

        REQUIRE(f->mtime() == 1700000000u);
        f->write("x");
    }

    stringbuf src(sink.str(), ios::in | ios::binary);
    auto f = binary_file::open(src, "rb");

    /* header not parsed until first read */
    REQUIRE(!f->mtime());
    REQUIRE(f->read() == "x");
    REQUIRE(f->mtime() == 1700000000u);
}

TEST_CASE("binary-flush", "[binary_file]") {
    stringbuf sink(ios::out | ios::binary);
    auto f = binary_file::open(sink, "wb", with_chunk(1024));

    f->write("partial content");
    f->flush();

    /* flushed prefix decodes without the trailer */
    stringbuf src(sink.str(), ios::in | ios::binary);
    auto g = binary_file::open(src, "rb");

    REQUIRE(g->read(15) == "partial content");

    f->close();
}

TEST_CASE("binary-mode-mismatch", "[binary_file]") {
    stringbuf sink(ios::out | ios::binary);
    auto w = binary_file::open(sink, "wb");

    REQUIRE_THROWS_AS(w->read(), gzio::unsupported_operation);
    REQUIRE_THROWS_AS(w->peek(), gzio::unsupported_operation);
    REQUIRE_THROWS_WITH(w->readline(), Catch::Matchers::Contains("File not open for reading"));

    stringbuf src(gz_compress("x"), ios::in | ios::binary);
    auto r = binary_file::open(src, "rb");

    REQUIRE_THROWS_AS(r->write("y"), gzio::unsupported_operation);
    REQUIRE_THROWS_AS(r->fileno(), gzio::unsupported_operation);
    REQUIRE_THROWS_AS(r->truncate(), gzio::unsupported_operation);
    REQUIRE_THROWS_AS(r->detach(), gzio::unsupported_operation);
    REQUIRE(!r->isatty());

    REQUIRE_THROWS_AS(binary_file::open(src, "rt"), gzio::invalid_argument);
}
