#include <catch2/catch.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <wirebuf/chunked_reader.hpp>
#include <wirebuf/exceptions.hpp>
using namespace wirebuf;

namespace {

auto feed(ChunkedReader& reader, std::vector<std::string_view> const& pieces)
{
    for (auto const piece : pieces) {
        reader.append(Chunk{piece});
    }
}

}  // namespace

TEST_CASE("ChunkedReader/boundary-transparency", "[chunked-reader]") {
    ChunkedReader reader;

    auto const pieces = GENERATE(
        std::vector<std::string_view>{"helloworld"},
        std::vector<std::string_view>{"hel", "lowo", "rld"},
        std::vector<std::string_view>{"h", "e", "l", "l", "o", "w", "o", "r", "l", "d"}
    );
    feed(reader, pieces);

    REQUIRE(reader.bytesAhead() == 10);
    reader.advance(10);
    REQUIRE(reader.tokenAsString().view() == "helloworld");
    REQUIRE(reader.tokenByteSize() == 10);
    REQUIRE(reader.bytesAhead() == 0);
}

TEST_CASE("ChunkedReader/advance", "[chunked-reader]") {
    ChunkedReader reader;
    feed(reader, {"hel", "lowo", "rld"});

    SECTION("failure leaves state unchanged") {
        reader.advance(2);
        REQUIRE_THROWS_AS(reader.advance(9), OutOfDataError);
        REQUIRE(reader.bytesAhead() == 8);
        REQUIRE(reader.peekByte() == 'l');
    }

    SECTION("lands on chunk boundaries") {
        reader.advance(3);
        REQUIRE(reader.peekByte() == 'l');
        reader.advance(4);
        REQUIRE(reader.peekByte() == 'r');
        reader.advance(3);
        REQUIRE_THROWS_AS(reader.peekByte(), OutOfDataError);
    }

    SECTION("position at the end follows new chunks") {
        reader.advance(10);
        reader.append(Chunk{std::string_view{"!"}});
        REQUIRE(reader.bytesAhead() == 1);
        REQUIRE(reader.takeByte() == '!');
    }

    SECTION("empty chunks are ignored") {
        reader.append(Chunk{});
        REQUIRE(reader.chunkCount() == 3);
    }
}

TEST_CASE("ChunkedReader/mark-and-rewind", "[chunked-reader]") {
    ChunkedReader reader;
    feed(reader, {"ab", "cd", "ef"});

    reader.advance(1);
    reader.markHere();
    reader.advance(4);
    REQUIRE(reader.tokenAsString().view() == "bcde");
    REQUIRE(reader.tokenByteSize() == 4);

    reader.rewindToMarker();
    REQUIRE(reader.tokenByteSize() == 0);
    REQUIRE(reader.bytesAhead() == 5);
    REQUIRE(reader.peekByte() == 'b');
}

TEST_CASE("ChunkedReader/advanceWhile", "[chunked-reader]") {
    ChunkedReader reader;
    auto const isAlpha = [](uint8_t c) { return c >= 'a' && c <= 'z'; };

    SECTION("across chunks") {
        feed(reader, {"ab", "cd", "e f"});
        reader.advanceWhile(isAlpha);
        REQUIRE(reader.tokenAsString().view() == "abcde");
    }

    SECTION("keeps partial progress when running out") {
        feed(reader, {"ab", "c"});
        REQUIRE_THROWS_AS(reader.advanceWhile(isAlpha), OutOfDataError);
        REQUIRE(reader.bytesAhead() == 0);
        REQUIRE(reader.tokenByteSize() == 3);
    }
}

TEST_CASE("ChunkedReader/peek-and-take", "[chunked-reader]") {
    ChunkedReader reader;
    reader.append(Chunk{Bytes{0x01, 0x02}});
    reader.append(Chunk{Bytes{0x03}});
    reader.append(Chunk{Bytes{0x04, 0x05, 0x06, 0x07, 0x08, 0x09}});

    SECTION("peek across chunks") {
        REQUIRE(reader.peekByte(2) == 0x03);
        REQUIRE(reader.peekU16(1, ByteOrder::BIG) == 0x0203);
        REQUIRE(reader.peekU32(0, ByteOrder::BIG) == 0x01020304);
        REQUIRE(reader.peekU32(0, ByteOrder::LITTLE) == 0x04030201);
        REQUIRE(reader.peekU64(1, ByteOrder::BIG) == 0x0203040506070809);
        REQUIRE(reader.bytesAhead() == 9);
        REQUIRE_THROWS_AS(reader.peekU64(2), OutOfDataError);
        REQUIRE_THROWS_AS(reader.peekByte(9), OutOfDataError);
    }

    SECTION("take across chunks") {
        REQUIRE(reader.takeByte() == 0x01);
        REQUIRE(reader.takeU16(ByteOrder::BIG) == 0x0203);
        REQUIRE(reader.takeU32(ByteOrder::LITTLE) == 0x07060504);
        REQUIRE_THROWS_AS(reader.takeU32(), OutOfDataError);
        REQUIRE(reader.bytesAhead() == 2);
    }

    SECTION("native order matches contiguous memory") {
        uint16_t const value = 0x1234;
        auto const *raw = reinterpret_cast<uint8_t const *>(&value);

        ChunkedReader split;
        split.append(Chunk{Bytes{raw[0]}});
        split.append(Chunk{Bytes{raw[1]}});
        REQUIRE(split.takeU16() == value);
    }
}

TEST_CASE("ChunkedReader/tokenAsString", "[chunked-reader]") {
    ChunkedReader reader;
    feed(reader, {"hello", "world"});

    SECTION("single chunk is not copied") {
        reader.advance(1);
        reader.markHere();
        reader.advance(3);
        auto const token = reader.tokenAsString();
        REQUIRE(token.view() == "ell");

        auto const whole = reader.extractAll();
        REQUIRE(whole.view() == "elloworld");
        REQUIRE(token.view() == "ell");
    }

    SECTION("spanning chunks") {
        reader.advance(3);
        reader.markHere();
        reader.advance(4);
        REQUIRE(reader.tokenAsString().view() == "lowo");
    }

    SECTION("empty token") {
        REQUIRE(reader.tokenAsString().empty());
    }
}

TEST_CASE("ChunkedReader/eachTokenSlice", "[chunked-reader]") {
    ChunkedReader reader;
    feed(reader, {"hel", "lowo", "rld"});
    reader.advance(1);
    reader.markHere();
    reader.advance(8);

    std::vector<std::string> slices;
    reader.eachTokenSlice([&slices](std::string_view slice) { slices.emplace_back(slice); });
    REQUIRE(slices == std::vector<std::string>{"el", "lowo", "rl"});

    std::string bytes;
    reader.eachTokenByte([&bytes](uint8_t c) { bytes += static_cast<char>(c); });
    REQUIRE(bytes == "elloworl");
}

TEST_CASE("ChunkedReader/extractLine", "[chunked-reader]") {
    ChunkedReader reader;

    SECTION("LF, CRLF and empty lines") {
        feed(reader, {"hel", "lo\nwor", "ld\r", "\n\n"});
        REQUIRE(reader.extractLine().view() == "hello");
        REQUIRE(reader.extractLine().view() == "world");
        REQUIRE(reader.extractLine().view() == "");
        REQUIRE_THROWS_AS(reader.extractLine(), OutOfDataError);
        REQUIRE(reader.chunkCount() == 0);
    }

    SECTION("partial line is retried") {
        feed(reader, {"par", "tial"});
        REQUIRE_THROWS_AS(reader.extractLine(), OutOfDataError);
        REQUIRE(reader.bytesAhead() == 7);

        feed(reader, {"\r\nrest"});
        REQUIRE(reader.extractLine().view() == "partial");
        REQUIRE(reader.bytesAhead() == 4);
    }
}

TEST_CASE("ChunkedReader/extractFrameLengthPrefixed", "[chunked-reader]") {
    ChunkedReader reader;
    reader.append(Chunk{Bytes{0x00, 0x00}});
    reader.append(Chunk{Bytes{0x00, 0x05, 'h', 'e'}});

    REQUIRE_THROWS_AS(reader.extractFrameLengthPrefixed(), OutOfDataError);
    REQUIRE(reader.bytesAhead() == 6);

    reader.append(Chunk{std::string_view{"llo"}});
    REQUIRE(reader.extractFrameLengthPrefixed().view() == "hello");
    REQUIRE(reader.bytesAhead() == 0);
}

TEST_CASE("ChunkedReader/tokenAsPositiveInteger", "[chunked-reader]") {
    ChunkedReader reader;

    SECTION("digits across chunks") {
        feed(reader, {"12", "3", "45"});
        reader.advance(5);
        REQUIRE(reader.tokenAsPositiveInteger() == 12345);
    }

    SECTION("non digit") {
        feed(reader, {"12", "x"});
        reader.advance(3);
        REQUIRE_THROWS_AS(reader.tokenAsPositiveInteger(), InvalidTokenError);
    }

    SECTION("empty token") {
        REQUIRE_THROWS_AS(reader.tokenAsPositiveInteger(), InvalidTokenError);
    }
}

TEST_CASE("ChunkedReader/token-comparison", "[chunked-reader]") {
    ChunkedReader reader;
    feed(reader, {"HeL", "LoWo", "RlD"});
    reader.advance(10);

    REQUIRE(reader.isTokenAsciiLowercaseEqualTo("helloworld"));
    REQUIRE(!reader.isTokenAsciiLowercaseEqualTo("helloworle"));
    REQUIRE(!reader.isTokenAsciiLowercaseEqualTo("hello"));
    REQUIRE(!reader.isTokenAsciiLowercaseEqualTo("helloworlds"));

    REQUIRE(reader.isTokenEqualTo("HeLLoWoRlD"));
    REQUIRE(!reader.isTokenEqualTo("helloworld"));
    REQUIRE(!reader.isTokenEqualTo("HeLLoWoRl"));
}

TEST_CASE("ChunkedReader/compact", "[chunked-reader]") {
    ChunkedReader reader;
    feed(reader, {"ab", "cd", "ef", "gh"});

    SECTION("keeps chunks reachable from the marker") {
        reader.markHere();
        reader.advance(5);
        reader.compact();
        REQUIRE(reader.chunkCount() == 4);
    }

    SECTION("drops chunks behind marker and cursor") {
        reader.advance(3);
        reader.markHere();
        reader.advance(2);
        reader.compact();
        REQUIRE(reader.chunkCount() == 3);
        REQUIRE(reader.tokenAsString().view() == "de");
        REQUIRE(reader.peekByte() == 'f');

        reader.rewindToMarker();
        REQUIRE(reader.peekByte() == 'd');
    }

    SECTION("everything consumed") {
        reader.advance(8);
        reader.markHere();
        reader.compact();
        REQUIRE(reader.chunkCount() == 0);

        reader.append(Chunk{std::string_view{"ij"}});
        REQUIRE(reader.peekByte() == 'i');
        REQUIRE(reader.bytesAhead() == 2);
    }
}

TEST_CASE("ChunkedReader/clear", "[chunked-reader]") {
    ChunkedReader reader;
    feed(reader, {"ab", "cd"});
    reader.advance(3);

    reader.clear();
    REQUIRE(reader.chunkCount() == 0);
    REQUIRE(reader.bytesAhead() == 0);
    REQUIRE(reader.tokenByteSize() == 0);
    REQUIRE_THROWS_AS(reader.advance(1), OutOfDataError);
}
