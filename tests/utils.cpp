#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>

#include <wirebuf/bytes.hpp>
#include <wirebuf/exceptions.hpp>

#include "../src/utils.hpp"
using namespace wirebuf;
using namespace wirebuf::utils;

TEST_CASE("asciiToLower", "[utils]") {
    REQUIRE(asciiToLower('A') == 'a');
    REQUIRE(asciiToLower('Z') == 'z');
    REQUIRE(asciiToLower('a') == 'a');
    REQUIRE(asciiToLower('0') == '0');
    REQUIRE(asciiToLower(0xC4) == 0xC4);
}

TEST_CASE("accumulateDigit", "[utils]") {
    uint64_t value = 0;

    SECTION("digits") {
        accumulateDigit(value, '4');
        accumulateDigit(value, '2');
        REQUIRE(value == 42);
    }

    SECTION("non digit") {
        REQUIRE_THROWS_AS(accumulateDigit(value, 'x'), InvalidTokenError);
        REQUIRE(value == 0);
    }

    SECTION("overflow") {
        value = std::numeric_limits<uint64_t>::max() / 10;
        REQUIRE_THROWS_AS(accumulateDigit(value, '9'), InvalidTokenError);
    }
}

TEST_CASE("hexDump", "[utils]") {
    REQUIRE(hexDump("") == "");
    REQUIRE(hexDump("AB\n", 4) == "00000000: 41 42 0A     AB.\n");
}

TEST_CASE("encodeInteger/decodeInteger", "[bytes]") {
    uint8_t bytes[4];

    SECTION("big endian") {
        encodeInteger<uint32_t>(0x01020304, ByteOrder::BIG, bytes);
        REQUIRE(bytes[0] == 0x01);
        REQUIRE(bytes[3] == 0x04);
        REQUIRE(decodeInteger<uint32_t>(bytes, ByteOrder::BIG) == 0x01020304);
        REQUIRE(decodeInteger<uint32_t>(bytes, ByteOrder::LITTLE) == 0x04030201);
    }

    SECTION("little endian") {
        encodeInteger<uint32_t>(0x01020304, ByteOrder::LITTLE, bytes);
        REQUIRE(bytes[0] == 0x04);
        REQUIRE(bytes[3] == 0x01);
    }

    SECTION("native") {
        encodeInteger<uint32_t>(0xCAFEBABE, ByteOrder::NATIVE, bytes);
        REQUIRE(decodeInteger<uint32_t>(bytes, ByteOrder::NATIVE) == 0xCAFEBABE);
    }
}
