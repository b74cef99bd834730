#include <catch2/catch_all.hpp>

#include <vector>

#include "../include/bitfield.hpp"

using namespace bitleech;
using namespace bitleech::wire;

TEST_CASE("bits are read MSB-first") {
    const Bytes raw{0xF0, 0xF0};
    auto r = Bitfield::fromBytes(raw, 12);
    REQUIRE(r.has_value());
    CHECK(r.get().indices() == std::vector<std::size_t>{0, 1, 2, 3, 8, 9, 10, 11});
    CHECK(r.get().count() == 8);
    CHECK_FALSE(r.get().has(4));
    CHECK_FALSE(r.get().has(12));
}

TEST_CASE("low nibble of the second byte maps to pieces 12 to 15") {
    const Bytes raw{0xF0, 0x0F};
    auto r = Bitfield::fromBytes(raw, 16);
    REQUIRE(r.has_value());
    CHECK(r.get().indices() == std::vector<std::size_t>{0, 1, 2, 3, 12, 13, 14, 15});
}

TEST_CASE("set padding bits are BitfieldOutOfRange") {
    SECTION("bits 12..15 with 12 pieces") {
        auto r = Bitfield::fromBytes(Bytes{0xF0, 0x0F}, 12);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error->code == ErrorCode::BitfieldOutOfRange);
    }
    SECTION("0xF0 0x3F with 10 pieces") {
        auto r = Bitfield::fromBytes(Bytes{0xF0, 0x3F}, 10);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error->code == ErrorCode::BitfieldOutOfRange);
    }
    SECTION("pieces 8 and 9 with 10 pieces are fine") {
        auto r = Bitfield::fromBytes(Bytes{0x00, 0xC0}, 10);
        REQUIRE(r.has_value());
        CHECK(r.get().indices() == std::vector<std::size_t>{8, 9});
    }
}

TEST_CASE("wrong byte count is BitfieldOutOfRange") {
    auto tooShort = Bitfield::fromBytes(Bytes{0xFF}, 12);
    REQUIRE_FALSE(tooShort.has_value());
    CHECK(tooShort.error->code == ErrorCode::BitfieldOutOfRange);

    auto tooLong = Bitfield::fromBytes(Bytes{0xFF, 0xF0, 0x00}, 12);
    REQUIRE_FALSE(tooLong.has_value());
    CHECK(tooLong.error->code == ErrorCode::BitfieldOutOfRange);
}

TEST_CASE("set, all and toBytes") {
    Bitfield bf(10);
    CHECK(bf.none());
    for (std::size_t i = 0; i < 10; ++i) bf.set(i);
    bf.set(3);
    CHECK(bf.count() == 10);
    CHECK(bf.all());
    CHECK(bf.toBytes() == Bytes{0xFF, 0xC0});
    CHECK_THROWS_AS(bf.set(10), std::out_of_range);
}
