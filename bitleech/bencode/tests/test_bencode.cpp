#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

#include "../bencode.hpp"
#include "../../common/include/error.hpp"

using namespace bitleech;
using namespace bitleech::bencode;


static ErrorCode codeOf(std::string_view input) {
    try {
        (void)BencodeParser::parse(input);
    } catch (const ParseError& e) {
        return e.code();
    }
    FAIL("expected a ParseError for " << input);
    return ErrorCode::InvalidConfig;
}


TEST_CASE("decodes the four value kinds") {
    CHECK(BencodeParser::parse("i42e").asInt() == 42);
    CHECK(BencodeParser::parse("i-17e").asInt() == -17);
    CHECK(BencodeParser::parse("i0e").asInt() == 0);
    CHECK(BencodeParser::parse("4:spam").asString() == "spam");
    CHECK(BencodeParser::parse("0:").asString().empty());

    auto l = BencodeParser::parse("l4:spami7ee");
    REQUIRE(l.isList());
    REQUIRE(l.asList().size() == 2);
    CHECK(l.asList()[1].asInt() == 7);

    auto d = BencodeParser::parse("d3:bar4:spam3:fooi42ee");
    REQUIRE(d.isDict());
    CHECK(d.find("bar")->asString() == "spam");
    CHECK(d.find("foo")->asInt() == 42);
    CHECK(d.find("missing") == nullptr);
}

TEST_CASE("64-bit integer bounds are accepted, overflow is not") {
    CHECK(BencodeParser::parse("i9223372036854775807e").asInt() == INT64_MAX);
    CHECK(BencodeParser::parse("i-9223372036854775808e").asInt() == INT64_MIN);
    CHECK(codeOf("i9223372036854775808e") == ErrorCode::MalformedBencode);
}

TEST_CASE("malformed inputs fail with MalformedBencode") {
    const std::vector<std::string> bad = {
        "",                 // empty
        "i42",              // truncated int
        "i-0e",             // negative zero
        "i03e",             // leading zero
        "ie",               // no digits
        "5:abc",            // truncated string
        "a:abc",            // non-digit length prefix
        "03:abc",           // leading zero in length
        "l4:spam",          // unterminated list
        "d3:fooi1e",        // unterminated dict
        "d3:fooi1e3:bari2ee",   // unsorted keys
        "d3:fooi1e3:fooi2ee",   // duplicate keys
        "di1ei2ee",         // non-string key
        "i1ei2e",           // trailing garbage
        "x",                // bad prefix
    };
    for (auto const& s : bad) {
        INFO("input: " << s);
        CHECK(codeOf(s) == ErrorCode::MalformedBencode);
    }
}

TEST_CASE("excessive nesting is rejected instead of exhausting the stack") {
    std::string deep(BencodeParser::kMaxDepth + 1, 'l');
    deep += std::string(BencodeParser::kMaxDepth + 1, 'e');
    CHECK(codeOf(deep) == ErrorCode::MalformedBencode);
}

TEST_CASE("decode(encode(v)) == v for constructed values") {
    BencodeValue::Dict inner{
        {"length", BencodeValue(int64_t(1024))},
        {"path",   BencodeValue(BencodeValue::List{"dir", "file.bin"})},
    };
    BencodeValue v(BencodeValue::Dict{
        {"announce", "http://t/announce"},
        {"files",    BencodeValue(BencodeValue::List{BencodeValue(inner)})},
        {"neg",      BencodeValue(int64_t(-5))},
        {std::string("\xff\x00k", 3), std::string("\x00\x01\x02", 3)},
    });

    auto bytes = BencodeParser::encode(v);
    CHECK(BencodeParser::parse(bytes) == v);
}

TEST_CASE("encode(decode(b)) == b for canonical byte strings") {
    const std::vector<std::string> canonical = {
        "i0e",
        "le",
        "de",
        "d1:ai1e1:bl1:x1:yee",
        "d4:infod6:lengthi5e4:name1:xee",
        std::string("d1:\x80i1e1:\xffi2ee"),
    };
    for (auto const& b : canonical) {
        INFO("bytes: " << b);
        CHECK(BencodeParser::encode(BencodeParser::parse(b)) == b);
    }
}

TEST_CASE("high-byte keys are ordered as unsigned bytes") {
    // 0x7f sorts before 0x80 when compared unsigned
    auto ok = std::string("d1:\x7fi1e1:\x80i2ee");
    CHECK_NOTHROW(BencodeParser::parse(ok));
    auto bad = std::string("d1:\x80i1e1:\x7fi2ee");
    CHECK(codeOf(bad) == ErrorCode::MalformedBencode);
}

TEST_CASE("parseWithSlice returns exact source bytes of a top-level value") {
    const std::string src = "d8:announce3:url4:infod6:lengthi5e4:name1:xe5:otheri1ee";
    auto pr = BencodeParser::parseWithInfoSlice(src);
    REQUIRE(pr.slice.has_value());
    CHECK(*pr.slice == "d6:lengthi5e4:name1:xe");

    auto other = BencodeParser::parseWithSlice(src, "other");
    REQUIRE(other.slice.has_value());
    CHECK(*other.slice == "i1e");
}

TEST_CASE("slice capture ignores nested keys of the same name") {
    const std::string src = "d1:ad4:infoi1eee";
    auto pr = BencodeParser::parseWithInfoSlice(src);
    CHECK_FALSE(pr.slice.has_value());
}

TEST_CASE("type accessors throw on mismatch") {
    auto v = BencodeParser::parse("i1e");
    CHECK_THROWS_AS(v.asString(), std::runtime_error);
    CHECK_THROWS_AS(v.asDict(), std::runtime_error);
    CHECK_THROWS_AS(BencodeParser::encode(BencodeValue{}), std::invalid_argument);
}
