#include <catch2/catch_all.hpp>

#include <string>

#include "../include/error.hpp"
#include "../include/expected.hpp"
#include "../include/types.hpp"

using namespace bitleech;


TEST_CASE("Expected carries either a value or a coded error") {
    auto ok = Expected<int>::success(7);
    REQUIRE(ok.has_value());
    CHECK(ok.get() == 7);
    CHECK_FALSE(ok.error.has_value());

    auto bad = Expected<int>::failure(ErrorCode::TrackerFailure, "go away");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error->code == ErrorCode::TrackerFailure);
    CHECK(bad.error->describe() == "TrackerFailure: go away");

    auto v = Expected<void>::failure(ErrorCode::PeerTimeout, "idle");
    CHECK_FALSE(v.has_value());
    CHECK(Expected<void>::success().has_value());
}

TEST_CASE("parse and protocol errors ban a peer, transport and timeouts do not") {
    CHECK(isFatalForPeer(ErrorCode::HandshakeMalformed));
    CHECK(isFatalForPeer(ErrorCode::ProtocolViolation));
    CHECK(isFatalForPeer(ErrorCode::BitfieldOutOfRange));
    CHECK_FALSE(isFatalForPeer(ErrorCode::TransportError));
    CHECK_FALSE(isFatalForPeer(ErrorCode::PeerStalled));
    CHECK_FALSE(isFatalForPeer(ErrorCode::NoMutualWork));
}

TEST_CASE("PeerAddr renders v4 and bracketed v6 endpoints") {
    CHECK(PeerAddr{"192.168.1.1", 6881}.toString() == "192.168.1.1:6881");
    CHECK(PeerAddr{"fe80::1", 51413}.toString() == "[fe80::1]:51413");
}

TEST_CASE("InfoHash hex is lowercase and 40 chars") {
    InfoHash ih;
    for (std::size_t i = 0; i < 20; ++i) ih.bytes[i] = static_cast<std::uint8_t>(0xA0 + i);
    auto hex = ih.toHex();
    CHECK(hex.size() == 40);
    CHECK(hex.substr(0, 6) == "a0a1a2");
}
