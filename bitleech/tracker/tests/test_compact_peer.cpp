#include <catch2/catch_all.hpp>

#include <array>
#include <string>
#include <vector>

#include "../include/compact_peer_codec.hpp"

using namespace bitleech;
using namespace bitleech::tracker;

static std::string ipv4Blob(const std::vector<std::pair<std::array<uint8_t,4>, uint16_t>>& peers) {
    std::string raw;
    for (auto const& [ip, port] : peers) {
        for (auto b : ip) raw.push_back(static_cast<char>(b));
        raw.push_back(static_cast<char>((port >> 8) & 0xFF));
        raw.push_back(static_cast<char>(port & 0xFF));
    }
    return raw;
}

TEST_CASE("IPv4 compact list decodes in order") {
    auto raw = ipv4Blob({ {{10,0,0,1}, 51413}, {{255,255,255,255}, 1} });
    auto peers = CompactPeerCodec::parseIPv4(raw);
    REQUIRE(peers.size() == 2);
    CHECK(peers[0].ip == "10.0.0.1");
    CHECK(peers[0].port == 51413);
    CHECK(peers[1].ip == "255.255.255.255");
    CHECK(peers[1].port == 1);
}

TEST_CASE("IPv4 compact list of the wrong length is rejected as a whole") {
    auto raw = ipv4Blob({ {{10,0,0,1}, 51413} });
    raw.push_back('\0');
    CHECK(CompactPeerCodec::parseIPv4(raw).empty());
    CHECK(CompactPeerCodec::parseIPv4("").empty());
}

TEST_CASE("entries with port zero are skipped") {
    auto raw = ipv4Blob({ {{10,0,0,1}, 0}, {{10,0,0,2}, 6881} });
    auto peers = CompactPeerCodec::parseIPv4(raw);
    REQUIRE(peers.size() == 1);
    CHECK(peers[0].ip == "10.0.0.2");
}

TEST_CASE("IPv6 compact list decodes and prints in brackets") {
    std::string raw(18, '\0');
    raw[0] = static_cast<char>(0x20); raw[1] = static_cast<char>(0x01);
    raw[2] = static_cast<char>(0x0d); raw[3] = static_cast<char>(0xb8);
    raw[15] = 1;
    raw[16] = static_cast<char>(0x1A); raw[17] = static_cast<char>(0xE1);

    auto peers = CompactPeerCodec::parseIPv6(raw);
    REQUIRE(peers.size() == 1);
    CHECK(peers[0].ip == "2001:db8::1");
    CHECK(peers[0].toString() == "[2001:db8::1]:6881");
    CHECK(CompactPeerCodec::parseIPv6(std::string(17, '\0')).empty());
}
