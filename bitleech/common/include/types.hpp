#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <string>
#include <vector>


namespace bitleech {

    using Bytes = std::vector<std::uint8_t>;
    using Sha1Digest = std::array<std::uint8_t,20>;

    std::string toHex(const std::uint8_t* data, std::size_t len);

    struct InfoHash 
    {
        Sha1Digest bytes{};
        std::string toHex() const;
        auto operator<=>(const InfoHash&) const = default;
    };


    struct PeerID 
    {
        std::array<std::uint8_t,20> bytes{};
        auto operator<=>(const PeerID&) const = default;
    };


    // Immutable swarm endpoint; ip is dotted IPv4 or RFC5952 IPv6 text.
    struct PeerAddr 
    {
        std::string ip;
        std::uint16_t port{0};

        std::string toString() const;
        auto operator<=>(const PeerAddr&) const = default;
    };

} // namespace bitleech
