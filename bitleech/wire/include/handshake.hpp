#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include "../../common/include/expected.hpp"
#include "../../common/include/types.hpp"


namespace bitleech::wire {

    inline constexpr std::string_view kProtocolString = "BitTorrent protocol";
    inline constexpr std::size_t kHandshakeLength = 68;

    // <pstrlen=19><pstr><reserved[8]><info_hash[20]><peer_id[20]>
    struct Handshake 
    {
        InfoHash infoHash;
        PeerID peerId;
        std::array<std::uint8_t,8> reserved{};

        bool operator==(const Handshake&) const = default;
    };

    std::array<std::uint8_t, kHandshakeLength> encodeHandshake(const Handshake& hs);

    // HandshakeMalformed unless buf is exactly 68 bytes with the literal protocol header.
    Expected<Handshake> decodeHandshake(std::span<const std::uint8_t> buf);

} // namespace bitleech::wire
