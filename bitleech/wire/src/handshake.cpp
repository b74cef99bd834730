#include <algorithm>
#include <cstring>
#include "../include/handshake.hpp"


namespace bitleech::wire {

    std::array<std::uint8_t, kHandshakeLength> encodeHandshake(const Handshake& hs) {
        std::array<std::uint8_t, kHandshakeLength> buf{};
        std::size_t pos = 0;

        buf[pos++] = static_cast<std::uint8_t>(kProtocolString.size());
        std::memcpy(buf.data() + pos, kProtocolString.data(), kProtocolString.size());
        pos += kProtocolString.size();

        std::copy(hs.reserved.begin(), hs.reserved.end(), buf.begin() + pos);
        pos += hs.reserved.size();
        std::copy(hs.infoHash.bytes.begin(), hs.infoHash.bytes.end(), buf.begin() + pos);
        pos += hs.infoHash.bytes.size();
        std::copy(hs.peerId.bytes.begin(), hs.peerId.bytes.end(), buf.begin() + pos);

        return buf;
    }


    Expected<Handshake> decodeHandshake(std::span<const std::uint8_t> buf) {
        if (buf.size() != kHandshakeLength) {
            return Expected<Handshake>::failure(ErrorCode::HandshakeMalformed,
                "handshake is " + std::to_string(buf.size()) + " bytes, expected 68");
        }
        if (buf[0] != kProtocolString.size()) {
            return Expected<Handshake>::failure(ErrorCode::HandshakeMalformed,
                "protocol string length " + std::to_string(buf[0]));
        }
        if (std::memcmp(buf.data() + 1, kProtocolString.data(), kProtocolString.size()) != 0) {
            return Expected<Handshake>::failure(ErrorCode::HandshakeMalformed, "unknown protocol string");
        }

        Handshake hs;
        auto it = buf.begin() + 1 + kProtocolString.size();
        std::copy_n(it, hs.reserved.size(), hs.reserved.begin());
        it += hs.reserved.size();
        std::copy_n(it, hs.infoHash.bytes.size(), hs.infoHash.bytes.begin());
        it += hs.infoHash.bytes.size();
        std::copy_n(it, hs.peerId.bytes.size(), hs.peerId.bytes.begin());

        return Expected<Handshake>::success(hs);
    }

} // namespace bitleech::wire
