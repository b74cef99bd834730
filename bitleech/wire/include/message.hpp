#pragma once
#include <cstdint>
#include <span>
#include <variant>
#include "../../common/include/expected.hpp"
#include "../../common/include/types.hpp"


namespace bitleech::wire {

    enum class MessageId : std::uint8_t {
        choke = 0,
        unchoke = 1,
        interested = 2,
        not_interested = 3,
        have = 4,
        bitfield = 5,
        request = 6,
        piece = 7,
        cancel = 8
    };

    struct KeepAlive { bool operator==(const KeepAlive&) const = default; };
    struct Choke { bool operator==(const Choke&) const = default; };
    struct Unchoke { bool operator==(const Unchoke&) const = default; };
    struct Interested { bool operator==(const Interested&) const = default; };
    struct NotInterested { bool operator==(const NotInterested&) const = default; };

    struct Have 
    {
        std::uint32_t index{0};
        bool operator==(const Have&) const = default;
    };

    struct BitfieldMsg 
    {
        Bytes bits;
        bool operator==(const BitfieldMsg&) const = default;
    };

    struct Request 
    {
        std::uint32_t index{0};
        std::uint32_t begin{0};
        std::uint32_t length{0};
        bool operator==(const Request&) const = default;
    };

    struct PieceMsg 
    {
        std::uint32_t index{0};
        std::uint32_t begin{0};
        Bytes block;
        bool operator==(const PieceMsg&) const = default;
    };

    struct Cancel 
    {
        std::uint32_t index{0};
        std::uint32_t begin{0};
        std::uint32_t length{0};
        bool operator==(const Cancel&) const = default;
    };

    using Message = std::variant<KeepAlive, Choke, Unchoke, Interested, NotInterested,
                                 Have, BitfieldMsg, Request, PieceMsg, Cancel>;

    inline constexpr std::size_t kLengthPrefix = 4;

    const char* messageName(const Message& m) noexcept;

    // Length-prefixed frame: 4-byte big-endian length, then id and payload unless keep-alive.
    Bytes encode(const Message& m);

    std::uint32_t readLengthPrefix(std::span<const std::uint8_t, kLengthPrefix> prefix) noexcept;

    // Largest frame body a session accepts: one block plus Piece header, or a full bitfield.
    std::uint32_t maxFrameLength(std::uint32_t blockSize, std::size_t pieceCount) noexcept;

    // Decodes exactly one whole frame (prefix included). The announced length must
    // match the bytes available.
    Expected<Message> decode(std::span<const std::uint8_t> frame);

    // Decodes a frame body (id + payload) once the prefix has been read. Empty body is a keep-alive.
    Expected<Message> decodePayload(std::span<const std::uint8_t> body);

} // namespace bitleech::wire
