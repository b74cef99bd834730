#pragma once
#include <compare>
#include <cstdint>
#include <vector>
#include "../../common/include/types.hpp"
#include "../../metainfo/metainfo.hpp"


namespace bitleech::piece {

    enum class BlockState { NotRequested, Requested, Downloaded, Verified };

    // Failed is a piece whose last attempt missed its hash; it is reservable again.
    enum class PieceStatus { Incomplete, AwaitingVerify, Complete, Failed };

    const char* toString(BlockState s) noexcept;
    const char* toString(PieceStatus s) noexcept;

    using OwnerId = std::uint32_t;
    inline constexpr OwnerId kNoOwner = 0;

    struct BlockInfo 
    {
        std::uint32_t piece{0};
        std::uint32_t offset{0};
        std::uint32_t length{0};
        auto operator<=>(const BlockInfo&) const = default;
    };

    // Geometry plus target hashes, detached from the rest of the metainfo.
    struct PieceLayout 
    {
        std::uint32_t pieceLength{0};
        std::uint64_t totalLength{0};
        std::vector<Sha1Digest> hashes;

        static PieceLayout fromMetainfo(const metainfo::Metainfo& mi);

        std::size_t pieceCount() const noexcept { return hashes.size(); }
        std::uint32_t pieceSize(std::size_t index) const;
        std::uint64_t pieceOffset(std::size_t index) const noexcept { return std::uint64_t(index) * pieceLength; }
    };

} // namespace bitleech::piece
