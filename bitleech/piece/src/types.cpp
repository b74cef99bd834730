#include <stdexcept>
#include "../include/types.hpp"


namespace bitleech::piece {

    const char* toString(BlockState s) noexcept {
        switch (s) {
            case BlockState::NotRequested: return "NotRequested";
            case BlockState::Requested:    return "Requested";
            case BlockState::Downloaded:   return "Downloaded";
            case BlockState::Verified:     return "Verified";
        }
        return "?";
    }

    const char* toString(PieceStatus s) noexcept {
        switch (s) {
            case PieceStatus::Incomplete:     return "Incomplete";
            case PieceStatus::AwaitingVerify: return "AwaitingVerify";
            case PieceStatus::Complete:       return "Complete";
            case PieceStatus::Failed:         return "Failed";
        }
        return "?";
    }


    PieceLayout PieceLayout::fromMetainfo(const metainfo::Metainfo& mi) {
        PieceLayout l;
        l.pieceLength = mi.pieceLength();
        l.totalLength = mi.totalLength();
        l.hashes = mi.pieces();
        return l;
    }


    std::uint32_t PieceLayout::pieceSize(std::size_t index) const {
        if (index >= hashes.size()) throw std::out_of_range("piece index " + std::to_string(index));
        const std::uint64_t start = pieceOffset(index);
        const std::uint64_t rest = totalLength - start;
        return static_cast<std::uint32_t>(rest < pieceLength ? rest : pieceLength);
    }

} // namespace bitleech::piece
