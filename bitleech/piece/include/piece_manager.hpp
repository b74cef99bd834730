#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>
#include "types.hpp"
#include "piece_store.hpp"
#include "../../wire/include/bitfield.hpp"
#include "../../logger/logger.hpp"


namespace bitleech::piece {

    struct PieceManagerConfig 
    {
        std::uint32_t blockSize{16384};
        bool bufferInMemory{true};          // verify from a piece buffer instead of reading the store back
        std::size_t corruptThreshold{10};   // distinct peers behind failed attempts of one piece
    };

    enum class DeliverOutcome { Accepted, PieceComplete, HashMismatch };

    const char* toString(DeliverOutcome o) noexcept;

    // A piece pinned in AwaitingVerify together with the bytes to hash.
    struct VerifyTicket 
    {
        std::uint32_t piece{0};
        Bytes data;
        Sha1Digest expected{};
    };

    struct ProgressSnapshot 
    {
        std::size_t piecesTotal{0};
        std::size_t piecesComplete{0};
        std::size_t piecesAwaitingVerify{0};

        std::size_t blocksTotal{0};
        std::size_t blocksNotRequested{0};
        std::size_t blocksRequested{0};
        std::size_t blocksDownloaded{0};
        std::size_t blocksVerified{0};

        std::uint64_t bytesVerified{0};
        std::uint64_t totalBytes{0};
        std::size_t hashFailures{0};
        std::size_t owners{0};             // sessions currently registered
    };


    // Block bookkeeping shared by every session. All state changes happen under
    // one mutex; hashing happens between acceptBlock and commitVerification with
    // the mutex released.
    class PieceManager 
    {
    public:
        PieceManager(PieceLayout layout, std::shared_ptr<IPieceStore> store,
                     PieceManagerConfig cfg = {}, std::shared_ptr<logger::Logger> log = nullptr);

        PieceManager(const PieceManager&) = delete;
        PieceManager& operator=(const PieceManager&) = delete;

        // Label is used for corrupt-swarm accounting, normally the peer's ip:port.
        OwnerId registerOwner(std::string label);

        // Up to n NotRequested blocks from pieces the peer has, in increasing (piece, offset) order.
        std::vector<BlockInfo> reserveBatch(OwnerId owner, std::size_t n, const wire::Bitfield& peerHas);

        // Every Requested block held by owner goes back to NotRequested. Returns how many.
        std::size_t abandon(OwnerId owner);

        // abandon() plus forgetting the owner. Labels already recorded against
        // pieces in progress still count towards corrupt-swarm detection.
        std::size_t unregisterOwner(OwnerId owner);

        // UnexpectedPiece if the block is not Requested by owner, ProtocolViolation
        // if it does not line up with a block, StorageFailure if the store refuses it.
        Expected<std::optional<VerifyTicket>> acceptBlock(OwnerId owner, std::uint32_t piece,
            std::uint32_t offset, std::span<const std::uint8_t> bytes);

        static Sha1Digest digest(const VerifyTicket& ticket);
        DeliverOutcome commitVerification(const VerifyTicket& ticket, const Sha1Digest& actual);

        // acceptBlock, hash and commit in one call.
        Expected<DeliverOutcome> deliver(OwnerId owner, std::uint32_t piece,
            std::uint32_t offset, std::span<const std::uint8_t> bytes);

        bool isDone() const;
        bool isCorrupt() const;

        // True when the peer has at least one piece that is not Complete yet.
        bool wantsAnyOf(const wire::Bitfield& peerHas) const;

        ProgressSnapshot progressSnapshot() const;
        PieceStatus status(std::uint32_t piece) const;
        BlockState blockState(std::uint32_t piece, std::uint32_t offset) const;
        std::uint64_t bytesLeft() const;

        // Calls store finalize() the first time only.
        Expected<void> finalizeStore();

        const PieceLayout& layout() const noexcept { return layout_; }
        std::uint32_t blockSize() const noexcept { return cfg_.blockSize; }
        std::size_t blockCount(std::uint32_t piece) const;

    private:
        std::size_t abandonLocked(OwnerId owner);

        struct Block 
        {
            BlockState state{BlockState::NotRequested};
            OwnerId owner{kNoOwner};
        };

        struct Piece 
        {
            PieceStatus status{PieceStatus::Incomplete};
            std::uint32_t size{0};
            std::vector<Block> blocks;
            std::size_t downloaded{0};
            Bytes buffer;
            std::set<std::string> contributors;   // labels of owners that delivered blocks of this attempt
            std::set<std::string> suspects;   // labels behind failed attempts
        };

        PieceLayout layout_;
        std::shared_ptr<IPieceStore> store_;
        PieceManagerConfig cfg_;
        std::shared_ptr<logger::Logger> log_;

        mutable std::mutex mu_;
        std::vector<Piece> pieces_;
        std::map<OwnerId, std::string> owners_;     // registered and not yet unregistered
        OwnerId nextOwner_{1};
        std::size_t completed_{0};
        std::size_t hashFailures_{0};
        std::uint64_t bytesVerified_{0};
        bool corrupt_{false};
        bool finalized_{false};
    };

} // namespace bitleech::piece
