#include <algorithm>
#include <stdexcept>
#include "../include/piece_manager.hpp"


namespace bitleech::piece {

    using logger::LogLevel;

    const char* toString(DeliverOutcome o) noexcept {
        switch (o) {
            case DeliverOutcome::Accepted:      return "Accepted";
            case DeliverOutcome::PieceComplete: return "PieceComplete";
            case DeliverOutcome::HashMismatch:  return "HashMismatch";
        }
        return "?";
    }


    PieceManager::PieceManager(PieceLayout layout, std::shared_ptr<IPieceStore> store,
                               PieceManagerConfig cfg, std::shared_ptr<logger::Logger> log)
        : layout_(std::move(layout)), store_(std::move(store)), cfg_(cfg), log_(std::move(log))
    {
        if (!store_) throw std::invalid_argument("piece store is null");
        if (cfg_.blockSize == 0) throw std::invalid_argument("block size must be positive");
        if (cfg_.corruptThreshold == 0) cfg_.corruptThreshold = 1;

        pieces_.resize(layout_.pieceCount());
        for (std::size_t i = 0; i < pieces_.size(); ++i) {
            auto& p = pieces_[i];
            p.size = layout_.pieceSize(i);
            p.blocks.resize((p.size + cfg_.blockSize - 1) / cfg_.blockSize);
        }
    }


    std::size_t PieceManager::blockCount(std::uint32_t piece) const {
        if (piece >= pieces_.size()) throw std::out_of_range("piece index");
        return pieces_[piece].blocks.size();
    }


    OwnerId PieceManager::registerOwner(std::string label) {
        std::scoped_lock lk(mu_);
        const OwnerId id = nextOwner_++;
        owners_.emplace(id, std::move(label));
        return id;
    }


    std::vector<BlockInfo> PieceManager::reserveBatch(OwnerId owner, std::size_t n, const wire::Bitfield& peerHas) {
        std::vector<BlockInfo> out;
        if (n == 0) return out;

        std::scoped_lock lk(mu_);
        for (std::uint32_t i = 0; i < pieces_.size() && out.size() < n; ++i) {
            auto& p = pieces_[i];
            if (p.status == PieceStatus::Complete || p.status == PieceStatus::AwaitingVerify) continue;
            if (!peerHas.has(i)) continue;

            for (std::uint32_t b = 0; b < p.blocks.size() && out.size() < n; ++b) {
                auto& blk = p.blocks[b];
                if (blk.state != BlockState::NotRequested) continue;

                blk.state = BlockState::Requested;
                blk.owner = owner;
                if (p.status == PieceStatus::Failed) p.status = PieceStatus::Incomplete;

                const std::uint32_t offset = b * cfg_.blockSize;
                out.push_back(BlockInfo{i, offset, std::min(cfg_.blockSize, p.size - offset)});
            }
        }
        return out;
    }


    std::size_t PieceManager::abandon(OwnerId owner) {
        std::scoped_lock lk(mu_);
        return abandonLocked(owner);
    }


    std::size_t PieceManager::unregisterOwner(OwnerId owner) {
        std::scoped_lock lk(mu_);
        const auto n = abandonLocked(owner);
        owners_.erase(owner);
        return n;
    }


    std::size_t PieceManager::abandonLocked(OwnerId owner) {
        std::size_t n = 0;
        for (auto& p : pieces_) {
            if (p.status == PieceStatus::Complete) continue;
            for (auto& blk : p.blocks) {
                if (blk.state == BlockState::Requested && blk.owner == owner) {
                    blk.state = BlockState::NotRequested;
                    blk.owner = kNoOwner;
                    ++n;
                }
            }
        }
        return n;
    }


    Expected<std::optional<VerifyTicket>> PieceManager::acceptBlock(OwnerId owner, std::uint32_t piece,
        std::uint32_t offset, std::span<const std::uint8_t> bytes)
    {
        using Result = Expected<std::optional<VerifyTicket>>;

        std::scoped_lock lk(mu_);

        if (piece >= pieces_.size()) {
            return Result::failure(ErrorCode::ProtocolViolation, "piece index " + std::to_string(piece) + " out of range");
        }
        auto& p = pieces_[piece];
        if (offset % cfg_.blockSize != 0 || offset >= p.size) {
            return Result::failure(ErrorCode::ProtocolViolation,
                "offset " + std::to_string(offset) + " is not a block of piece " + std::to_string(piece));
        }
        const std::uint32_t b = offset / cfg_.blockSize;
        const std::uint32_t expectedLen = std::min(cfg_.blockSize, p.size - offset);
        if (bytes.size() != expectedLen) {
            return Result::failure(ErrorCode::ProtocolViolation,
                "block " + std::to_string(piece) + ":" + std::to_string(offset) + " is " + std::to_string(bytes.size())
                + " bytes, expected " + std::to_string(expectedLen));
        }

        auto& blk = p.blocks[b];
        if (blk.state != BlockState::Requested || blk.owner != owner) {
            return Result::failure(ErrorCode::UnexpectedPiece,
                "block " + std::to_string(piece) + ":" + std::to_string(offset) + " is " + toString(blk.state));
        }

        auto w = store_->write(piece, offset, bytes);
        if (!w.has_value()) {
            blk.state = BlockState::NotRequested;
            blk.owner = kNoOwner;
            return Result::failure(std::move(*w.error));
        }

        if (cfg_.bufferInMemory) {
            if (p.buffer.size() != p.size) p.buffer.assign(p.size, 0);
            std::copy(bytes.begin(), bytes.end(), p.buffer.begin() + offset);
        }

        blk.state = BlockState::Downloaded;
        if (auto it = owners_.find(owner); it != owners_.end()) p.contributors.insert(it->second);
        ++p.downloaded;

        if (p.downloaded < p.blocks.size()) return Result::success(std::nullopt);

        p.status = PieceStatus::AwaitingVerify;

        VerifyTicket ticket;
        ticket.piece = piece;
        ticket.expected = layout_.hashes[piece];

        if (cfg_.bufferInMemory) {
            ticket.data = std::move(p.buffer);
            p.buffer.clear();
        } else {
            auto r = store_->read(piece);
            if (!r.has_value()) {
                // nothing to verify against: recycle the piece
                for (auto& x : p.blocks) { x.state = BlockState::NotRequested; x.owner = kNoOwner; }
                p.downloaded = 0;
                p.contributors.clear();
                p.status = PieceStatus::Incomplete;
                return Result::failure(std::move(*r.error));
            }
            ticket.data = std::move(r.get());
        }

        return Result::success(std::optional<VerifyTicket>(std::move(ticket)));
    }


    Sha1Digest PieceManager::digest(const VerifyTicket& ticket) {
        return metainfo::sha1(ticket.data.data(), ticket.data.size());
    }


    DeliverOutcome PieceManager::commitVerification(const VerifyTicket& ticket, const Sha1Digest& actual) {
        std::unique_lock lk(mu_);

        auto& p = pieces_.at(ticket.piece);
        if (p.status != PieceStatus::AwaitingVerify) {
            throw std::logic_error("piece " + std::to_string(ticket.piece) + " is not awaiting verification");
        }

        if (actual == ticket.expected) {
            p.status = PieceStatus::Complete;
            for (auto& blk : p.blocks) { blk.state = BlockState::Verified; blk.owner = kNoOwner; }
            p.contributors.clear();
            p.suspects.clear();
            ++completed_;
            bytesVerified_ += p.size;

            const auto done = completed_;
            lk.unlock();

            if (log_) {
                logger::LogRecord rec;
                rec.level = LogLevel::debug;
                rec.logger = "pieces";
                rec.piece = ticket.piece;
                rec.msg = "piece verified (" + std::to_string(done) + "/" + std::to_string(pieces_.size()) + ")";
                log_->log(std::move(rec));
            }
            return DeliverOutcome::PieceComplete;
        }

        p.suspects.insert(p.contributors.begin(), p.contributors.end());
        for (auto& blk : p.blocks) { blk.state = BlockState::NotRequested; blk.owner = kNoOwner; }
        p.downloaded = 0;
        p.contributors.clear();
        p.status = PieceStatus::Failed;
        ++hashFailures_;

        const auto suspects = p.suspects.size();
        if (suspects >= cfg_.corruptThreshold) corrupt_ = true;
        lk.unlock();

        if (log_) {
            logger::LogRecord rec;
            rec.level = LogLevel::warn;
            rec.logger = "pieces";
            rec.piece = ticket.piece;
            rec.code = toString(ErrorCode::PieceHashMismatch);
            rec.retries = static_cast<int>(suspects);
            rec.msg = "hash mismatch, piece recycled";
            log_->log(std::move(rec));
        }
        return DeliverOutcome::HashMismatch;
    }


    Expected<DeliverOutcome> PieceManager::deliver(OwnerId owner, std::uint32_t piece,
        std::uint32_t offset, std::span<const std::uint8_t> bytes)
    {
        auto accepted = acceptBlock(owner, piece, offset, bytes);
        if (!accepted.has_value()) return Expected<DeliverOutcome>::failure(std::move(*accepted.error));
        if (!accepted.get()) return Expected<DeliverOutcome>::success(DeliverOutcome::Accepted);

        const auto& ticket = *accepted.get();
        return Expected<DeliverOutcome>::success(commitVerification(ticket, digest(ticket)));
    }


    bool PieceManager::isDone() const {
        std::scoped_lock lk(mu_);
        return completed_ == pieces_.size();
    }


    bool PieceManager::isCorrupt() const {
        std::scoped_lock lk(mu_);
        return corrupt_;
    }


    bool PieceManager::wantsAnyOf(const wire::Bitfield& peerHas) const {
        std::scoped_lock lk(mu_);
        for (std::size_t i = 0; i < pieces_.size(); ++i) {
            if (pieces_[i].status != PieceStatus::Complete && peerHas.has(i)) return true;
        }
        return false;
    }


    ProgressSnapshot PieceManager::progressSnapshot() const {
        std::scoped_lock lk(mu_);
        ProgressSnapshot s;
        s.piecesTotal = pieces_.size();
        s.piecesComplete = completed_;
        s.bytesVerified = bytesVerified_;
        s.totalBytes = layout_.totalLength;
        s.hashFailures = hashFailures_;
        s.owners = owners_.size();

        for (auto const& p : pieces_) {
            if (p.status == PieceStatus::AwaitingVerify) ++s.piecesAwaitingVerify;
            for (auto const& blk : p.blocks) {
                ++s.blocksTotal;
                switch (blk.state) {
                    case BlockState::NotRequested: ++s.blocksNotRequested; break;
                    case BlockState::Requested:    ++s.blocksRequested; break;
                    case BlockState::Downloaded:   ++s.blocksDownloaded; break;
                    case BlockState::Verified:     ++s.blocksVerified; break;
                }
            }
        }
        return s;
    }


    PieceStatus PieceManager::status(std::uint32_t piece) const {
        std::scoped_lock lk(mu_);
        return pieces_.at(piece).status;
    }


    BlockState PieceManager::blockState(std::uint32_t piece, std::uint32_t offset) const {
        std::scoped_lock lk(mu_);
        return pieces_.at(piece).blocks.at(offset / cfg_.blockSize).state;
    }


    std::uint64_t PieceManager::bytesLeft() const {
        std::scoped_lock lk(mu_);
        return layout_.totalLength - bytesVerified_;
    }


    Expected<void> PieceManager::finalizeStore() {
        {
            std::scoped_lock lk(mu_);
            if (finalized_) return Expected<void>::success();
            finalized_ = true;
        }
        return store_->finalize();
    }

} // namespace bitleech::piece
