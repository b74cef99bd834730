#include <algorithm>
#include <type_traits>
#include "../include/peer_protocol.hpp"


namespace bitleech::peer {

    const char* toString(SessionState s) noexcept {
        switch (s) {
            case SessionState::Init:       return "Init";
            case SessionState::Connected:  return "Connected";
            case SessionState::Handshook:  return "Handshook";
            case SessionState::Interested: return "Interested";
            case SessionState::Active:     return "Active";
            case SessionState::Choked:     return "Choked";
            case SessionState::Terminated: return "Terminated";
        }
        return "?";
    }


    PeerProtocol::PeerProtocol(piece::PieceManager& pieces, SessionConfig cfg, std::string label)
        : pieces_(pieces), cfg_(cfg), label_(std::move(label)),
          owner_(pieces_.registerOwner(label_)),
          peerHas_(pieces_.layout().pieceCount()) {}


    PeerProtocol::~PeerProtocol() {
        terminate();
    }


    void PeerProtocol::onConnected(Clock::time_point now) {
        state_ = SessionState::Connected;
        lastReceived_ = now;
        lastSent_ = now;
    }


    Expected<void> PeerProtocol::onHandshake(const wire::Handshake& remote, const InfoHash& expected, Clock::time_point now) {
        if (remote.infoHash != expected) {
            return Expected<void>::failure(ErrorCode::InfoHashMismatch, "peer serves " + remote.infoHash.toHex());
        }
        state_ = SessionState::Handshook;
        lastReceived_ = now;
        return Expected<void>::success();
    }


    void PeerProtocol::start(Clock::time_point now) {
        outbox_.push_back(wire::Interested{});
        state_ = SessionState::Interested;
        lastSent_ = now;
    }


    Expected<void> PeerProtocol::onMessage(const wire::Message& msg, Clock::time_point now) {
        if (state_ == SessionState::Init || state_ == SessionState::Connected) {
            return Expected<void>::failure(ErrorCode::ProtocolViolation, "message before handshake");
        }
        if (state_ == SessionState::Terminated) return Expected<void>::success();

        lastReceived_ = now;
        if (std::holds_alternative<wire::KeepAlive>(msg)) return Expected<void>::success();

        const bool first = (messagesSeen_++ == 0);

        auto r = std::visit([&](auto const& m) -> Expected<void> {
            using T = std::decay_t<decltype(m)>;

            if constexpr (std::is_same_v<T, wire::BitfieldMsg>) {
                if (!first) return Expected<void>::failure(ErrorCode::ProtocolViolation, "bitfield after the first message");
                auto bf = wire::Bitfield::fromBytes(m.bits, pieces_.layout().pieceCount());
                if (!bf.has_value()) return Expected<void>::failure(std::move(*bf.error));
                peerHas_ = std::move(bf.get());
                return Expected<void>::success();

            } else if constexpr (std::is_same_v<T, wire::Have>) {
                if (m.index >= peerHas_.size()) {
                    return Expected<void>::failure(ErrorCode::ProtocolViolation, "have " + std::to_string(m.index) + " out of range");
                }
                peerHas_.set(m.index);
                return Expected<void>::success();

            } else if constexpr (std::is_same_v<T, wire::Choke>) {
                amChoked_ = true;
                if (state_ == SessionState::Active) state_ = SessionState::Choked;
                dropPending();
                return Expected<void>::success();

            } else if constexpr (std::is_same_v<T, wire::Unchoke>) {
                amChoked_ = false;
                state_ = SessionState::Active;
                return Expected<void>::success();

            } else if constexpr (std::is_same_v<T, wire::PieceMsg>) {
                return onPiece(m);

            } else {
                // Interested, NotInterested, Request, Cancel: we never upload
                return Expected<void>::success();
            }
        }, msg);

        if (!r.has_value()) return r;
        return refill(now);
    }


    Expected<void> PeerProtocol::onPiece(const wire::PieceMsg& msg) {
        auto it = std::find_if(pending_.begin(), pending_.end(), [&](const PendingRequest& p) {
            return p.block.piece == msg.index && p.block.offset == msg.begin;
        });

        if (it == pending_.end()) {
            auto late = lateReplies_.find({msg.index, msg.begin});
            if (late != lateReplies_.end()) {
                if (--late->second == 0) lateReplies_.erase(late);
                ++droppedLate_;
                return Expected<void>::success();
            }
            return Expected<void>::failure(ErrorCode::UnexpectedPiece,
                "unrequested block " + std::to_string(msg.index) + ":" + std::to_string(msg.begin));
        }
        if (it->block.length != msg.block.size()) {
            return Expected<void>::failure(ErrorCode::ProtocolViolation,
                "block " + std::to_string(msg.index) + ":" + std::to_string(msg.begin) + " has "
                + std::to_string(msg.block.size()) + " bytes, requested " + std::to_string(it->block.length));
        }
        // a reissued request may still be answered a second time
        if (it->attempts > 1) lateReplies_[{msg.index, msg.begin}] += it->attempts - 1;
        pending_.erase(it);

        auto accepted = pieces_.acceptBlock(owner_, msg.index, msg.begin, msg.block);
        if (!accepted.has_value()) return Expected<void>::failure(std::move(*accepted.error));

        ++blocksReceived_;
        if (accepted.get()) verify_.push_back(std::move(*accepted.get()));
        return Expected<void>::success();
    }


    Expected<void> PeerProtocol::refill(Clock::time_point now) {
        if (state_ != SessionState::Active || amChoked_ || finished_) return Expected<void>::success();
        if (pending_.size() >= cfg_.window) return Expected<void>::success();

        auto batch = pieces_.reserveBatch(owner_, cfg_.window - pending_.size(), peerHas_);
        for (auto const& b : batch) {
            outbox_.push_back(wire::Request{b.piece, b.offset, b.length});
            pending_.push_back(PendingRequest{b, now, 1});
        }

        if (batch.empty() && pending_.empty() && verify_.empty()) {
            if (pieces_.isDone()) {
                finished_ = true;
            } else if (!pieces_.wantsAnyOf(peerHas_)) {
                return Expected<void>::failure(ErrorCode::NoMutualWork, "peer has nothing we still need");
            }
            // otherwise the peer's pieces are in flight elsewhere; wait for a Have or a recycle
        }
        return Expected<void>::success();
    }


    Expected<void> PeerProtocol::onTick(Clock::time_point now) {
        if (state_ == SessionState::Terminated) return Expected<void>::success();

        if (now - lastReceived_ >= cfg_.idleTimeout) {
            return Expected<void>::failure(ErrorCode::PeerTimeout, "no traffic from peer");
        }

        for (auto& p : pending_) {
            if (now - p.sentAt < cfg_.requestTimeout) continue;
            if (p.attempts >= 2) {
                return Expected<void>::failure(ErrorCode::PeerStalled,
                    "block " + std::to_string(p.block.piece) + ":" + std::to_string(p.block.offset) + " unanswered twice");
            }
            ++p.attempts;
            p.sentAt = now;
            outbox_.push_back(wire::Request{p.block.piece, p.block.offset, p.block.length});
        }

        if (now - lastSent_ >= cfg_.keepAlive && outbox_.empty()) {
            outbox_.push_back(wire::KeepAlive{});
        }

        if (pieces_.isDone() && pending_.empty()) finished_ = true;
        return refill(now);
    }


    void PeerProtocol::dropPending() {
        for (auto const& p : pending_) lateReplies_[{p.block.piece, p.block.offset}] += p.attempts;
        pending_.clear();
        pieces_.abandon(owner_);
    }


    void PeerProtocol::cancelAll() {
        for (auto const& p : pending_) {
            outbox_.push_back(wire::Cancel{p.block.piece, p.block.offset, p.block.length});
        }
        dropPending();
    }


    void PeerProtocol::terminate() {
        if (state_ == SessionState::Terminated) return;
        pending_.clear();
        pieces_.unregisterOwner(owner_);
        state_ = SessionState::Terminated;
    }

} // namespace bitleech::peer
