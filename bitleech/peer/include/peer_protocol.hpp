#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "../../common/include/expected.hpp"
#include "../../piece/include/piece_manager.hpp"
#include "../../wire/include/bitfield.hpp"
#include "../../wire/include/handshake.hpp"
#include "../../wire/include/message.hpp"


namespace bitleech::peer {

    using Clock = std::chrono::steady_clock;

    enum class SessionState { Init, Connected, Handshook, Interested, Active, Choked, Terminated };

    const char* toString(SessionState s) noexcept;

    struct SessionConfig 
    {
        std::size_t window{5};                          // in-flight requests
        std::chrono::seconds requestTimeout{30};
        std::chrono::seconds idleTimeout{120};
        std::chrono::seconds keepAlive{90};
        std::chrono::seconds connectTimeout{10};        // TCP connect plus handshake
        std::chrono::milliseconds tick{1000};
    };

    struct PendingRequest 
    {
        piece::BlockInfo block;
        Clock::time_point sentAt;
        int attempts{1};
    };


    // Connection state machine without any I/O. The driver feeds it decoded
    // messages and clock ticks, then drains the messages it wants sent and the
    // pieces waiting for a hash check.
    class PeerProtocol 
    {
    public:
        PeerProtocol(piece::PieceManager& pieces, SessionConfig cfg, std::string label);
        ~PeerProtocol();

        PeerProtocol(const PeerProtocol&) = delete;
        PeerProtocol& operator=(const PeerProtocol&) = delete;

        void onConnected(Clock::time_point now);

        // InfoHashMismatch when the remote side serves another torrent.
        Expected<void> onHandshake(const wire::Handshake& remote, const InfoHash& expected, Clock::time_point now);

        // Declares interest; requests start flowing after Unchoke.
        void start(Clock::time_point now);

        Expected<void> onMessage(const wire::Message& msg, Clock::time_point now);

        // Call once the tickets from takeVerifications() are committed.
        Expected<void> onVerified(Clock::time_point now) { return refill(now); }

        // Request retries, idle and keep-alive timers, window refill.
        Expected<void> onTick(Clock::time_point now);

        // Sends Cancel for every pending request and hands the blocks back.
        void cancelAll();

        // Returns every reservation to the piece manager. Idempotent.
        void terminate();

        void noteSent(Clock::time_point now) { lastSent_ = now; }

        std::vector<wire::Message> takeOutgoing() { return std::exchange(outbox_, {}); }
        std::vector<piece::VerifyTicket> takeVerifications() { return std::exchange(verify_, {}); }

        // All pieces are in; nothing left to ask this peer for.
        bool finished() const noexcept { return finished_; }

        SessionState state() const noexcept { return state_; }
        bool amChoked() const noexcept { return amChoked_; }
        piece::OwnerId owner() const noexcept { return owner_; }
        const wire::Bitfield& peerHas() const noexcept { return peerHas_; }
        const std::vector<PendingRequest>& pending() const noexcept { return pending_; }
        std::size_t droppedLatePieces() const noexcept { return droppedLate_; }
        std::size_t blocksReceived() const noexcept { return blocksReceived_; }
        const std::string& label() const noexcept { return label_; }

    private:
        Expected<void> onPiece(const wire::PieceMsg& msg);
        Expected<void> refill(Clock::time_point now);
        void dropPending();

        piece::PieceManager& pieces_;
        SessionConfig cfg_;
        std::string label_;
        piece::OwnerId owner_;

        SessionState state_{SessionState::Init};
        bool amChoked_{true};
        bool finished_{false};
        std::size_t messagesSeen_{0};

        wire::Bitfield peerHas_;
        std::vector<PendingRequest> pending_;

        // replies still owed for requests we gave up on or sent twice; those Pieces are dropped quietly
        std::map<std::pair<std::uint32_t, std::uint32_t>, int> lateReplies_;

        std::vector<wire::Message> outbox_;
        std::vector<piece::VerifyTicket> verify_;

        Clock::time_point lastReceived_{};
        Clock::time_point lastSent_{};
        std::size_t droppedLate_{0};
        std::size_t blocksReceived_{0};
    };

} // namespace bitleech::peer
