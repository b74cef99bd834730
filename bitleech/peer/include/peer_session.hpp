#pragma once
#include <utility>
#include <deque>
#include <memory>
#include <optional>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include "peer_protocol.hpp"
#include "../../logger/logger.hpp"


namespace bitleech::peer {

    namespace asio = boost::asio;

    struct SessionResult 
    {
        PeerAddr peer;
        std::optional<Error> error;         // empty on a clean finish or local cancel
        bool handshook{false};
        std::size_t blocksReceived{0};
        std::size_t piecesVerified{0};
    };


    // One outgoing connection: connect, handshake, then three cooperating
    // loops (reader, writer, timer) on the caller's executor until the peer
    // fails, the work runs out or cancel() is called.
    class PeerSession : public std::enable_shared_from_this<PeerSession> 
    {
    public:
        PeerSession(asio::any_io_executor ex, PeerAddr addr, InfoHash infoHash, PeerID self,
                    piece::PieceManager& pieces, SessionConfig cfg,
                    std::shared_ptr<logger::Logger> log = nullptr,
                    asio::thread_pool* hashPool = nullptr);

        asio::awaitable<SessionResult> run();

        // Sends Cancel for in-flight requests, flushes, then closes. Safe to call more than once.
        void cancel();

        const PeerAddr& peer() const noexcept { return addr_; }
        SessionState state() const noexcept { return protocol_.state(); }

    private:
        asio::awaitable<Expected<void>> connectAndHandshake();
        asio::awaitable<void> readLoop();
        asio::awaitable<void> writeLoop();
        asio::awaitable<void> tickLoop();

        asio::awaitable<Expected<void>> verifyPending();

        void pump();
        void fail(Error err);
        void close();
        void loopDone();

        asio::any_io_executor ex_;
        PeerAddr addr_;
        InfoHash infoHash_;
        PeerID self_;
        piece::PieceManager& pieces_;
        SessionConfig cfg_;
        std::shared_ptr<logger::Logger> log_;
        asio::thread_pool* hashPool_;

        PeerProtocol protocol_;
        asio::ip::tcp::socket socket_;
        asio::steady_timer writeSignal_;
        asio::steady_timer tickTimer_;
        asio::steady_timer doneSignal_;

        std::deque<Bytes> outbox_;
        std::optional<Error> error_;
        int loopsRunning_{0};
        bool connecting_{true};
        bool stopping_{false};
        bool closed_{false};
        bool timedOut_{false};
        std::size_t piecesVerified_{0};
        std::uint32_t maxFrame_;
    };

} // namespace bitleech::peer
