#include <array>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include "../include/peer_session.hpp"
#include "../../common/include/offload.hpp"


namespace bitleech::peer {

    using boost::system::error_code;
    using asio::redirect_error;
    using asio::use_awaitable;
    using logger::LogLevel;


    PeerSession::PeerSession(asio::any_io_executor ex, PeerAddr addr, InfoHash infoHash, PeerID self,
                             piece::PieceManager& pieces, SessionConfig cfg,
                             std::shared_ptr<logger::Logger> log, asio::thread_pool* hashPool)
        : ex_(ex), addr_(std::move(addr)), infoHash_(infoHash), self_(self), pieces_(pieces), cfg_(cfg),
          log_(std::move(log)), hashPool_(hashPool),
          protocol_(pieces, cfg, addr_.toString()),
          socket_(ex), writeSignal_(ex), tickTimer_(ex), doneSignal_(ex),
          maxFrame_(wire::maxFrameLength(pieces.blockSize(), pieces.layout().pieceCount())) {}


    asio::awaitable<SessionResult> PeerSession::run() {
        auto self = shared_from_this();

        auto hs = co_await connectAndHandshake();
        const bool handshook = hs.has_value();

        if (!handshook) {
            if (!stopping_) error_ = *hs.error;
        } else if (!stopping_) {
            BL_LOG(log_, LogLevel::debug, "session") << addr_.toString() << " handshook";
            protocol_.start(Clock::now());
            pump();

            loopsRunning_ = 3;
            doneSignal_.expires_at(asio::steady_timer::time_point::max());
            asio::co_spawn(ex_, [self] { return self->readLoop(); }, asio::detached);
            asio::co_spawn(ex_, [self] { return self->writeLoop(); }, asio::detached);
            asio::co_spawn(ex_, [self] { return self->tickLoop(); }, asio::detached);

            while (loopsRunning_ > 0) {
                error_code ec;
                co_await doneSignal_.async_wait(redirect_error(use_awaitable, ec));
            }
        }

        protocol_.terminate();
        close();

        SessionResult res;
        res.peer = addr_;
        res.error = error_;
        res.handshook = handshook;
        res.blocksReceived = protocol_.blocksReceived();
        res.piecesVerified = piecesVerified_;

        if (log_) {
            logger::LogRecord rec;
            rec.level = error_ ? LogLevel::info : LogLevel::debug;
            rec.logger = "session";
            rec.peer = addr_.toString();
            if (error_) rec.code = toString(error_->code);
            rec.msg = error_ ? "session ended: " + error_->message
                             : "session closed after " + std::to_string(res.blocksReceived) + " blocks";
            log_->log(std::move(rec));
        }
        co_return res;
    }


    asio::awaitable<Expected<void>> PeerSession::connectAndHandshake() {
        // async_connect would reopen a socket that cancel() already closed
        if (stopping_) co_return Expected<void>::failure(ErrorCode::TransportError, "cancelled before connect");

        error_code ec;
        auto address = asio::ip::make_address(addr_.ip, ec);
        if (ec) co_return Expected<void>::failure(ErrorCode::TransportError, "bad address " + addr_.ip);

        // connect and handshake share one deadline
        auto self = shared_from_this();
        asio::steady_timer deadline(ex_);
        deadline.expires_after(cfg_.connectTimeout);
        deadline.async_wait([self](const error_code& e) {
            if (e || !self->connecting_) return;
            self->timedOut_ = true;
            error_code ignored;
            self->socket_.close(ignored);
        });

        auto transport = [&](const char* what) {
            connecting_ = false;
            deadline.cancel();
            if (timedOut_) return Expected<void>::failure(ErrorCode::PeerTimeout, std::string(what) + " timed out");
            return Expected<void>::failure(ErrorCode::TransportError, std::string(what) + ": " + ec.message());
        };

        co_await socket_.async_connect(asio::ip::tcp::endpoint(address, addr_.port), redirect_error(use_awaitable, ec));
        if (ec) co_return transport("connect");
        protocol_.onConnected(Clock::now());

        const auto out = wire::encodeHandshake(wire::Handshake{infoHash_, self_, {}});
        co_await asio::async_write(socket_, asio::buffer(out), redirect_error(use_awaitable, ec));
        if (ec) co_return transport("handshake write");

        std::array<std::uint8_t, wire::kHandshakeLength> in{};
        co_await asio::async_read(socket_, asio::buffer(in), redirect_error(use_awaitable, ec));
        if (ec) co_return transport("handshake read");

        connecting_ = false;
        deadline.cancel();

        auto remote = wire::decodeHandshake(in);
        if (!remote.has_value()) co_return Expected<void>::failure(std::move(*remote.error));
        co_return protocol_.onHandshake(remote.get(), infoHash_, Clock::now());
    }


    asio::awaitable<void> PeerSession::readLoop() {
        std::array<std::uint8_t, wire::kLengthPrefix> prefix{};
        Bytes body;

        auto readFailed = [this](const error_code& ec) {
            if (stopping_ || closed_) return;
            if (ec == asio::error::eof) fail({ErrorCode::TransportError, "peer closed the connection"});
            else fail({ErrorCode::TransportError, "read: " + ec.message()});
        };

        while (!closed_) {
            error_code ec;
            co_await asio::async_read(socket_, asio::buffer(prefix), redirect_error(use_awaitable, ec));
            if (ec) { readFailed(ec); break; }

            const auto len = wire::readLengthPrefix(prefix);
            if (len > maxFrame_) {
                fail({ErrorCode::MessageMalformed, "frame of " + std::to_string(len) + " bytes"});
                break;
            }

            body.resize(len);
            if (len > 0) {
                co_await asio::async_read(socket_, asio::buffer(body), redirect_error(use_awaitable, ec));
                if (ec) { readFailed(ec); break; }
            }

            auto msg = wire::decodePayload(body);
            if (!msg.has_value()) { fail(*msg.error); break; }

            BL_LOG(log_, LogLevel::trace, "session") << addr_.toString() << " <- " << wire::messageName(msg.get());

            auto r = protocol_.onMessage(msg.get(), Clock::now());
            if (!r.has_value()) { fail(*r.error); break; }

            auto v = co_await verifyPending();
            if (!v.has_value()) { fail(*v.error); break; }

            pump();
            if (protocol_.finished()) cancel();
        }
        loopDone();
    }


    asio::awaitable<Expected<void>> PeerSession::verifyPending() {
        auto tickets = protocol_.takeVerifications();
        for (auto const& t : tickets) {
            Sha1Digest actual;
            if (hashPool_) {
                actual = co_await offload(*hashPool_, [&t] { return piece::PieceManager::digest(t); });
            } else {
                actual = piece::PieceManager::digest(t);
            }
            if (pieces_.commitVerification(t, actual) == piece::DeliverOutcome::PieceComplete) ++piecesVerified_;
        }
        if (tickets.empty()) co_return Expected<void>::success();
        co_return protocol_.onVerified(Clock::now());
    }


    asio::awaitable<void> PeerSession::writeLoop() {
        while (true) {
            if (outbox_.empty()) {
                if (stopping_ || closed_) break;
                writeSignal_.expires_at(asio::steady_timer::time_point::max());
                error_code ec;
                co_await writeSignal_.async_wait(redirect_error(use_awaitable, ec));
                continue;
            }

            Bytes frame = std::move(outbox_.front());
            outbox_.pop_front();

            error_code ec;
            co_await asio::async_write(socket_, asio::buffer(frame), redirect_error(use_awaitable, ec));
            if (ec) {
                if (!stopping_ && !closed_) fail({ErrorCode::TransportError, "write: " + ec.message()});
                break;
            }
            protocol_.noteSent(Clock::now());
        }

        // a drained stop ends here
        close();
        loopDone();
    }


    asio::awaitable<void> PeerSession::tickLoop() {
        int stopTicks = 0;

        while (!closed_) {
            tickTimer_.expires_after(cfg_.tick);
            error_code ec;
            co_await tickTimer_.async_wait(redirect_error(use_awaitable, ec));
            if (closed_) break;

            if (stopping_) {
                // writer had its chance to flush the cancels
                if (++stopTicks >= 2) close();
                continue;
            }

            auto r = protocol_.onTick(Clock::now());
            if (!r.has_value()) { fail(*r.error); break; }
            pump();
            if (protocol_.finished()) cancel();
        }
        loopDone();
    }


    void PeerSession::pump() {
        for (auto const& m : protocol_.takeOutgoing()) outbox_.push_back(wire::encode(m));
        if (!outbox_.empty()) writeSignal_.cancel();
    }


    void PeerSession::cancel() {
        if (stopping_ || closed_) return;
        stopping_ = true;

        if (connecting_) {
            close();
            return;
        }
        protocol_.cancelAll();
        pump();
        writeSignal_.cancel();
    }


    void PeerSession::fail(Error err) {
        if (!error_ && !stopping_) error_ = std::move(err);
        close();
    }


    void PeerSession::close() {
        if (closed_) return;
        closed_ = true;
        error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        writeSignal_.cancel();
        tickTimer_.cancel();
    }


    void PeerSession::loopDone() {
        if (--loopsRunning_ == 0) doneSignal_.cancel();
    }

} // namespace bitleech::peer
