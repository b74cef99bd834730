#include <utility>
#include <algorithm>
#include <exception>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../include/coordinator.hpp"
#include "../../common/include/offload.hpp"


namespace bitleech::swarm {

    using boost::system::error_code;
    using asio::redirect_error;
    using asio::use_awaitable;
    using logger::LogLevel;


    Coordinator::Coordinator(asio::any_io_executor ex, piece::PieceManager& pieces,
                             std::shared_ptr<tracker::IPeerSource> source,
                             InfoHash infoHash, PeerID self, CoordinatorConfig cfg,
                             std::shared_ptr<logger::Logger> log)
        : ex_(ex), pieces_(pieces), source_(std::move(source)), infoHash_(infoHash), self_(self),
          cfg_(cfg), log_(std::move(log)),
          pool_(std::max<std::size_t>(cfg.poolThreads, 1)), wake_(ex), roster_(cfg.roster) {
        if (cfg_.maxConnections == 0) cfg_.maxConnections = 1;
    }


    Coordinator::~Coordinator() {
        pool_.join();
    }


    tracker::TransferStats Coordinator::stats() const {
        auto snap = pieces_.progressSnapshot();
        return tracker::TransferStats{ 0, snap.bytesVerified, pieces_.bytesLeft() };
    }


    asio::awaitable<Expected<std::vector<PeerAddr>>> Coordinator::fetchPeers() {
        auto src = source_;
        auto st = stats();
        co_return co_await offload(pool_, [src, st] { return src->fetchPeers(st); });
    }


    asio::awaitable<Expected<void>> Coordinator::run() {
        auto first = co_await fetchPeers();
        if (!first) co_return Expected<void>::failure(*first.error);
        roster_.add(first.get());
        BL_LOG(log_, LogLevel::info, "swarm") << "tracker returned " << first.get().size() << " peers";

        auto nextProgress = Clock::now() + cfg_.progressInterval;
        std::optional<Error> outcome;

        while (true) {
            if (storageError_) { outcome = storageError_; break; }
            if (pieces_.isCorrupt()) {
                outcome = Error{ErrorCode::SwarmCorrupt, "pieces keep failing verification across distinct peers"};
                break;
            }
            if (pieces_.isDone()) break;

            auto now = Clock::now();
            while (sessions_.size() < cfg_.maxConnections) {
                auto addr = roster_.next(now);
                if (!addr) break;
                spawn(*addr);
            }

            if (sessions_.empty() && roster_.empty()) {
                BL_LOG(log_, LogLevel::info, "swarm") << "roster empty, re-announcing";
                auto more = co_await fetchPeers();
                if (!more) { outcome = *more.error; break; }
                if (roster_.add(more.get()) == 0) {
                    outcome = Error{ErrorCode::SwarmExhausted, "no peers left and the tracker offered no new ones"};
                    break;
                }
                continue;
            }

            if (now >= nextProgress) {
                logProgress();
                nextProgress = now + cfg_.progressInterval;
            }

            // Sleep until a session ends or the next deadline; ticks keep the corrupt check fresh.
            auto until = std::min(nextProgress, now + cfg_.session.tick);
            if (sessions_.size() < cfg_.maxConnections) {
                if (auto at = roster_.nextEligibleAt(); at && *at < until) until = *at;
            }
            wake_.expires_at(until);
            error_code ec;
            co_await wake_.async_wait(redirect_error(use_awaitable, ec));
        }

        co_await drain();

        if (outcome) {
            BL_LOG(log_, LogLevel::error, "swarm") << outcome->describe();
            co_return Expected<void>::failure(*outcome);
        }

        logProgress();
        if (auto fin = pieces_.finalizeStore(); !fin) co_return fin;

        auto src = source_;
        auto st = stats();
        co_await offload(pool_, [src, st] { src->notifyCompleted(st); });
        BL_LOG(log_, LogLevel::info, "swarm") << "download complete";
        co_return Expected<void>::success();
    }


    // Cancels every live session and waits until all of them have handed their permit back.
    asio::awaitable<void> Coordinator::drain() {
        for (auto const& s : sessions_) s->cancel();
        while (!sessions_.empty()) {
            wake_.expires_at(asio::steady_timer::time_point::max());
            error_code ec;
            co_await wake_.async_wait(redirect_error(use_awaitable, ec));
        }
    }


    void Coordinator::spawn(const PeerAddr& addr) {
        auto session = std::make_shared<peer::PeerSession>(ex_, addr, infoHash_, self_, pieces_,
            cfg_.session, log_, cfg_.offloadHashing ? &pool_ : nullptr);
        sessions_.insert(session);
        ++spawned_;
        BL_LOG(log_, LogLevel::debug, "swarm") << "dialing " << addr.toString()
            << " (" << sessions_.size() << "/" << cfg_.maxConnections << ")";

        asio::co_spawn(ex_, [session] { return session->run(); },
            [this, session, addr](std::exception_ptr ep, peer::SessionResult res) {
                if (ep) {
                    res.peer = addr;
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        res.error = Error{ErrorCode::TransportError, e.what()};
                    }
                }
                sessions_.erase(session);
                onSessionEnd(addr, res);
                wake_.cancel();
            });
    }


    void Coordinator::onSessionEnd(const PeerAddr& addr, const peer::SessionResult& res) {
        roster_.onSessionEnd(addr, res.error, Clock::now());
        if (res.error && res.error->code == ErrorCode::StorageFailure && !storageError_) {
            storageError_ = res.error;
        }
        if (!log_) return;

        logger::LogRecord rec;
        rec.level = LogLevel::debug;
        rec.logger = "swarm";
        rec.peer = addr.toString();
        if (res.error) rec.code = toString(res.error->code);
        if (auto const* e = roster_.find(addr)) rec.retries = static_cast<int>(e->failureCount);
        rec.msg = "permit released, " + std::to_string(res.piecesVerified) + " pieces verified";
        log_->log(std::move(rec));
    }


    void Coordinator::logProgress() {
        if (!log_) return;
        auto snap = pieces_.progressSnapshot();
        logger::LogRecord rec;
        rec.level = LogLevel::info;
        rec.logger = "swarm";
        rec.msg = "progress " + std::to_string(snap.piecesComplete) + "/" + std::to_string(snap.piecesTotal)
            + " pieces, " + std::to_string(snap.bytesVerified) + "/" + std::to_string(snap.totalBytes)
            + " bytes, " + std::to_string(sessions_.size()) + " peers, "
            + std::to_string(snap.hashFailures) + " hash failures";
        log_->log(std::move(rec));
    }

} // namespace bitleech::swarm
