#pragma once
#include <utility>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include "peer_roster.hpp"
#include "../../common/include/expected.hpp"
#include "../../logger/logger.hpp"
#include "../../peer/include/peer_session.hpp"
#include "../../piece/include/piece_manager.hpp"
#include "../../tracker/include/peer_source.hpp"


namespace bitleech::swarm {

    namespace asio = boost::asio;

    struct CoordinatorConfig 
    {
        std::size_t maxConnections{10};             // K
        peer::SessionConfig session{};
        RosterPolicy roster{};
        std::chrono::seconds progressInterval{10};
        bool offloadHashing{false};
        std::size_t poolThreads{2};                 // tracker calls, plus hashing when offloaded
    };


    // Owns the roster and the connection permits, spawns sessions against the
    // shared piece manager and re-announces when the roster runs dry.
    class Coordinator 
    {
    public:
        Coordinator(asio::any_io_executor ex, piece::PieceManager& pieces,
                    std::shared_ptr<tracker::IPeerSource> source,
                    InfoHash infoHash, PeerID self, CoordinatorConfig cfg = {},
                    std::shared_ptr<logger::Logger> log = nullptr);
        ~Coordinator();

        Coordinator(const Coordinator&) = delete;
        Coordinator& operator=(const Coordinator&) = delete;

        // Completes once every piece is verified and finalized, or with
        // SwarmCorrupt, SwarmExhausted, StorageFailure or a tracker error.
        // Every spawned session has ended by the time it returns.
        asio::awaitable<Expected<void>> run();

        const PeerRoster& roster() const noexcept { return roster_; }
        std::size_t liveSessions() const noexcept { return sessions_.size(); }
        std::size_t sessionsSpawned() const noexcept { return spawned_; }

    private:
        asio::awaitable<Expected<std::vector<PeerAddr>>> fetchPeers();
        asio::awaitable<void> drain();
        void spawn(const PeerAddr& addr);
        void onSessionEnd(const PeerAddr& addr, const peer::SessionResult& res);
        void logProgress();
        tracker::TransferStats stats() const;

        asio::any_io_executor ex_;
        piece::PieceManager& pieces_;
        std::shared_ptr<tracker::IPeerSource> source_;
        InfoHash infoHash_;
        PeerID self_;
        CoordinatorConfig cfg_;
        std::shared_ptr<logger::Logger> log_;

        asio::thread_pool pool_;
        asio::steady_timer wake_;
        PeerRoster roster_;
        std::set<std::shared_ptr<peer::PeerSession>> sessions_;
        std::optional<Error> storageError_;
        std::size_t spawned_{0};
    };

} // namespace bitleech::swarm
