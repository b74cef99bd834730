#pragma once
#include <memory>
#include <string>
#include <vector>
#include "endpoint.hpp"
#include "iclient.hpp"
#include "peer_source.hpp"
#include "../../logger/logger.hpp"


namespace bitleech::tracker {


    // Walks announce-list tiers (BEP 12) with per-endpoint failure backoff.
    class Announcer : public IPeerSource 
    {
    public:
        Announcer(const std::vector<std::vector<std::string>>& announceList,
            InfoHash ih, PeerID pid, std::uint16_t port,
            std::shared_ptr<ITrackerClient> client,
            std::shared_ptr<logger::Logger> log = nullptr);

        // announce-list when present, otherwise a single tier holding announce
        static std::vector<std::vector<std::string>> tiersFor(const std::string& announce,
            const std::vector<std::vector<std::string>>& announceList);

        Expected<AnnounceResponse> announce(AnnounceEvent ev, const TransferStats& stats);

        // First successful call is sent with event=started, later ones without an event.
        Expected<std::vector<PeerAddr>> fetchPeers(const TransferStats& stats) override;
        void notifyCompleted(const TransferStats& stats) override;

        bool started() const noexcept { return started_; }
        const std::vector<TrackerTier>& tiers() const noexcept { return tiers_; }
        void setNumwant(std::uint32_t n) { numwant_ = n; }
        void setPolicy(EndpointPolicy p) { policy_ = p; }

    private:
        InfoHash infoHash_{};
        PeerID peerId_{};
        std::uint16_t port_{};
        std::uint32_t numwant_{50};
        bool started_{false};
        EndpointPolicy policy_{};

        std::vector<TrackerTier> tiers_;
        std::shared_ptr<ITrackerClient> client_;
        std::shared_ptr<logger::Logger> log_;

        Expected<AnnounceResponse> tryOneTier(TrackerTier& tier, std::size_t tierIdx, const AnnounceRequest& base);
    };


} // namespace bitleech::tracker
