#include <algorithm>
#include "../include/announcer.hpp"


namespace bitleech::tracker {

    using logger::LogLevel;

    Announcer::Announcer(const std::vector<std::vector<std::string>>& announceList,
                         InfoHash ih, PeerID pid, std::uint16_t port,
                         std::shared_ptr<ITrackerClient> client,
                         std::shared_ptr<logger::Logger> log)
        : infoHash_(ih), peerId_(pid), port_(port), client_(std::move(client)), log_(std::move(log))
    {
        tiers_.reserve(announceList.size());
        for (auto const& tierUrls : announceList) {
            TrackerTier tier;
            for (auto const& u : tierUrls) {
                tier.endpoints.push_back(TrackerEndpoint{ .url = u });
            }
            if (!tier.endpoints.empty()) tiers_.push_back(std::move(tier));
        }
    }


    std::vector<std::vector<std::string>> Announcer::tiersFor(const std::string& announce,
        const std::vector<std::vector<std::string>>& announceList)
    {
        for (auto const& tier : announceList) {
            if (!tier.empty()) return announceList;
        }
        return { { announce } };
    }


    static void logAnnounce(const std::shared_ptr<logger::Logger>& log, LogLevel lvl,
                            const TrackerEndpoint& ep, AnnounceEvent ev, std::string msg, const Error* err = nullptr)
    {
        if (!log || !log->enabled(lvl)) return;
        logger::LogRecord rec;
        rec.level = lvl;
        rec.logger = "announce";
        rec.url = ep.url;
        rec.event = eventName(ev);
        rec.retries = static_cast<int>(ep.failureCount);
        if (ep.interval) rec.interval = static_cast<int>(ep.interval);
        if (err) rec.code = toString(err->code);
        rec.msg = std::move(msg);
        log->log(std::move(rec));
    }


    Expected<AnnounceResponse> Announcer::tryOneTier(TrackerTier& tier, std::size_t tierIdx, const AnnounceRequest& base) {
        const auto now = Clock::now();
        std::optional<Error> lastErr;

        for (std::size_t i = 0; i < tier.endpoints.size(); ++i) {
            auto& ep = tier.endpoints[i];
            if (!ep.ready(now)) continue;

            AnnounceRequest req = base;
            req.trackerId = ep.trackerId;

            auto res = client_->announce(req, ep.url);
            if (!res.has_value()) {
                ep.onFailed(now, policy_);
                logAnnounce(log_, LogLevel::warn, ep, base.event, res.error->message, &*res.error);
                lastErr = *res.error;
                continue;
            }

            auto const& a = res.get();
            ep.onAnnounced(a, now);
            tier.promote(i);

            auto const& front = tier.endpoints.front();
            logAnnounce(log_, LogLevel::info, front, base.event,
                "tier " + std::to_string(tierIdx) + ": " + std::to_string(a.peers.size()) + " peers, "
                + std::to_string(a.complete) + " seeders, " + std::to_string(a.incomplete) + " leechers");
            if (a.warning) logAnnounce(log_, LogLevel::warn, front, base.event, "tracker warning: " + *a.warning);
            return res;
        }

        if (lastErr) return Expected<AnnounceResponse>::failure(std::move(*lastErr));
        return Expected<AnnounceResponse>::failure(ErrorCode::TrackerUnreachable,
            "tier " + std::to_string(tierIdx) + ": all endpoints backing off");
    }


    Expected<AnnounceResponse> Announcer::announce(AnnounceEvent ev, const TransferStats& stats) {
        AnnounceRequest req;
        req.infoHash = infoHash_; req.peerId = peerId_; req.port = port_;
        req.uploaded = stats.uploaded; req.downloaded = stats.downloaded; req.left = stats.left;
        req.event = ev; req.numwant = numwant_; req.compact = true;

        if (tiers_.empty()) return Expected<AnnounceResponse>::failure(ErrorCode::TrackerUnreachable, "no trackers");

        std::optional<Error> lastErr;
        for (std::size_t i = 0; i < tiers_.size(); ++i) {
            auto res = tryOneTier(tiers_[i], i, req);
            if (res.has_value()) return res;
            lastErr = *res.error;
        }
        return Expected<AnnounceResponse>::failure(std::move(*lastErr));
    }


    Expected<std::vector<PeerAddr>> Announcer::fetchPeers(const TransferStats& stats) {
        auto res = announce(started_ ? AnnounceEvent::none : AnnounceEvent::started, stats);
        if (!res.has_value()) return Expected<std::vector<PeerAddr>>::failure(std::move(*res.error));
        started_ = true;
        return Expected<std::vector<PeerAddr>>::success(std::move(res.get().peers));
    }


    void Announcer::notifyCompleted(const TransferStats& stats) {
        if (!started_) return;
        auto res = announce(AnnounceEvent::completed, stats);
        if (!res.has_value()) {
            BL_LOG(log_, LogLevel::warn, "announce") << "completed event not delivered: " << res.error->describe();
        }
    }


} // namespace bitleech::tracker
