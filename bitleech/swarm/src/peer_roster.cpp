#include <algorithm>
#include "../include/peer_roster.hpp"


namespace bitleech::swarm {


    PeerRoster::PeerRoster(RosterPolicy policy) : policy_(policy) {}


    std::size_t PeerRoster::add(const std::vector<PeerAddr>& peers) {
        std::size_t fresh = 0;
        for (auto const& p : peers) {
            if (!seen_.insert(p).second) continue;
            entries_.push_back(RosterEntry{ .addr = p });
            ++fresh;
        }
        return fresh;
    }


    std::optional<PeerAddr> PeerRoster::next(Clock::time_point now) {
        if (entries_.empty()) return std::nullopt;
        for (std::size_t step = 0; step < entries_.size(); ++step) {
            auto& e = entries_[(cursor_ + step) % entries_.size()];
            if (!e.eligible(now)) continue;
            cursor_ = (cursor_ + step + 1) % entries_.size();
            e.inSession = true;
            return e.addr;
        }
        return std::nullopt;
    }


    void PeerRoster::backoff(RosterEntry& e, Clock::time_point now) {
        // retryBackoff * 2^(failures-1), capped
        auto shift = std::min<std::uint32_t>(e.failureCount > 0 ? e.failureCount - 1 : 0, 16);
        auto wait = policy_.retryBackoff * (1u << shift);
        e.nextAttempt = now + std::min<std::chrono::seconds>(wait, policy_.maxBackoff);
    }


    void PeerRoster::onSessionEnd(const PeerAddr& addr, const std::optional<Error>& err, Clock::time_point now) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
            [&](const RosterEntry& e) { return e.addr == addr; });
        if (it == entries_.end()) return;
        auto& e = *it;
        e.inSession = false;

        if (!err) {
            e.failureCount = 0;
            e.nextAttempt = now + policy_.retryBackoff;
            return;
        }

        if (isFatalForPeer(err->code)) {
            e.removed = true;
            return;
        }

        switch (err->code) {
            case ErrorCode::PeerStalled:
            case ErrorCode::PeerTimeout:
                if (++e.timeoutCount > policy_.maxTimeouts) {
                    e.removed = true;
                    return;
                }
                break;
            default:
                break;
        }

        if (++e.failureCount > policy_.maxPeerRetries) {
            e.removed = true;
            return;
        }
        backoff(e, now);
    }


    bool PeerRoster::empty() const {
        return live() == 0;
    }


    std::size_t PeerRoster::live() const {
        return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
            [](const RosterEntry& e) { return !e.removed; }));
    }


    std::size_t PeerRoster::inSession() const {
        return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
            [](const RosterEntry& e) { return e.inSession; }));
    }


    std::optional<Clock::time_point> PeerRoster::nextEligibleAt() const {
        std::optional<Clock::time_point> best;
        for (auto const& e : entries_) {
            if (e.removed || e.inSession) continue;
            if (!best || e.nextAttempt < *best) best = e.nextAttempt;
        }
        return best;
    }


    const RosterEntry* PeerRoster::find(const PeerAddr& addr) const {
        for (auto const& e : entries_) if (e.addr == addr) return &e;
        return nullptr;
    }


} // namespace bitleech::swarm
