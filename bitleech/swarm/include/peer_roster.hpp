#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <vector>
#include "../../common/include/error.hpp"
#include "../../common/include/types.hpp"


namespace bitleech::swarm {

    using Clock = std::chrono::steady_clock;

    struct RosterPolicy 
    {
        std::chrono::seconds retryBackoff{5};       // doubled per consecutive failure
        std::chrono::seconds maxBackoff{300};
        std::uint32_t maxPeerRetries{5};
        std::uint32_t maxTimeouts{1};               // PeerStalled / PeerTimeout retries
    };


    struct RosterEntry 
    {
        PeerAddr addr;
        Clock::time_point nextAttempt{};
        std::uint32_t failureCount{0};
        std::uint32_t timeoutCount{0};
        bool inSession{false};
        bool removed{false};

        bool eligible(Clock::time_point now) const { 
            return !removed && !inSession && now >= nextAttempt; 
        }
    };


    // Peers the coordinator may dial, with per-peer retry bookkeeping.
    class PeerRoster 
    {
    public:
        explicit PeerRoster(RosterPolicy policy = {});

        // Returns how many of the given peers were never seen before.
        std::size_t add(const std::vector<PeerAddr>& peers);

        // Round-robin over eligible peers; the returned peer is marked in-session.
        std::optional<PeerAddr> next(Clock::time_point now);

        void onSessionEnd(const PeerAddr& addr, const std::optional<Error>& err, Clock::time_point now);

        // True when every peer ever added has been removed.
        bool empty() const;
        std::size_t live() const;
        std::size_t inSession() const;
        std::optional<Clock::time_point> nextEligibleAt() const;

        const RosterEntry* find(const PeerAddr& addr) const;
        const std::vector<RosterEntry>& entries() const noexcept { return entries_; }

    private:
        void backoff(RosterEntry& e, Clock::time_point now);

        RosterPolicy policy_;
        std::vector<RosterEntry> entries_;
        std::set<PeerAddr> seen_;
        std::size_t cursor_{0};
    };

} // namespace bitleech::swarm
