#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"


namespace bitleech::tracker {

    using Clock = std::chrono::steady_clock;

    // Retry pacing for a tracker URL that failed to answer.
    struct EndpointPolicy 
    {
        std::chrono::seconds baseBackoff{5};        // doubled per consecutive failure
        std::chrono::seconds minBackoff{30};
        std::chrono::seconds maxBackoff{3600};
        std::uint32_t maxFailures{7};               // one more and the URL is dropped
    };


    // One announce URL and what the tracker told us last time.
    struct TrackerEndpoint 
    {
        std::string url;
        std::optional<std::string> trackerId;       // echoed back as "trackerid"
        std::uint32_t interval{0};
        std::uint32_t failureCount{0};
        std::optional<Clock::time_point> lastAnnounce;
        std::optional<Clock::time_point> retryAt;   // empty: may announce right away
        bool disabled{false};

        // Only "min interval" holds back the next announce; the coordinator decides when to re-announce.
        void onAnnounced(const AnnounceResponse& res, Clock::time_point now);
        void onFailed(Clock::time_point now, const EndpointPolicy& policy = {});
        bool ready(Clock::time_point now) const;
    };


    // BEP 12 tier: endpoints are tried front to back, a responsive one moves to the front.
    struct TrackerTier 
    {
        std::vector<TrackerEndpoint> endpoints;

        void promote(std::size_t index);
        bool anyReady(Clock::time_point now) const;
    };

} // namespace bitleech::tracker
