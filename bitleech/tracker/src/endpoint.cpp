#include <algorithm>
#include "../include/endpoint.hpp"


namespace bitleech::tracker {


    void TrackerEndpoint::onAnnounced(const AnnounceResponse& res, Clock::time_point now) {
        lastAnnounce = now;
        interval = res.interval;
        failureCount = 0;
        if (res.trackerId) trackerId = res.trackerId;

        if (res.minInterval) retryAt = now + std::chrono::seconds(*res.minInterval);
        else retryAt.reset();
    }


    void TrackerEndpoint::onFailed(Clock::time_point now, const EndpointPolicy& policy) {
        ++failureCount;
        if (failureCount > policy.maxFailures) {
            disabled = true;
            return;
        }
        auto wait = policy.baseBackoff * (1u << std::min<std::uint32_t>(failureCount, 16));
        retryAt = now + std::clamp<std::chrono::seconds>(wait, policy.minBackoff, policy.maxBackoff);
    }


    bool TrackerEndpoint::ready(Clock::time_point now) const {
        return !disabled && (!retryAt || now >= *retryAt);
    }


    void TrackerTier::promote(std::size_t index) {
        if (index == 0 || index >= endpoints.size()) return;
        std::rotate(endpoints.begin(), endpoints.begin() + index, endpoints.begin() + index + 1);
    }


    bool TrackerTier::anyReady(Clock::time_point now) const {
        return std::any_of(endpoints.begin(), endpoints.end(),
            [&](const TrackerEndpoint& ep) { return ep.ready(now); });
    }

} // namespace bitleech::tracker
