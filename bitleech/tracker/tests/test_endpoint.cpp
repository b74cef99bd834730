#include <catch2/catch_all.hpp>

#include <chrono>

#include "../include/endpoint.hpp"

using namespace bitleech::tracker;
using namespace std::chrono_literals;

namespace {
    AnnounceResponse answered(std::uint32_t interval, std::optional<std::uint32_t> minInterval = std::nullopt) {
        AnnounceResponse r;
        r.interval = interval;
        r.minInterval = minInterval;
        return r;
    }
}


TEST_CASE("TrackerEndpoint: fresh endpoint can announce") {
    TrackerEndpoint ep;
    CHECK(ep.ready(Clock::now()));
}

TEST_CASE("TrackerEndpoint: success without min interval leaves re-announce open") {
    auto now = Clock::now();
    TrackerEndpoint ep;
    ep.failureCount = 3;
    ep.retryAt = now + 1h;

    ep.onAnnounced(answered(60), now);
    CHECK(ep.failureCount == 0);
    CHECK(ep.interval == 60);
    CHECK(ep.lastAnnounce == now);
    CHECK(ep.ready(now));
}

TEST_CASE("TrackerEndpoint: min interval holds back the next announce") {
    auto now = Clock::now();
    TrackerEndpoint ep;
    ep.onAnnounced(answered(1800, 900), now);
    CHECK_FALSE(ep.ready(now + 899s));
    CHECK(ep.ready(now + 900s));
}

TEST_CASE("TrackerEndpoint: tracker id sticks until a new one arrives") {
    auto now = Clock::now();
    TrackerEndpoint ep;
    auto r = answered(60);
    r.trackerId = "abc";
    ep.onAnnounced(r, now);
    ep.onAnnounced(answered(60), now);
    CHECK(ep.trackerId == std::optional<std::string>("abc"));
}

TEST_CASE("TrackerEndpoint: failures back off exponentially within the floor and cap") {
    auto now = Clock::now();
    TrackerEndpoint ep;

    ep.onFailed(now);                       // 10s, raised to the 30s floor
    CHECK(ep.retryAt == now + 30s);
    ep.onFailed(now);                       // 20s -> 30s
    ep.onFailed(now);                       // 40s
    CHECK(ep.retryAt == now + 40s);
    ep.onFailed(now);
    CHECK(ep.retryAt == now + 80s);
    CHECK_FALSE(ep.ready(now + 79s));
    CHECK(ep.ready(now + 80s));

    EndpointPolicy tight;
    tight.maxBackoff = 60s;
    ep.onFailed(now, tight);
    CHECK(ep.retryAt == now + 60s);
}

TEST_CASE("TrackerEndpoint: disabled after too many failures") {
    auto now = Clock::now();
    EndpointPolicy p;
    p.maxFailures = 2;
    TrackerEndpoint ep;
    ep.onFailed(now, p);
    ep.onFailed(now, p);
    CHECK_FALSE(ep.disabled);
    ep.onFailed(now, p);
    CHECK(ep.disabled);
    CHECK_FALSE(ep.ready(now + 24h));
}

TEST_CASE("TrackerTier: promote moves one endpoint to the front and keeps the rest in order") {
    TrackerTier tier;
    for (auto u : {"http://a", "http://b", "http://c"}) tier.endpoints.push_back(TrackerEndpoint{ .url = u });

    tier.promote(2);
    CHECK(tier.endpoints[0].url == "http://c");
    CHECK(tier.endpoints[1].url == "http://a");
    CHECK(tier.endpoints[2].url == "http://b");

    tier.promote(0);
    tier.promote(7);
    CHECK(tier.endpoints[0].url == "http://c");
}

TEST_CASE("TrackerTier: anyReady follows the endpoints") {
    auto now = Clock::now();
    TrackerTier tier;
    tier.endpoints.push_back(TrackerEndpoint{ .url = "http://a" });
    tier.endpoints.push_back(TrackerEndpoint{ .url = "http://b" });

    CHECK(tier.anyReady(now));
    for (auto& ep : tier.endpoints) ep.onFailed(now);
    CHECK_FALSE(tier.anyReady(now));
    CHECK(tier.anyReady(now + 30s));
}
