#include <catch2/catch_all.hpp>

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "../include/coordinator.hpp"
#include "../../metainfo/tests/torrent_builder.hpp"
#include "../../peer/tests/fake_seeder.hpp"

using namespace bitleech;
using namespace bitleech::swarm;
using namespace std::chrono_literals;
namespace asio = boost::asio;

namespace {

    // Hands out one scripted reply per announce; the last one repeats.
    class ScriptedSource : public tracker::IPeerSource 
    {
    public:
        std::deque<Expected<std::vector<PeerAddr>>> replies;

        Expected<std::vector<PeerAddr>> fetchPeers(const tracker::TransferStats& st) override {
            std::scoped_lock lk(mu);
            ++fetches;
            lastLeft = st.left;
            if (replies.empty()) return Expected<std::vector<PeerAddr>>::success({});
            auto r = replies.front();
            if (replies.size() > 1) replies.pop_front();
            return r;
        }

        void notifyCompleted(const tracker::TransferStats& st) override {
            std::scoped_lock lk(mu);
            ++completed;
            lastLeft = st.left;
        }

        std::mutex mu;
        int fetches{0};
        int completed{0};
        std::uint64_t lastLeft{0};
    };


    // io is declared last so pending handlers die before the piece manager they point at
    struct Swarm {
        std::string content;
        metainfo::Metainfo mi;
        std::shared_ptr<piece::MemoryPieceStore> store;
        piece::PieceManager pm;
        std::shared_ptr<ScriptedSource> source;
        PeerID me;
        asio::io_context io;

        explicit Swarm(piece::PieceManagerConfig pcfg = {})
            : mi(build()), store(std::make_shared<piece::MemoryPieceStore>(piece::PieceLayout::fromMetainfo(mi))),
              pm(piece::PieceLayout::fromMetainfo(mi), store, pcfg),
              source(std::make_shared<ScriptedSource>()) {
            me.bytes.fill('S');
        }

        metainfo::Metainfo build() {
            testing::TorrentBuilder tb;
            tb.pieceLength = 32768;
            tb.content = content = testing::makePayload(3 * 32768 - 500, 21);
            return tb.metainfo();
        }

        std::shared_ptr<testing::FakeSeeder> seeder(testing::SeederBehavior b) {
            auto s = std::make_shared<testing::FakeSeeder>(io, content, mi.pieceLength(), mi.infoHash(), std::move(b));
            s->start();
            return s;
        }

        void offer(std::vector<PeerAddr> peers) {
            source->replies.push_back(Expected<std::vector<PeerAddr>>::success(std::move(peers)));
        }

        std::optional<Expected<void>> run(Coordinator& c) {
            std::optional<Expected<void>> out;
            asio::co_spawn(io, [&c] { return c.run(); },
                [&](std::exception_ptr e, Expected<void> r) {
                    if (!e) out = std::move(r);
                    io.stop();
                });
            io.run_for(15s);
            return out;
        }

        bool storeMatches() const {
            auto const& got = store->contents();
            return got.size() == content.size() &&
                std::equal(content.begin(), content.end(), got.begin(),
                    [](char c, std::uint8_t u) { return static_cast<std::uint8_t>(c) == u; });
        }
    };

} // namespace


TEST_CASE("two seeders with complementary bitfields complete the torrent") {
    Swarm sw;
    auto a = sw.seeder({testing::bitsOf(3, {0, 2})});
    auto b = sw.seeder({testing::bitsOf(3, {1})});
    sw.offer({a->addr(), b->addr()});

    CoordinatorConfig cfg;
    cfg.maxConnections = GENERATE(1u, 2u, 10u);
    cfg.session.tick = 100ms;
    Coordinator coord(sw.io.get_executor(), sw.pm, sw.source, sw.mi.infoHash(), sw.me, cfg);

    auto r = sw.run(coord);
    REQUIRE(r.has_value());
    CHECK(r->has_value());
    CHECK(sw.pm.isDone());
    CHECK(sw.pm.progressSnapshot().blocksRequested == 0);
    CHECK(coord.liveSessions() == 0);
    CHECK(sw.store->finalizeCalls() == 1);
    CHECK(sw.storeMatches());
    CHECK(sw.source->completed == 1);
    CHECK(sw.source->lastLeft == 0);
    CHECK(a->blocksServed > 0);
    CHECK(b->blocksServed > 0);
}

TEST_CASE("hash checks on the pool reach the same end state") {
    Swarm sw;
    auto a = sw.seeder({testing::bitsOf(3, {0, 1, 2})});
    sw.offer({a->addr()});

    CoordinatorConfig cfg;
    cfg.offloadHashing = true;
    cfg.session.tick = 100ms;
    Coordinator coord(sw.io.get_executor(), sw.pm, sw.source, sw.mi.infoHash(), sw.me, cfg);

    auto r = sw.run(coord);
    REQUIRE(r.has_value());
    CHECK(r->has_value());
    CHECK(sw.storeMatches());
}

TEST_CASE("an empty tracker reply ends with SwarmExhausted") {
    Swarm sw;
    Coordinator coord(sw.io.get_executor(), sw.pm, sw.source, sw.mi.infoHash(), sw.me);

    auto r = sw.run(coord);
    REQUIRE(r.has_value());
    REQUIRE(r->error.has_value());
    CHECK(r->error->code == ErrorCode::SwarmExhausted);
    CHECK(sw.source->fetches == 2);
    CHECK(sw.store->finalizeCalls() == 0);
    CHECK(sw.source->completed == 0);
}

TEST_CASE("banned peers offered again do not count as new") {
    Swarm sw;
    testing::SeederBehavior bad{testing::bitsOf(3, {0, 1, 2})};
    InfoHash other;
    other.bytes.fill(0x42);
    bad.claimInfoHash = other;
    auto s = sw.seeder(std::move(bad));
    sw.offer({s->addr()});

    CoordinatorConfig cfg;
    cfg.session.tick = 100ms;
    Coordinator coord(sw.io.get_executor(), sw.pm, sw.source, sw.mi.infoHash(), sw.me, cfg);

    auto r = sw.run(coord);
    REQUIRE(r.has_value());
    REQUIRE(r->error.has_value());
    CHECK(r->error->code == ErrorCode::SwarmExhausted);
    CHECK(coord.roster().empty());
    CHECK(coord.sessionsSpawned() == 1);
}

TEST_CASE("the first announce failing is surfaced as is") {
    Swarm sw;
    sw.source->replies.push_back(
        Expected<std::vector<PeerAddr>>::failure(ErrorCode::TrackerUnreachable, "connection refused"));
    Coordinator coord(sw.io.get_executor(), sw.pm, sw.source, sw.mi.infoHash(), sw.me);

    auto r = sw.run(coord);
    REQUIRE(r.has_value());
    REQUIRE(r->error.has_value());
    CHECK(r->error->code == ErrorCode::TrackerUnreachable);
    CHECK(coord.sessionsSpawned() == 0);
}

TEST_CASE("a peer that only serves corrupt data trips SwarmCorrupt") {
    piece::PieceManagerConfig pcfg;
    pcfg.corruptThreshold = 1;
    Swarm sw(pcfg);
    testing::SeederBehavior b{testing::bitsOf(3, {0, 1, 2})};
    b.corrupt = true;
    auto s = sw.seeder(std::move(b));
    sw.offer({s->addr()});

    CoordinatorConfig cfg;
    cfg.session.tick = 100ms;
    Coordinator coord(sw.io.get_executor(), sw.pm, sw.source, sw.mi.infoHash(), sw.me, cfg);

    auto r = sw.run(coord);
    REQUIRE(r.has_value());
    REQUIRE(r->error.has_value());
    CHECK(r->error->code == ErrorCode::SwarmCorrupt);
    CHECK(coord.liveSessions() == 0);
    CHECK(sw.pm.progressSnapshot().blocksRequested == 0);
    CHECK_FALSE(sw.pm.isDone());
}
