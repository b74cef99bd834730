#include <utility>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include "../bitleech/config/config.hpp"
#include "../bitleech/logger/logger.hpp"
#include "../bitleech/metainfo/metainfo.hpp"
#include "../bitleech/piece/include/piece_manager.hpp"
#include "../bitleech/piece/include/piece_store.hpp"
#include "../bitleech/swarm/include/coordinator.hpp"
#include "../bitleech/tracker/include/announcer.hpp"
#include "../bitleech/tracker/include/http_tracker.hpp"

using namespace bitleech;
using logger::LogLevel;
namespace asio = boost::asio;


namespace {

    enum ExitCode : int {
        kComplete = 0,
        kUsage = 1,
        kMetainfoInvalid = 2,
        kTracker = 3,
        kSwarmExhausted = 4,
        kSwarmCorrupt = 5,
        kStorage = 6
    };

    int exitCodeFor(ErrorCode code) {
        switch (code) {
            case ErrorCode::TrackerUnreachable:
            case ErrorCode::TrackerFailure:
            case ErrorCode::TrackerMalformed:
                return kTracker;
            case ErrorCode::SwarmExhausted: return kSwarmExhausted;
            case ErrorCode::SwarmCorrupt:   return kSwarmCorrupt;
            case ErrorCode::StorageFailure: return kStorage;
            default:                        return kUsage;
        }
    }

    std::shared_ptr<logger::Logger> makeLogger(const config::ClientConfig& cfg) {
        std::shared_ptr<logger::ILoggerSink> sink;
        if (!cfg.logFile.empty()) {
            auto file = std::make_shared<logger::FileSink>(cfg.logFile);
            if (!file->good()) return nullptr;
            sink = file;
        } else {
            sink = std::make_shared<logger::StdoutSink>();
        }
        auto log = std::make_shared<logger::Logger>(sink);
        log->setLevel(cfg.logLevel);
        log->setRedactor([](std::string_view s) { return logger::redactQueryParam(s, "peer_id"); });
        return log;
    }

    swarm::CoordinatorConfig coordinatorConfig(const config::ClientConfig& cfg) {
        swarm::CoordinatorConfig c;
        c.maxConnections = cfg.maxConnections;
        c.session.window = cfg.window;
        c.session.requestTimeout = cfg.requestTimeout;
        c.session.idleTimeout = cfg.idleTimeout;
        c.session.keepAlive = cfg.keepAlive;
        c.session.connectTimeout = cfg.connectTimeout;
        c.session.tick = cfg.tickInterval;
        c.roster.retryBackoff = cfg.retryBackoff;
        c.roster.maxBackoff = cfg.maxBackoff;
        c.roster.maxPeerRetries = cfg.maxPeerRetries;
        c.progressInterval = cfg.progressInterval;
        c.offloadHashing = cfg.offloadHashing;
        c.poolThreads = cfg.hashThreads;
        return c;
    }

} // namespace


int main(int argc, char* argv[]) {
    auto parsed = config::parseArgs(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error->message << "\n" << config::usage(argc > 0 ? argv[0] : "bitleech");
        return kUsage;
    }
    const auto& cfg = parsed.get();

    auto log = makeLogger(cfg);
    if (!log) {
        std::cerr << "cannot open log file " << cfg.logFile << std::endl;
        return kUsage;
    }

    std::optional<metainfo::Metainfo> mi;
    try {
        mi = metainfo::Metainfo::fromFile(cfg.torrentPath);
    } catch (const ParseError& e) {
        BL_LOG(log, LogLevel::error, "main") << cfg.torrentPath << ": " << toString(e.code()) << ": " << e.what();
        return kMetainfoInvalid;
    }
    BL_LOG(log, LogLevel::info, "main") << mi->name() << " " << mi->totalLength() << " bytes in "
        << mi->pieceCount() << " pieces, info-hash " << mi->infoHash().toHex();

    const PeerID peerId = cfg.peerId ? *cfg.peerId : config::generatePeerId();

    auto client = std::make_shared<tracker::HttpTracker>(tracker::makeCurlClient());
    auto announcer = std::make_shared<tracker::Announcer>(
        tracker::Announcer::tiersFor(mi->announce(), mi->announceList()),
        mi->infoHash(), peerId, cfg.port, client, log);
    announcer->setNumwant(cfg.numwant);

    auto layout = piece::PieceLayout::fromMetainfo(*mi);
    auto opened = piece::FilePieceStore::open(cfg.outputDir, mi->files(), layout, cfg.fileLayout);
    if (!opened) {
        BL_LOG(log, LogLevel::error, "main") << opened.error->describe();
        return kStorage;
    }
    std::shared_ptr<piece::IPieceStore> store = std::move(opened.get());
    BL_LOG(log, LogLevel::info, "main") << "writing to " << cfg.outputDir << " (" << piece::toString(cfg.fileLayout) << ")";

    piece::PieceManagerConfig pcfg;
    pcfg.blockSize = cfg.blockSize;
    pcfg.bufferInMemory = cfg.bufferPiecesInMemory;
    pcfg.corruptThreshold = cfg.effectiveCorruptThreshold();
    piece::PieceManager pieces(layout, store, pcfg, log);

    asio::io_context io;
    swarm::Coordinator coordinator(io.get_executor(), pieces, announcer, mi->infoHash(), peerId,
                                   coordinatorConfig(cfg), log);

    std::optional<Expected<void>> result;
    std::exception_ptr failure;
    asio::co_spawn(io, [&coordinator] { return coordinator.run(); },
        [&](std::exception_ptr e, Expected<void> r) {
            failure = e;
            result = std::move(r);
        });
    io.run();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            BL_LOG(log, LogLevel::error, "main") << "download aborted: " << e.what();
        }
        return kUsage;
    }
    if (!result->has_value()) {
        BL_LOG(log, LogLevel::error, "main") << result->error->describe();
        return exitCodeFor(result->error->code);
    }
    BL_LOG(log, LogLevel::info, "main") << "complete: " << mi->name();
    return kComplete;
}
