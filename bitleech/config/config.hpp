#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../common/include/expected.hpp"
#include "../common/include/types.hpp"
#include "../logger/logger.hpp"
#include "../piece/include/piece_store.hpp"


namespace bitleech::config {

    struct ClientConfig 
    {
        std::string torrentPath;
        std::string outputDir{"."};

        // wire and scheduling
        std::uint32_t blockSize{16384};
        std::size_t maxConnections{10};                 // K
        std::size_t window{5};                          // W
        std::chrono::seconds requestTimeout{30};
        std::chrono::seconds idleTimeout{120};
        std::chrono::seconds keepAlive{90};
        std::chrono::seconds connectTimeout{10};
        std::chrono::milliseconds tickInterval{1000};

        // peer retry policy
        std::chrono::seconds retryBackoff{5};
        std::chrono::seconds maxBackoff{300};
        std::uint32_t maxPeerRetries{5};

        // verification
        std::optional<std::size_t> corruptThreshold;    // defaults to maxConnections
        bool offloadHashing{false};
        std::size_t hashThreads{2};
        bool bufferPiecesInMemory{true};
        piece::FileLayout fileLayout{piece::FileLayout::globalOffset};

        // tracker
        std::optional<PeerID> peerId;
        std::uint16_t port{6881};
        std::uint32_t numwant{50};

        // logging
        logger::LogLevel logLevel{logger::LogLevel::info};
        std::string logFile;
        std::chrono::seconds progressInterval{10};

        std::size_t effectiveCorruptThreshold() const { return corruptThreshold.value_or(maxConnections); }
    };


    // bitleech <file.torrent> [--key=value ...]
    Expected<ClientConfig> parseArgs(int argc, const char* const* argv);
    Expected<ClientConfig> parseArgs(const std::vector<std::string>& args);

    // Cross-field checks, also run by parseArgs.
    Expected<void> validate(const ClientConfig& cfg);

    std::string usage(const std::string& prog);

    // "-BL0001-" followed by 12 random alphanumerics.
    PeerID generatePeerId();

    std::optional<logger::LogLevel> parseLogLevel(const std::string& s);

} // namespace bitleech::config
