#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../../common/include/types.hpp"


namespace bitleech::tracker {


    enum class AnnounceEvent { none, started, completed, stopped };

    const char* eventName(AnnounceEvent ev) noexcept;


    struct AnnounceRequest 
    {
        InfoHash infoHash;
        PeerID peerId;
        std::uint16_t port{6881};
        std::uint64_t uploaded{0};
        std::uint64_t downloaded{0};
        std::uint64_t left{0};
        AnnounceEvent event{AnnounceEvent::none};
        std::uint32_t numwant{50};
        bool compact{true};
        std::optional<std::string> trackerId;
    };


    struct AnnounceResponse 
    {
        std::uint32_t interval{1800};
        std::optional<std::uint32_t> minInterval;
        std::uint32_t complete{0}; // seeders
        std::uint32_t incomplete{0}; // leechers
        std::vector<PeerAddr> peers;
        std::optional<std::string> warning;
        std::optional<std::string> trackerId;
    };

    
} // namespace bitleech::tracker
