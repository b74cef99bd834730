#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "types.hpp"


namespace bitleech::tracker {

    // Inputs whose size is not a whole number of entries decode to an empty list.
    struct CompactPeerCodec 
    {
        static std::vector<PeerAddr> parseIPv4(std::string_view raw);
        static std::vector<PeerAddr> parseIPv6(std::string_view raw);
    };

} // namespace bitleech::tracker
