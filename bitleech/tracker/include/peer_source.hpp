#pragma once
#include <cstdint>
#include <vector>
#include "../../common/include/expected.hpp"
#include "../../common/include/types.hpp"


namespace bitleech::tracker {

    struct TransferStats 
    {
        std::uint64_t uploaded{0};
        std::uint64_t downloaded{0};
        std::uint64_t left{0};
    };

    // Where the coordinator gets its roster from. Calls may block; the
    // coordinator runs them off the scheduler thread.
    class IPeerSource 
    {
    public:
        virtual ~IPeerSource() = default;
        virtual Expected<std::vector<PeerAddr>> fetchPeers(const TransferStats& stats) = 0;
        virtual void notifyCompleted(const TransferStats&) {}
    };

} // namespace bitleech::tracker
