#pragma once
#include <string>
#include "types.hpp"
#include "../../common/include/expected.hpp"


namespace bitleech::tracker {


    struct ITrackerClient 
    {
        virtual ~ITrackerClient() = default;
        virtual Expected<AnnounceResponse> announce(const AnnounceRequest& req, const std::string& announceUrl) = 0;
    };


} // namespace bitleech::tracker
