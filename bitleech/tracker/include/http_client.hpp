#pragma once
#include <string>
#include "../../common/include/expected.hpp"


namespace bitleech::tracker {


struct HttpResponse { int status{0}; std::string body; };


// Transport failures come back as TrackerUnreachable.
struct IHttpClient 
{
    virtual ~IHttpClient() = default;
    virtual Expected<HttpResponse> get(const std::string& url, int connectTimeoutSec, int transferTimeoutSec, bool followRedirects) = 0;
};


} // namespace bitleech::tracker
