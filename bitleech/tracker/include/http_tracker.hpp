#pragma once
#include <string>
#include <string_view>
#include <memory>
#include "iclient.hpp"
#include "http_client.hpp"


namespace bitleech::tracker {


    struct HttpTrackerConfig 
    {
        int connectTimeoutSec{8};
        int transferTimeoutSec{10};
        bool followRedirects{true};
    };


    class HttpTracker : public ITrackerClient 
    {
    public:
        explicit HttpTracker(std::shared_ptr<IHttpClient> http, HttpTrackerConfig cfg = {});
        ~HttpTracker() override = default;


        Expected<AnnounceResponse> announce(const AnnounceRequest& req, const std::string& announceUrl) override;

        std::string buildAnnounceUrl(const std::string& base, const AnnounceRequest& req) const;
        Expected<AnnounceResponse> parseAnnounceBody(const std::string& body) const;

        static std::string percentEncode(std::string_view raw);
        static std::string percentEncodeBinary(const unsigned char* data, std::size_t len);

    private:
        std::shared_ptr<IHttpClient> http_;
        HttpTrackerConfig cfg_{};
    };


    // Factory (implemented in http_client_curl.cpp)
    std::shared_ptr<IHttpClient> makeCurlClient();


} // namespace bitleech::tracker
