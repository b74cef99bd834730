#include <curl/curl.h>
#include <string>
#include <memory>
#include <mutex>
#include "../include/http_client.hpp"

namespace bitleech::tracker {

    namespace {

        // libcurl write callback
        size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            size_t realSize = size * nmemb;
            auto* buffer = static_cast<std::string*>(userp);
            buffer->append(static_cast<char*>(contents), realSize);
            return realSize;
        }

        // curl_global_init is not thread-safe; do it once per process
        void globalInitOnce() {
            static std::once_flag flag;
            std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
        }

    } // anonymous namespace


    class HttpClientCurl : public IHttpClient 
    {
    public:
        HttpClientCurl() {
            globalInitOnce();
        }

        Expected<HttpResponse> get(const std::string& url,
                                int connectTimeout,
                                int totalTimeout,
                                bool followRedirects) override 
        {
            CURL* curl = curl_easy_init();
            
            if (!curl) {
                return Expected<HttpResponse>::failure(ErrorCode::TrackerUnreachable, "curl init failed");
            }

            std::string body;
            char errorBuffer[CURL_ERROR_SIZE] = {0};

            curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
            curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connectTimeout));
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(totalTimeout));
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, followRedirects ? 1L : 0L);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl, CURLOPT_USERAGENT, "bitleech/0.1");

            CURLcode res = curl_easy_perform(curl);
            long statusCode = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
            curl_easy_cleanup(curl);

            if (res != CURLE_OK) {
                return Expected<HttpResponse>::failure(ErrorCode::TrackerUnreachable,
                    std::string("curl error: ") +
                    (errorBuffer[0] ? errorBuffer : curl_easy_strerror(res))
                );
            }

            if (statusCode >= 400) {
                return Expected<HttpResponse>::failure(ErrorCode::TrackerUnreachable,
                    "HTTP status " + std::to_string(statusCode)
                );
            }

            return Expected<HttpResponse>::success(
                HttpResponse{static_cast<int>(statusCode), std::move(body)}
            );
        }
    };


    std::shared_ptr<IHttpClient> makeCurlClient() {
        return std::make_shared<HttpClientCurl>();
    }

} // namespace bitleech::tracker
