#include <curl/curl.h>
#include <string>
#include <memory>
#include "../include/http_client.hpp"

namespace codeforces::api {

    namespace {

        // libcurl write callback
        size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            size_t realSize = size * nmemb;
            auto* buffer = static_cast<std::string*>(userp);
            buffer->append(static_cast<char*>(contents), realSize);
            return realSize;
        }

        struct CurlEasyDeleter {
            void operator()(CURL* c) const { curl_easy_cleanup(c); }
        };

    } // anonymous namespace


    class HttpClientCurl : public IHttpClient
    {
    public:
        HttpClientCurl() {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~HttpClientCurl() override {
            curl_global_cleanup();
        }

        Expected<HttpResponse> get(const std::string& url,
                                int connectTimeout,
                                int totalTimeout,
                                bool followRedirects) override
        {
            std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());

            if (!curl) {
                return Expected<HttpResponse>::failure(ErrorKind::transport, "curl init failed");
            }

            std::string body;
            char errorBuffer[CURL_ERROR_SIZE] = {0};

            curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
            curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
            curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(connectTimeout));
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(totalTimeout));
            curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, followRedirects ? 1L : 0L);
            curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "codeforces-api-cpp/0.1");

            CURLcode res = curl_easy_perform(curl.get());
            long statusCode = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &statusCode);

            if (res != CURLE_OK) {
                return Expected<HttpResponse>::failure(ErrorKind::transport,
                    std::string("curl error: ") +
                    (errorBuffer[0] ? errorBuffer : curl_easy_strerror(res))
                );
            }

            return Expected<HttpResponse>::success(
                HttpResponse{static_cast<int>(statusCode), std::move(body)}
            );
        }
    };


    // Factory helper: link this TU and call for production
    std::shared_ptr<IHttpClient> makeCurlClient() {
        return std::make_shared<HttpClientCurl>();
    }

} // namespace codeforces::api
