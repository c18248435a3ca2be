#pragma once
#include <memory>
#include <string>
#include "expected.hpp"


namespace codeforces::api {


struct HttpResponse { int status{0}; std::string body; };


// Completed exchanges are returned whatever their status; only failures to talk to the server are errors.
struct IHttpClient
{
    virtual ~IHttpClient() = default;
    virtual Expected<HttpResponse> get(const std::string& url, int connectTimeoutSec, int transferTimeoutSec, bool followRedirects) = 0;
};


// Factory (implemented in http_client_curl.cpp)
std::shared_ptr<IHttpClient> makeCurlClient();


} // namespace codeforces::api
