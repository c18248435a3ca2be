#pragma once
#include <memory>
#include <string>
#include <string_view>
#include "command.hpp"
#include "expected.hpp"
#include "http_client.hpp"
#include "request_signer.hpp"
#include "response_decoder.hpp"
#include "types.hpp"
#include "../../logger/logger.hpp"


namespace codeforces::api {


    struct ApiClientConfig
    {
        std::string apiBase{"https://codeforces.com/api/"};
        int connectTimeoutSec{8};
        int transferTimeoutSec{30};
        bool followRedirects{true};
    };


    /**
     * @brief Signs commands, sends them through the injected transport and decodes the answer.
     *
     * Each call is independent: build params -> add apiKey/time -> canonicalize ->
     * sign -> GET -> decode. Nothing is cached or retried; the transport is the
     * only blocking point. Safe to share between threads if the injected
     * collaborators are.
     */
    class ApiClient
    {
    public:
        explicit ApiClient(std::shared_ptr<IHttpClient> http,
            ApiClientConfig cfg = {},
            std::shared_ptr<INonceSource> nonce = std::make_shared<RandomNonceSource>(),
            std::shared_ptr<IClock> clock = std::make_shared<SystemClock>(),
            std::shared_ptr<logger::Logger> log = nullptr);

        Expected<ApiResult> execute(const ICommand& cmd, const Credentials& creds) const;

        // Response body as received, without envelope or payload decoding.
        Expected<std::string> executeRaw(const ICommand& cmd, const Credentials& creds) const;

        Expected<SignedRequest> prepare(const ICommand& cmd, const Credentials& creds) const;

        std::string buildUrl(const SignedRequest& req) const;

        const ApiClientConfig& config() const noexcept { return cfg_; }

    private:
        std::shared_ptr<IHttpClient> http_;
        ApiClientConfig cfg_{};
        RequestSigner signer_;
        std::shared_ptr<logger::Logger> log_;

        Expected<HttpResponse> send(const SignedRequest& req) const;
        void logOutcome(const ICommand& cmd, const Error* err, int httpStatus, long long elapsedMs) const;
    };


    // Masks the values of apiKey and apiSig in a URL or query string.
    std::string redactUrl(std::string_view url);


} // namespace codeforces::api
