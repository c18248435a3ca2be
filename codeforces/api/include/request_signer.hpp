#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "expected.hpp"
#include "query_params.hpp"


namespace codeforces::api {


    struct Credentials
    {
        std::string apiKey;
        std::string apiSecret; // hash input only, never sent
    };


    struct INonceSource
    {
        virtual ~INonceSource() = default;
        virtual std::string next() = 0;
    };


    struct IClock
    {
        virtual ~IClock() = default;
        virtual std::int64_t unixSeconds() = 0;
    };


    // Six random decimal digits per call; one engine per thread.
    class RandomNonceSource : public INonceSource
    {
    public:
        static constexpr std::size_t kWidth = 6;
        std::string next() override;
    };


    class SystemClock : public IClock
    {
    public:
        std::int64_t unixSeconds() override; // throws std::runtime_error before the epoch
    };


    struct SignedRequest
    {
        std::string method;
        std::vector<QueryPair> params; // canonical order, raw values, apiSig last

        std::string queryString() const { return encodeQuery(params); } // percent-encoded, as sent
        const std::string* find(std::string_view name) const;
    };


    /**
     * @brief Builds the authenticated parameter set for one API call.
     *
     * apiKey and time join the command parameters before canonicalization,
     * the signature covers all of them and is appended last:
     *
     *   apiSig = nonce + hex(sha512(nonce + "/" + method + "?" + query + "#" + secret))
     */
    class RequestSigner
    {
    public:
        RequestSigner(std::shared_ptr<INonceSource> nonce, std::shared_ptr<IClock> clock);

        Expected<SignedRequest> sign(std::string_view method, const ParamMap& params, const Credentials& creds) const;

        static std::string signature(std::string_view nonce, std::string_view method,
            const std::vector<QueryPair>& canonical, std::string_view secret);

        static std::string sha512Hex(std::string_view data);

    private:
        std::shared_ptr<INonceSource> nonce_;
        std::shared_ptr<IClock> clock_;
    };


} // namespace codeforces::api
