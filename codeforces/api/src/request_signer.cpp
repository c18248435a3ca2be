#include <array>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <openssl/sha.h>
#include "../include/request_signer.hpp"


namespace codeforces::api {

    namespace {

        constexpr std::string_view kReserved[] = {"apiKey", "time", "apiSig"};

    } // anonymous namespace


    std::string RandomNonceSource::next()
    {
        static thread_local std::mt19937 rng([]{
            std::random_device rd;
            std::seed_seq ss{rd(), rd(), rd(), rd(), rd(), rd()};
            return std::mt19937{ss};
        }());
        std::uniform_int_distribution<int> dist(0, 9);

        std::string nonce;
        nonce.reserve(kWidth);
        for (std::size_t i = 0; i < kWidth; ++i) {
            nonce.push_back(static_cast<char>('0' + dist(rng)));
        }
        return nonce;
    }


    std::int64_t SystemClock::unixSeconds()
    {
        auto since = std::chrono::system_clock::now().time_since_epoch();
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(since).count();
        if (secs < 0) throw std::runtime_error("system clock reads before the unix epoch");
        return static_cast<std::int64_t>(secs);
    }


    const std::string* SignedRequest::find(std::string_view name) const
    {
        for (const auto& p : params) {
            if (p.name == name) return &p.value;
        }
        return nullptr;
    }


    RequestSigner::RequestSigner(std::shared_ptr<INonceSource> nonce, std::shared_ptr<IClock> clock)
        : nonce_(std::move(nonce)), clock_(std::move(clock)) {}


    std::string RequestSigner::sha512Hex(std::string_view data)
    {
        std::array<unsigned char, SHA512_DIGEST_LENGTH> digest{};
        SHA512(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest.data());

        std::ostringstream oss;
        for (auto b : digest) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
        }
        return oss.str();
    }


    std::string RequestSigner::signature(std::string_view nonce, std::string_view method,
        const std::vector<QueryPair>& canonical, std::string_view secret)
    {
        std::string toHash;
        toHash.append(nonce);
        toHash.push_back('/');
        toHash.append(method);
        toHash.push_back('?');
        toHash += joinQuery(canonical);
        toHash.push_back('#');
        toHash.append(secret);

        return std::string(nonce) + sha512Hex(toHash);
    }


    Expected<SignedRequest> RequestSigner::sign(std::string_view method, const ParamMap& params, const Credentials& creds) const
    {
        if (method.empty()) return Expected<SignedRequest>::failure(ErrorKind::invalid_parameter, "method name is empty");
        if (creds.apiKey.empty()) return Expected<SignedRequest>::failure(ErrorKind::invalid_parameter, "api key is empty");
        if (creds.apiSecret.empty()) return Expected<SignedRequest>::failure(ErrorKind::invalid_parameter, "api secret is empty");

        for (auto name : kReserved) {
            if (params.contains(name)) {
                return Expected<SignedRequest>::failure(ErrorKind::invalid_parameter,
                    "parameter '" + std::string(name) + "' is reserved for authentication");
            }
        }

        ParamMap all = params;
        if (auto r = all.add("apiKey", creds.apiKey); !r.has_value()) return Expected<SignedRequest>::failure(*r.error);
        if (auto r = all.add("time", clock_->unixSeconds()); !r.has_value()) return Expected<SignedRequest>::failure(*r.error);

        SignedRequest req;
        req.method = std::string(method);
        req.params = canonicalize(all);

        const std::string nonce = nonce_->next();
        req.params.push_back(QueryPair{"apiSig", signature(nonce, method, req.params, creds.apiSecret)});

        return Expected<SignedRequest>::success(std::move(req));
    }


} // namespace codeforces::api
