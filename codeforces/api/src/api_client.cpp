#include <chrono>
#include "../include/api_client.hpp"


namespace codeforces::api {

    namespace {

        using logger::LogLevel;
        using logger::LogRecord;

        constexpr std::string_view kSecretParams[] = {"apiKey", "apiSig"};

        long long millisSince(std::chrono::steady_clock::time_point t0) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        }

        const char* outcomeName(const Error* err) {
            if (!err) return "OK";
            switch (err->kind) {
                case ErrorKind::invalid_parameter: return "invalid";
                case ErrorKind::transport:         return "transport";
                case ErrorKind::api:               return "FAILED";
                case ErrorKind::decode:            return "decode";
            }
            return "unknown";
        }

    } // anonymous namespace


    std::string redactUrl(std::string_view url)
    {
        std::string out(url);

        for (auto name : kSecretParams) {
            std::size_t pos = 0;
            while ((pos = out.find(name, pos)) != std::string::npos) {
                const std::size_t eq = pos + name.size();
                const bool atBoundary = pos == 0 || out[pos - 1] == '?' || out[pos - 1] == '&';
                if (!atBoundary || eq >= out.size() || out[eq] != '=') { pos = eq; continue; }

                std::size_t end = out.find('&', eq + 1);
                if (end == std::string::npos) end = out.size();
                out.replace(eq + 1, end - eq - 1, "***");
                pos = eq + 4;
            }
        }
        return out;
    }


    ApiClient::ApiClient(std::shared_ptr<IHttpClient> http, ApiClientConfig cfg,
        std::shared_ptr<INonceSource> nonce, std::shared_ptr<IClock> clock,
        std::shared_ptr<logger::Logger> log)
        : http_(std::move(http)), cfg_(std::move(cfg)),
          signer_(std::move(nonce), std::move(clock)), log_(std::move(log)) {}


    std::string ApiClient::buildUrl(const SignedRequest& req) const
    {
        std::string url = cfg_.apiBase;
        if (!url.empty() && url.back() != '/') url.push_back('/');
        url += req.method;
        url.push_back('?');
        url += req.queryString();
        return url;
    }


    Expected<SignedRequest> ApiClient::prepare(const ICommand& cmd, const Credentials& creds) const
    {
        auto params = cmd.parameters();
        if (!params.has_value()) return Expected<SignedRequest>::failure(*params.error);

        return signer_.sign(cmd.methodName(), params.get(), creds);
    }


    Expected<HttpResponse> ApiClient::send(const SignedRequest& req) const
    {
        const std::string url = buildUrl(req);

        if (log_ && log_->enabled(LogLevel::debug)) {
            LogRecord rec;
            rec.level = LogLevel::debug;
            rec.logger = "ApiClient";
            rec.msg = "sending request";
            rec.method = req.method;
            rec.url = redactUrl(url);
            log_->log(std::move(rec));
        }

        auto resp = http_->get(url, cfg_.connectTimeoutSec, cfg_.transferTimeoutSec, cfg_.followRedirects);
        if (!resp.has_value()) {
            // keep the kind even if an injected client reports something else
            return Expected<HttpResponse>::failure(ErrorKind::transport, resp.error->message);
        }
        return resp;
    }


    Expected<ApiResult> ApiClient::execute(const ICommand& cmd, const Credentials& creds) const
    {
        const auto t0 = std::chrono::steady_clock::now();

        auto req = prepare(cmd, creds);
        if (!req.has_value()) {
            logOutcome(cmd, &*req.error, -1, millisSince(t0));
            return Expected<ApiResult>::failure(*req.error);
        }

        auto resp = send(req.get());
        if (!resp.has_value()) {
            logOutcome(cmd, &*resp.error, -1, millisSince(t0));
            return Expected<ApiResult>::failure(*resp.error);
        }

        const HttpResponse& http = resp.get();

        // Codeforces reports API failures with HTTP 400 and a FAILED envelope.
        if (http.status >= 400) {
            auto env = ResponseDecoder::decodeEnvelope(http.body);
            Error err = (env.has_value() && env.get().status == ResponseStatus::failed)
                ? Error{ErrorKind::api, env.get().comment.value_or(std::string{}), {}}
                : Error{ErrorKind::transport, "HTTP status " + std::to_string(http.status), {}};
            logOutcome(cmd, &err, http.status, millisSince(t0));
            return Expected<ApiResult>::failure(std::move(err));
        }

        auto result = ResponseDecoder::decode(http.body, cmd.expectedResultTag());
        logOutcome(cmd, result.has_value() ? nullptr : &*result.error, http.status, millisSince(t0));
        return result;
    }


    Expected<std::string> ApiClient::executeRaw(const ICommand& cmd, const Credentials& creds) const
    {
        const auto t0 = std::chrono::steady_clock::now();

        auto req = prepare(cmd, creds);
        if (!req.has_value()) {
            logOutcome(cmd, &*req.error, -1, millisSince(t0));
            return Expected<std::string>::failure(*req.error);
        }

        auto resp = send(req.get());
        if (!resp.has_value()) {
            logOutcome(cmd, &*resp.error, -1, millisSince(t0));
            return Expected<std::string>::failure(*resp.error);
        }

        logOutcome(cmd, nullptr, resp.get().status, millisSince(t0));
        return Expected<std::string>::success(std::move(resp.get().body));
    }


    void ApiClient::logOutcome(const ICommand& cmd, const Error* err, int httpStatus, long long elapsedMs) const
    {
        if (!log_) return;

        LogRecord rec;
        rec.logger = "ApiClient";
        rec.method = std::string(cmd.methodName());
        rec.status = outcomeName(err);
        rec.httpStatus = httpStatus;
        rec.elapsedMs = elapsedMs;

        if (!err) {
            rec.level = LogLevel::info;
            rec.msg = "request ok";
        } else {
            rec.level = err->kind == ErrorKind::transport ? LogLevel::error : LogLevel::warn;
            rec.msg = describe(*err);
        }
        log_->log(std::move(rec));
    }


} // namespace codeforces::api
