#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "expected.hpp"
#include "types.hpp"


namespace codeforces::api {


    enum class ResponseStatus { ok, failed };


    // Top level of every API response: {"status": ..., "result": ..., "comment": ...}
    struct Envelope
    {
        ResponseStatus status{ResponseStatus::ok};
        std::optional<std::string> comment;
        std::optional<nlohmann::json> result;
    };


    /**
     * @brief Turns a response body into the result shape a command asked for.
     *
     * Failures:
     * - body is not a JSON object, or status is missing/unknown -> decode
     * - status == "FAILED"                                      -> api (comment as message)
     * - result missing or not of the expected shape             -> decode, field names the JSON path
     *
     * Unknown members are ignored; optional members may be absent or null.
     */
    class ResponseDecoder
    {
    public:
        static Expected<Envelope> decodeEnvelope(std::string_view body);

        static Expected<ApiResult> decodeResult(const nlohmann::json& result, ResultTag tag);

        static Expected<ApiResult> decode(std::string_view body, ResultTag tag);
    };


} // namespace codeforces::api
