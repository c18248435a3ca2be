#pragma once
#include <optional>
#include <string>


namespace codeforces::api {

    enum class ErrorKind { invalid_parameter, transport, api, decode };

    struct Error {
    ErrorKind kind{ErrorKind::transport};
    std::string message;
    std::string field; // JSON path of the offending field (decode errors only)
    };

    const char* kindName(ErrorKind kind);
    std::string describe(const Error& err);


    template <typename T>
    struct Expected
    {
        std::optional<T> value;
        std::optional<Error> error;


        static Expected success(T v) {
            Expected e; e.value = std::move(v);
            return e;
        }
        static Expected failure(Error err) {
            Expected e; e.error = std::move(err);
            return e;
        }
        static Expected failure(ErrorKind kind, std::string msg, std::string field = {}) {
            return failure(Error{kind, std::move(msg), std::move(field)});
        }
        bool has_value() const { return value.has_value(); }
        T& get() { return *value; }
        const T& get() const { return *value; }
    };


    template <>
    struct Expected<void>
    {
        std::optional<Error> error;
        static Expected success() { return {}; }
        static Expected failure(Error err) { Expected e; e.error = std::move(err); return e; }
        static Expected failure(ErrorKind kind, std::string msg) { return failure(Error{kind, std::move(msg), {}}); }
        bool has_value() const { return !error.has_value(); }
    };


} // namespace codeforces::api
