#include "../include/expected.hpp"


namespace codeforces::api {


    const char* kindName(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::invalid_parameter: return "invalid parameter";
            case ErrorKind::transport:         return "transport";
            case ErrorKind::api:               return "codeforces api";
            case ErrorKind::decode:            return "decode";
        }
        return "unknown";
    }


    std::string describe(const Error& err) {
        std::string out = kindName(err.kind);
        out += ": ";
        out += err.message;
        if (!err.field.empty()) out += " (at " + err.field + ")";
        return out;
    }


} // namespace codeforces::api
