#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "expected.hpp"


namespace codeforces::api {


    // Several values rendered as one string, e.g. handles=tourist;Petr
    struct ParamList
    {
        std::vector<std::string> items;
        char separator{','};
    };

    using ParamValue = std::variant<std::string, std::int64_t, bool, ParamList>;

    std::string renderValue(const ParamValue& value);


    // One query parameter with its rendered, not yet percent-encoded value.
    struct QueryPair
    {
        std::string name;
        std::string value;
        auto operator<=>(const QueryPair&) const = default;
    };


    /**
     * @brief Named parameters of a single API call.
     *
     * Names are unique; optional parameters that are unset are never stored,
     * so they never reach the encoded query.
     */
    class ParamMap
    {
    public:
        Expected<void> add(std::string name, ParamValue value);

        template <typename T>
        Expected<void> addOptional(std::string name, const std::optional<T>& value) {
            if (!value) return Expected<void>::success();
            return add(std::move(name), ParamValue{*value});
        }

        bool contains(std::string_view name) const;
        const ParamValue* find(std::string_view name) const;
        std::size_t size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }

        const std::map<std::string, ParamValue, std::less<>>& entries() const noexcept { return entries_; }

    private:
        std::map<std::string, ParamValue, std::less<>> entries_;
    };


    std::string percentEncode(std::string_view raw);

    // Sorted by name, then by value. Identical input always gives identical output.
    std::vector<QueryPair> canonicalize(const ParamMap& params);

    // n1=v1&n2=v2 with values as rendered; this is the form the signature covers.
    std::string joinQuery(const std::vector<QueryPair>& pairs);

    // Same order as joinQuery, names and values percent-encoded for the URL.
    std::string encodeQuery(const std::vector<QueryPair>& pairs);


} // namespace codeforces::api
