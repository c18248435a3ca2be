#include <algorithm>
#include <iomanip>
#include <sstream>
#include "../include/query_params.hpp"


namespace codeforces::api {


    std::string renderValue(const ParamValue& value)
    {
        if (const auto* s = std::get_if<std::string>(&value)) return *s;
        if (const auto* i = std::get_if<std::int64_t>(&value)) return std::to_string(*i);
        if (const auto* b = std::get_if<bool>(&value)) return *b ? "true" : "false";

        const auto& list = std::get<ParamList>(value);
        std::string out;
        for (std::size_t i = 0; i < list.items.size(); ++i) {
            if (i) out.push_back(list.separator);
            out += list.items[i];
        }
        return out;
    }


    Expected<void> ParamMap::add(std::string name, ParamValue value)
    {
        if (name.empty()) return Expected<void>::failure(ErrorKind::invalid_parameter, "parameter name is empty");

        auto [it, inserted] = entries_.emplace(std::move(name), std::move(value));
        if (!inserted) return Expected<void>::failure(ErrorKind::invalid_parameter, "duplicate parameter '" + it->first + "'");

        return Expected<void>::success();
    }


    bool ParamMap::contains(std::string_view name) const {
        return entries_.find(name) != entries_.end();
    }


    const ParamValue* ParamMap::find(std::string_view name) const {
        auto it = entries_.find(name);
        return it == entries_.end() ? nullptr : &it->second;
    }


    std::string percentEncode(std::string_view raw)
    {
        std::ostringstream oss;
        for (unsigned char c : raw) {
            if ((c>='A'&&c<='Z')||(c>='a'&&c<='z')||(c>='0'&&c<='9')||c=='-'||c=='_'||c=='.'||c=='~') oss<<c;
            else {
                oss<<'%'<<std::uppercase<<std::hex<<std::setw(2)<<std::setfill('0')<<(int)c<<std::nouppercase<<std::dec;}
            }
        return oss.str();
    }


    std::vector<QueryPair> canonicalize(const ParamMap& params)
    {
        std::vector<QueryPair> out;
        out.reserve(params.size());

        for (auto const& [name, value] : params.entries()) {
            out.push_back(QueryPair{name, renderValue(value)});
        }

        // name first, value second: QueryPair's member order
        std::sort(out.begin(), out.end());
        return out;
    }


    std::string joinQuery(const std::vector<QueryPair>& pairs)
    {
        std::string out;
        for (const auto& p : pairs) {
            if (!out.empty()) out.push_back('&');
            out += p.name;
            out.push_back('=');
            out += p.value;
        }
        return out;
    }


    std::string encodeQuery(const std::vector<QueryPair>& pairs)
    {
        std::string out;
        for (const auto& p : pairs) {
            if (!out.empty()) out.push_back('&');
            out += percentEncode(p.name);
            out.push_back('=');
            out += percentEncode(p.value);
        }
        return out;
    }


} // namespace codeforces::api
