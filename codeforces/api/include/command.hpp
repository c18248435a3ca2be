#pragma once
#include <string_view>
#include "expected.hpp"
#include "query_params.hpp"
#include "types.hpp"


namespace codeforces::api {


    /**
     * @brief One remote API method together with its arguments.
     *
     * ApiClient and ResponseDecoder only talk to commands through this
     * interface, so a new method is added by implementing it.
     */
    struct ICommand
    {
        virtual ~ICommand() = default;

        // e.g. "blogEntry.view"
        virtual std::string_view methodName() const = 0;

        // Unset optional arguments are left out; invalid arguments fail with invalid_parameter.
        virtual Expected<ParamMap> parameters() const = 0;

        virtual ResultTag expectedResultTag() const = 0;
    };


} // namespace codeforces::api
