// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "rangedl/download/transport.hpp"
#include "rangedl/util/string.hpp"

namespace rangedl::download
{
    namespace http
    {
        auto is_success(int http_status) -> bool
        {
            return http_status / 100 == 2;
        }
    }

    auto TransferData::header(std::string_view name) const -> std::optional<std::string>
    {
        if (auto it = headers.find(util::to_lower(name)); it != headers.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    auto Transport::perform(const TransferRequest& request, const CancellationToken& token)
        -> expected_t<TransferData>
    {
        if (token.is_cancelled())
        {
            return make_unexpected(
                fmt::format("Request to {} cancelled", request.url),
                rangedl_error_code::cancelled
            );
        }
        return perform_impl(request, token);
    }
}
