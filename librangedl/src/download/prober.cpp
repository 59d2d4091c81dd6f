// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "rangedl/core/logging.hpp"
#include "rangedl/download/prober.hpp"
#include "rangedl/util/string.hpp"

namespace rangedl::download
{
    namespace
    {
        auto requalify_transfer_error(const rangedl_error& error, const std::string& url)
            -> tl::unexpected<rangedl_error>
        {
            if (error.error_code() == rangedl_error_code::cancelled)
            {
                return tl::make_unexpected(error);
            }
            return requalify(
                error,
                fmt::format("Could not probe {}", url),
                rangedl_error_code::probe_transport
            );
        }

        enum class head_outcome
        {
            found,
            fallback,
        };

        auto probe_with_head(
            Transport& transport,
            const std::string& url,
            const CancellationToken& token,
            RemoteResource& resource
        ) -> expected_t<head_outcome>
        {
            TransferRequest request;
            request.url = url;
            request.head_only = true;

            auto data = transport.perform(request, token);
            if (!data)
            {
                return requalify_transfer_error(data.error(), url);
            }

            const int status = data->http_status;
            if (status == http::METHOD_NOT_ALLOWED || status == http::FORBIDDEN)
            {
                LOG_DEBUG << "HEAD " << url << " rejected with status " << status
                          << ", falling back to a ranged GET";
                return head_outcome::fallback;
            }
            if (status == http::NOT_FOUND)
            {
                return make_unexpected(
                    fmt::format("Resource {} not found", url),
                    rangedl_error_code::resource_missing
                );
            }
            if (status == http::RANGE_NOT_SATISFIABLE)
            {
                return make_unexpected(
                    fmt::format("Server of {} does not support range requests", url),
                    rangedl_error_code::range_unsupported
                );
            }
            if (!http::is_success(status))
            {
                return make_unexpected(
                    fmt::format("HEAD {} failed with status {}", url, status),
                    rangedl_error_code::probe_failed
                );
            }

            if (auto accept_ranges = data->header("accept-ranges");
                accept_ranges.has_value() && util::to_lower(util::strip(accept_ranges.value())) == "none")
            {
                return make_unexpected(
                    fmt::format("Server of {} does not support range requests", url),
                    rangedl_error_code::range_unsupported,
                    "Accept-Ranges: none"
                );
            }

            auto content_length = data->header("content-length");
            if (!content_length.has_value())
            {
                LOG_DEBUG << "HEAD " << url << " reported no Content-Length, falling back to a ranged GET";
                return head_outcome::fallback;
            }
            auto size = util::parse_non_negative_int(util::strip(content_length.value()));
            if (!size.has_value())
            {
                LOG_DEBUG << "HEAD " << url << " reported an invalid Content-Length '"
                          << content_length.value() << "', falling back to a ranged GET";
                return head_outcome::fallback;
            }

            resource.total_size = size.value();
            resource.range_supported = true;
            resource.strategy = ProbeStrategy::head;
            return head_outcome::found;
        }

        auto probe_with_get_zero(Transport& transport, const std::string& url, const CancellationToken& token)
            -> expected_t<RemoteResource>
        {
            TransferRequest request;
            request.url = url;
            request.headers.push_back("Range: bytes=0-0");
            // Only the status and the headers matter, a server ignoring the range must
            // not stream the whole resource.
            request.on_response = [](const TransferData&) { return false; };

            auto data = transport.perform(request, token);
            if (!data)
            {
                return requalify_transfer_error(data.error(), url);
            }

            const int status = data->http_status;
            if (status == http::NOT_FOUND)
            {
                return make_unexpected(
                    fmt::format("Resource {} not found", url),
                    rangedl_error_code::resource_missing
                );
            }
            if (status == http::METHOD_NOT_ALLOWED || status == http::FORBIDDEN)
            {
                return make_unexpected(
                    fmt::format("Server of {} rejects both HEAD and ranged GET requests", url),
                    rangedl_error_code::method_not_supported,
                    fmt::format("status {}", status)
                );
            }
            if (status != http::PARTIAL_CONTENT)
            {
                return make_unexpected(
                    fmt::format("Server of {} does not support range requests", url),
                    rangedl_error_code::range_unsupported,
                    fmt::format("expected status {}, got {}", http::PARTIAL_CONTENT, status)
                );
            }

            auto content_range = data->header("content-range");
            if (!content_range.has_value())
            {
                return make_unexpected(
                    fmt::format("Could not find the size of {}", url),
                    rangedl_error_code::probe_failed,
                    "missing Content-Range header"
                );
            }
            auto total = parse_content_range_total(content_range.value());
            if (!total.has_value())
            {
                return make_unexpected(
                    fmt::format("Could not find the size of {}", url),
                    rangedl_error_code::probe_failed,
                    fmt::format("invalid Content-Range '{}'", content_range.value())
                );
            }

            return RemoteResource{ total.value(), true, ProbeStrategy::get_zero };
        }
    }

    auto name_of(ProbeStrategy strategy) noexcept -> const char*
    {
        switch (strategy)
        {
            case ProbeStrategy::get_zero:
                return "get-zero";
            case ProbeStrategy::head:
            default:
                return "head";
        }
    }

    auto parse_content_range_total(std::string_view content_range) -> std::optional<std::int64_t>
    {
        content_range = util::strip(content_range);
        if (!util::starts_with(util::to_lower(content_range), "bytes "))
        {
            return std::nullopt;
        }
        const auto slash = content_range.rfind('/');
        if (slash == std::string_view::npos)
        {
            return std::nullopt;
        }
        return util::parse_non_negative_int(util::strip(content_range.substr(slash + 1)));
    }

    auto probe_resource(Transport& transport, const std::string& url, const CancellationToken& token)
        -> expected_t<RemoteResource>
    {
        RemoteResource resource;
        auto outcome = probe_with_head(transport, url, token, resource);
        if (!outcome)
        {
            return forward_error(outcome);
        }

        if (outcome.value() == head_outcome::fallback)
        {
            auto fallback = probe_with_get_zero(transport, url, token);
            if (!fallback)
            {
                return forward_error(fallback);
            }
            resource = fallback.value();
        }

        LOG_INFO << "Probed " << url << " with " << name_of(resource.strategy) << ": "
                 << resource.total_size << " bytes";
        return resource;
    }
}
