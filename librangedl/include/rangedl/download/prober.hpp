// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_DOWNLOAD_PROBER_HPP
#define RANGEDL_DOWNLOAD_PROBER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "rangedl/core/cancellation.hpp"
#include "rangedl/core/error_handling.hpp"
#include "rangedl/download/transport.hpp"

namespace rangedl::download
{
    enum class ProbeStrategy
    {
        head,
        get_zero,
    };

    [[nodiscard]] auto name_of(ProbeStrategy strategy) noexcept -> const char*;

    struct RemoteResource
    {
        std::int64_t total_size = 0;
        bool range_supported = false;
        ProbeStrategy strategy = ProbeStrategy::head;
    };

    /**
     * Parse the total length out of a `Content-Range` value such as "bytes 0-0/2048".
     *
     * Returns nothing when the value is malformed or the length is unknown ("*").
     */
    [[nodiscard]] auto parse_content_range_total(std::string_view content_range)
        -> std::optional<std::int64_t>;

    /**
     * Find the length of the resource at @p url and check that it can be fetched by ranges.
     *
     * A HEAD request is tried first. When the server rejects it (405 or 403) or does not
     * report a length, a GET with `Range: bytes=0-0` is sent and the length is read from
     * the `Content-Range` header of the 206 response. There is no retry.
     *
     * Error codes: `method_not_supported`, `resource_missing`, `range_unsupported`,
     * `probe_transport`, `probe_failed` and `cancelled`.
     */
    [[nodiscard]] auto
    probe_resource(Transport& transport, const std::string& url, const CancellationToken& token)
        -> expected_t<RemoteResource>;
}

#endif
