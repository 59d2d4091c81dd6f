// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_DOWNLOAD_FETCHER_HPP
#define RANGEDL_DOWNLOAD_FETCHER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "rangedl/core/cancellation.hpp"
#include "rangedl/core/error_handling.hpp"
#include "rangedl/download/chunk.hpp"
#include "rangedl/download/transport.hpp"

namespace rangedl::download
{
    struct FetchOptions
    {
        using failed_attempt_callback_t = std::function<void(int, const rangedl_error&)>;

        // Number of attempts; values lower than 1 still perform one attempt.
        int max_retries = 5;
        std::chrono::milliseconds retry_wait = std::chrono::milliseconds(0);
        // Called after each failed attempt with its number (starting at 1) and its error.
        failed_attempt_callback_t on_failed_attempt = nullptr;
    };

    /**
     * Fetch @p chunk with ranged GET requests and stream the body into its sink.
     *
     * Every attempt starts from the beginning of the chunk and re-issues its full range.
     * An attempt fails on a transport error, a status other than 206, a sink error or a
     * body shorter than the chunk. Cancellation is never retried.
     *
     * @returns the number of bytes written for the chunk, i.e. its size.
     */
    [[nodiscard]] auto fetch_chunk(
        Transport& transport,
        const std::string& url,
        Chunk& chunk,
        const FetchOptions& options,
        const CancellationToken& token
    ) -> expected_t<std::int64_t>;
}

#endif
