// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <optional>
#include <thread>

#include <fmt/format.h>

#include "rangedl/core/logging.hpp"
#include "rangedl/download/fetcher.hpp"

namespace rangedl::download
{
    namespace
    {
        constexpr auto retry_wait_step = std::chrono::milliseconds(10);

        // Sleeps for @p duration, or less if the token fires in the meantime.
        void wait_before_retry(std::chrono::milliseconds duration, const CancellationToken& token)
        {
            const auto deadline = std::chrono::steady_clock::now() + duration;
            while (!token.is_cancelled())
            {
                const auto now = std::chrono::steady_clock::now();
                if (now >= deadline)
                {
                    break;
                }
                std::this_thread::sleep_for(
                    std::min<std::chrono::steady_clock::duration>(deadline - now, retry_wait_step)
                );
            }
        }

        auto fetch_attempt(
            Transport& transport,
            const std::string& url,
            Chunk& chunk,
            const CancellationToken& token
        ) -> expected_t<std::int64_t>
        {
            chunk.rewind();

            std::error_code write_ec;

            TransferRequest request;
            request.url = url;
            request.headers.push_back(fmt::format("Range: {}", chunk.bytes_range()));
            request.on_response = [](const TransferData& data)
            { return data.http_status == http::PARTIAL_CONTENT; };
            request.on_data = [&chunk, &write_ec](const char* buffer, std::size_t size) -> std::size_t
            {
                const auto remaining = static_cast<std::size_t>(chunk.size() - chunk.cursor());
                const std::size_t expected = std::min(size, remaining);
                std::error_code ec;
                const std::size_t written = chunk.write(std::string_view(buffer, size), ec);
                if (ec || written < expected)
                {
                    write_ec = ec ? ec : std::make_error_code(std::errc::io_error);
                    // Return a size _different_ than the expected write size to signal an error
                    return size == 0 ? 1 : 0;
                }
                // Bytes past the end of the chunk are dropped by the cursor
                return size;
            };

            auto data = transport.perform(request, token);

            if (write_ec)
            {
                return make_unexpected(
                    fmt::format("Could not write {} of {}", to_string(chunk), url),
                    rangedl_error_code::chunk_write,
                    write_ec.message()
                );
            }

            if (!data)
            {
                switch (data.error().error_code())
                {
                    case rangedl_error_code::cancelled:
                        return forward_error(data);
                    case rangedl_error_code::request_build:
                        return requalify(
                            data.error(),
                            fmt::format("Could not build the request for {}", chunk.bytes_range()),
                            rangedl_error_code::chunk_request_build
                        );
                    default:
                        return requalify(
                            data.error(),
                            fmt::format("Could not fetch {} of {}", chunk.bytes_range(), url),
                            rangedl_error_code::chunk_transport
                        );
                }
            }

            if (data->http_status != http::PARTIAL_CONTENT)
            {
                return make_unexpected(
                    fmt::format("Unexpected response to {} of {}", chunk.bytes_range(), url),
                    rangedl_error_code::chunk_status,
                    fmt::format("expected status {}, got {}", http::PARTIAL_CONTENT, data->http_status)
                );
            }

            if (!chunk.is_complete())
            {
                return make_unexpected(
                    fmt::format("Short read for {} of {}", chunk.bytes_range(), url),
                    rangedl_error_code::chunk_transport,
                    fmt::format("received {} of {} bytes", chunk.cursor(), chunk.size())
                );
            }

            return chunk.cursor();
        }
    }

    auto fetch_chunk(
        Transport& transport,
        const std::string& url,
        Chunk& chunk,
        const FetchOptions& options,
        const CancellationToken& token
    ) -> expected_t<std::int64_t>
    {
        const int max_attempts = std::max(options.max_retries, 1);
        std::optional<rangedl_error> last_error;

        for (int attempt = 1; attempt <= max_attempts; ++attempt)
        {
            if (attempt > 1 && options.retry_wait.count() > 0)
            {
                wait_before_retry(options.retry_wait, token);
            }

            auto result = fetch_attempt(transport, url, chunk, token);
            if (result)
            {
                return result;
            }
            if (result.error().error_code() == rangedl_error_code::cancelled)
            {
                return forward_error(result);
            }

            LOG_WARNING << "Attempt " << attempt << "/" << max_attempts << " for "
                        << to_string(chunk) << " failed: " << result.error().full_message();
            if (options.on_failed_attempt)
            {
                options.on_failed_attempt(attempt, result.error());
            }
            last_error = result.error();
        }

        return tl::make_unexpected(last_error.value());
    }
}
