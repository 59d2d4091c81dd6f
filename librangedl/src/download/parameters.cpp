// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "rangedl/core/logging.hpp"
#include "rangedl/download/parameters.hpp"

namespace rangedl::download
{
    auto default_part_determiner(std::int64_t total_size) -> std::int64_t
    {
        if (total_size < 1 * MiB)
        {
            return 1;
        }
        if (total_size < 10 * MiB)
        {
            return 4;
        }
        if (total_size < 100 * MiB)
        {
            return 16;
        }
        return 32;
    }

    auto validate(const DownloaderConfig& config) -> expected_t<void>
    {
        if (config.max_retries < 0)
        {
            return make_unexpected(
                fmt::format("max_retries must be non-negative, got {}", config.max_retries),
                rangedl_error_code::invalid_configuration
            );
        }

        if (config.max_concurrent <= 0 && config.max_concurrent != unlimited_concurrency)
        {
            return make_unexpected(
                fmt::format(
                    "max_concurrent must be positive or unlimited ({}), got {}",
                    unlimited_concurrency,
                    config.max_concurrent
                ),
                rangedl_error_code::invalid_configuration
            );
        }

        if (config.chunk_size.has_value() && config.chunk_size.value() <= 0)
        {
            return make_unexpected(
                fmt::format("chunk_size must be positive, got {}", config.chunk_size.value()),
                rangedl_error_code::invalid_configuration
            );
        }

        if (config.retry_wait.count() < 0)
        {
            return make_unexpected(
                "retry_wait must be non-negative",
                rangedl_error_code::invalid_configuration
            );
        }

        if (!(config.remote_fetch_params.connect_timeout_secs > 0.))
        {
            return make_unexpected(
                "connect_timeout_secs must be positive",
                rangedl_error_code::invalid_configuration
            );
        }

        if (!config.chunk_size.has_value() && config.part_determiner
            && config.chunk_size_determiner)
        {
            LOG_WARNING << "Both part_determiner and chunk_size_determiner are set, "
                           "chunk_size_determiner is ignored";
        }

        return {};
    }

    auto with_max_retries(int max_retries) -> DownloaderOption
    {
        return [max_retries](DownloaderConfig& config) { config.max_retries = max_retries; };
    }

    auto with_max_concurrent(int max_concurrent) -> DownloaderOption
    {
        return [max_concurrent](DownloaderConfig& config)
        { config.max_concurrent = max_concurrent; };
    }

    auto with_chunk_size(std::int64_t chunk_size) -> DownloaderOption
    {
        return [chunk_size](DownloaderConfig& config) { config.chunk_size = chunk_size; };
    }

    auto with_part_determiner(part_determiner_t determiner) -> DownloaderOption
    {
        return [determiner = std::move(determiner)](DownloaderConfig& config)
        { config.part_determiner = determiner; };
    }

    auto with_chunk_size_determiner(chunk_size_determiner_t determiner) -> DownloaderOption
    {
        return [determiner = std::move(determiner)](DownloaderConfig& config)
        { config.chunk_size_determiner = determiner; };
    }

    auto with_retry_wait(std::chrono::milliseconds wait) -> DownloaderOption
    {
        return [wait](DownloaderConfig& config) { config.retry_wait = wait; };
    }

    auto with_remote_fetch_params(RemoteFetchParams params) -> DownloaderOption
    {
        return [params = std::move(params)](DownloaderConfig& config)
        { config.remote_fetch_params = params; };
    }

    auto make_config(const std::vector<DownloaderOption>& options) -> DownloaderConfig
    {
        DownloaderConfig config;
        for (const auto& option : options)
        {
            if (option)
            {
                option(config);
            }
        }
        return config;
    }
}
