// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_DOWNLOAD_PARAMETERS_HPP
#define RANGEDL_DOWNLOAD_PARAMETERS_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "rangedl/core/error_handling.hpp"

namespace rangedl::download
{
    inline constexpr std::int64_t KiB = std::int64_t(1) << 10;
    inline constexpr std::int64_t MiB = std::int64_t(1) << 20;
    inline constexpr std::int64_t GiB = std::int64_t(1) << 30;

    /// Value of `DownloaderConfig::max_concurrent` meaning "one worker per chunk".
    inline constexpr int unlimited_concurrency = -1;

    /// Maps the total size of a resource to a number of chunks.
    using part_determiner_t = std::function<std::int64_t(std::int64_t)>;
    /// Maps the total size of a resource to the size of each chunk.
    using chunk_size_determiner_t = std::function<std::int64_t(std::int64_t)>;

    /**
     * Built-in part determiner: 1 part under 1 MiB, 4 under 10 MiB, 16 under 100 MiB,
     * 32 otherwise.
     */
    [[nodiscard]] auto default_part_determiner(std::int64_t total_size) -> std::int64_t;

    struct RemoteFetchParams
    {
        // ssl_verify can be either an empty string (regular SSL verification),
        // the string "<false>" to indicate no SSL verification, or a path to
        // a directory with cert files, or a cert file.
        std::string ssl_verify = "";
        bool ssl_no_revoke = false;

        std::string user_agent = "rangedl";

        double connect_timeout_secs = 10.;
        // Abort transfers slower than 30 bytes/s for 60 seconds.
        bool low_speed_limit = true;

        // Forward libcurl debug output to the "libcurl" logger.
        bool verbose = false;
    };

    struct DownloaderConfig
    {
        // Number of attempts for each chunk. A value of 0 still performs one attempt.
        int max_retries = 5;

        // Maximum number of chunks fetched at the same time, or `unlimited_concurrency`.
        int max_concurrent = unlimited_concurrency;

        // Forces a fixed chunk size. Takes precedence over both determiners.
        std::optional<std::int64_t> chunk_size = std::nullopt;

        // Takes precedence over `chunk_size_determiner` when both are set.
        part_determiner_t part_determiner = nullptr;
        chunk_size_determiner_t chunk_size_determiner = nullptr;

        // Pause between two attempts of the same chunk.
        std::chrono::milliseconds retry_wait = std::chrono::milliseconds(0);

        RemoteFetchParams remote_fetch_params = {};
    };

    /**
     * Check that the configuration can be used for a download.
     *
     * Setting both determiners is accepted, the part determiner is used.
     */
    [[nodiscard]] auto validate(const DownloaderConfig& config) -> expected_t<void>;

    /*************************
     * Configuration options *
     *************************/

    using DownloaderOption = std::function<void(DownloaderConfig&)>;

    [[nodiscard]] auto with_max_retries(int max_retries) -> DownloaderOption;
    [[nodiscard]] auto with_max_concurrent(int max_concurrent) -> DownloaderOption;
    [[nodiscard]] auto with_chunk_size(std::int64_t chunk_size) -> DownloaderOption;
    [[nodiscard]] auto with_part_determiner(part_determiner_t determiner) -> DownloaderOption;
    [[nodiscard]] auto with_chunk_size_determiner(chunk_size_determiner_t determiner)
        -> DownloaderOption;
    [[nodiscard]] auto with_retry_wait(std::chrono::milliseconds wait) -> DownloaderOption;
    [[nodiscard]] auto with_remote_fetch_params(RemoteFetchParams params) -> DownloaderOption;

    /// Apply @p options in order on top of a default configuration.
    [[nodiscard]] auto make_config(const std::vector<DownloaderOption>& options)
        -> DownloaderConfig;
}

#endif
