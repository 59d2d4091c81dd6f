// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_DOWNLOAD_DOWNLOADER_HPP
#define RANGEDL_DOWNLOAD_DOWNLOADER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "rangedl/core/cancellation.hpp"
#include "rangedl/core/error_handling.hpp"
#include "rangedl/download/parameters.hpp"
#include "rangedl/download/prober.hpp"
#include "rangedl/download/sink.hpp"
#include "rangedl/download/transport.hpp"

namespace rangedl::download
{
    struct DownloadReport
    {
        std::int64_t bytes_written = 0;
        std::int64_t total_size = 0;
        ProbeStrategy strategy = ProbeStrategy::head;
        std::size_t chunk_count = 0;
        std::size_t batch_count = 0;
        // Failed attempts that were followed by another attempt of the same chunk
        int retried_attempts = 0;
    };

    /**
     * Downloads a single resource by fetching byte ranges of it in parallel.
     *
     * The resource is probed, split into chunks, and the chunks are grouped into
     * batches; each batch is fetched sequentially by its own thread. A download
     * either succeeds with every byte written, or returns the first error any
     * worker met. All the workers are joined before returning.
     */
    class Downloader
    {
    public:

        /// Uses the default configuration and a @ref CurlTransport.
        Downloader();
        explicit Downloader(DownloaderConfig config);
        /// A null @p transport is replaced by a @ref CurlTransport.
        Downloader(DownloaderConfig config, std::shared_ptr<Transport> transport);

        [[nodiscard]] auto config() const -> const DownloaderConfig&;

        /// Download @p url into @p filename, created or truncated.
        auto download(const std::string& url, const std::filesystem::path& filename)
            -> expected_t<std::int64_t>;

        auto download(
            const CancellationToken& token,
            const std::string& url,
            const std::filesystem::path& filename
        ) -> expected_t<std::int64_t>;

        auto download_to(const CancellationToken& token, const std::string& url, PositionalSink& sink)
            -> expected_t<std::int64_t>;

        auto
        download_with_report(const CancellationToken& token, const std::string& url, PositionalSink& sink)
            -> expected_t<DownloadReport>;

    private:

        auto run(const CancellationToken& token, const std::string& url, PositionalSink& sink)
            -> expected_t<DownloadReport>;

        DownloaderConfig m_config;
        std::shared_ptr<Transport> p_transport;
    };

    [[nodiscard]] auto make_downloader() -> Downloader;
    [[nodiscard]] auto make_downloader(DownloaderConfig config) -> Downloader;
    [[nodiscard]] auto make_downloader_with_options(const std::vector<DownloaderOption>& options)
        -> Downloader;
}

#endif
