// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <exception>
#include <functional>
#include <system_error>
#include <thread>

#include <fmt/format.h>

#include "rangedl/core/logging.hpp"
#include "rangedl/download/curl_transport.hpp"
#include "rangedl/download/downloader.hpp"
#include "rangedl/download/fetcher.hpp"
#include "rangedl/download/planner.hpp"

#include "download_state.hpp"

namespace rangedl::download
{
    namespace
    {
        void run_batch(
            Transport& transport,
            const std::string& url,
            Batch& batch,
            const FetchOptions& options,
            const CancellationToken& token,
            DownloadState& state
        )
        {
            try
            {
                for (auto& chunk : batch)
                {
                    if (state.has_error())
                    {
                        return;
                    }
                    if (token.is_cancelled())
                    {
                        state.set_error(rangedl_error(
                            fmt::format("Download of {} cancelled", url),
                            rangedl_error_code::cancelled
                        ));
                        return;
                    }

                    auto written = fetch_chunk(transport, url, chunk, options, token);
                    if (!written)
                    {
                        state.set_error(std::move(written).error());
                        return;
                    }
                    state.add_written(written.value());
                    LOG_TRACE << "Fetched " << to_string(chunk);
                }
            }
            catch (const std::exception& e)
            {
                state.set_error(rangedl_error(
                    fmt::format("Download worker of {} failed", url),
                    rangedl_error_code::unknown,
                    e.what()
                ));
            }
            catch (...)
            {
                state.set_error(rangedl_error(
                    fmt::format("Download worker of {} failed", url),
                    rangedl_error_code::unknown,
                    "unknown exception"
                ));
            }
        }
    }

    /*****************************
     * Downloader implementation *
     *****************************/

    Downloader::Downloader()
        : Downloader(DownloaderConfig{})
    {
    }

    Downloader::Downloader(DownloaderConfig config)
        : Downloader(std::move(config), nullptr)
    {
    }

    Downloader::Downloader(DownloaderConfig config, std::shared_ptr<Transport> transport)
        : m_config(std::move(config))
        , p_transport(std::move(transport))
    {
        if (p_transport == nullptr)
        {
            p_transport = std::make_shared<CurlTransport>(m_config.remote_fetch_params);
        }
    }

    auto Downloader::config() const -> const DownloaderConfig&
    {
        return m_config;
    }

    auto Downloader::download(const std::string& url, const std::filesystem::path& filename)
        -> expected_t<std::int64_t>
    {
        return download(CancellationToken(), url, filename);
    }

    auto Downloader::download(
        const CancellationToken& token,
        const std::string& url,
        const std::filesystem::path& filename
    ) -> expected_t<std::int64_t>
    {
        if (auto valid = validate(m_config); !valid)
        {
            return forward_error(valid);
        }

        auto sink = FileSink::open(filename);
        if (!sink)
        {
            return forward_error(sink);
        }

        auto report = run(token, url, *sink.value());
        auto closed = sink.value()->close();
        if (!report)
        {
            if (!closed)
            {
                LOG_WARNING << closed.error().full_message();
            }
            return forward_error(report);
        }
        if (!closed)
        {
            return forward_error(closed);
        }
        return report->bytes_written;
    }

    auto
    Downloader::download_to(const CancellationToken& token, const std::string& url, PositionalSink& sink)
        -> expected_t<std::int64_t>
    {
        return download_with_report(token, url, sink)
            .map([](const DownloadReport& report) { return report.bytes_written; });
    }

    auto Downloader::download_with_report(
        const CancellationToken& token,
        const std::string& url,
        PositionalSink& sink
    ) -> expected_t<DownloadReport>
    {
        if (auto valid = validate(m_config); !valid)
        {
            return forward_error(valid);
        }
        return run(token, url, sink);
    }

    auto Downloader::run(const CancellationToken& token, const std::string& url, PositionalSink& sink)
        -> expected_t<DownloadReport>
    {
        auto resource = probe_resource(*p_transport, url, token);
        if (!resource)
        {
            return forward_error(resource);
        }

        DownloadReport report;
        report.total_size = resource->total_size;
        report.strategy = resource->strategy;
        if (report.total_size == 0)
        {
            LOG_INFO << "Nothing to download from " << url;
            return report;
        }

        auto chunks = plan_chunks(report.total_size, m_config, sink);
        report.chunk_count = chunks.size();
        auto batches = batch_chunks(std::move(chunks), m_config.max_concurrent);
        report.batch_count = batches.size();
        LOG_DEBUG << "Downloading " << url << " in " << report.chunk_count << " chunks and "
                  << report.batch_count << " batches";

        DownloadState state(report.total_size);

        FetchOptions options;
        options.max_retries = m_config.max_retries;
        options.retry_wait = m_config.retry_wait;
        const int max_attempts = std::max(options.max_retries, 1);
        options.on_failed_attempt = [&state, max_attempts](int attempt, const rangedl_error&)
        {
            if (attempt < max_attempts)
            {
                state.add_retry();
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(batches.size());
        for (auto& batch : batches)
        {
            try
            {
                workers.emplace_back(
                    run_batch,
                    std::ref(*p_transport),
                    std::cref(url),
                    std::ref(batch),
                    std::cref(options),
                    std::cref(token),
                    std::ref(state)
                );
            }
            catch (const std::system_error& e)
            {
                state.set_error(rangedl_error(
                    "Could not start a download worker",
                    rangedl_error_code::unknown,
                    e.what()
                ));
                break;
            }
        }

        for (auto& worker : workers)
        {
            worker.join();
        }

        if (auto error = state.first_error(); error.has_value())
        {
            return tl::make_unexpected(std::move(error).value());
        }

        report.bytes_written = state.written();
        report.retried_attempts = state.retries();
        if (report.bytes_written != state.total_bytes())
        {
            return make_unexpected(
                fmt::format(
                    "Downloaded {} bytes of {} while {} were expected",
                    report.bytes_written,
                    url,
                    state.total_bytes()
                ),
                rangedl_error_code::unknown
            );
        }

        LOG_INFO << "Downloaded " << report.bytes_written << " bytes from " << url;
        return report;
    }

    auto make_downloader() -> Downloader
    {
        return Downloader();
    }

    auto make_downloader(DownloaderConfig config) -> Downloader
    {
        return Downloader(std::move(config));
    }

    auto make_downloader_with_options(const std::vector<DownloaderOption>& options) -> Downloader
    {
        return Downloader(make_config(options));
    }
}
