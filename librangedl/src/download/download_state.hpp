// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_DL_DOWNLOAD_STATE_HPP
#define RANGEDL_DL_DOWNLOAD_STATE_HPP

#include <cstdint>
#include <mutex>
#include <optional>

#include "rangedl/core/error_handling.hpp"

namespace rangedl::download
{
    /**
     * State shared by the workers of one download.
     *
     * The lock only covers the counters and the error, never a transfer or a log record.
     */
    class DownloadState
    {
    public:

        explicit DownloadState(std::int64_t total_bytes);

        void add_written(std::int64_t bytes);
        /// Only the first error is kept; @returns true if @p error was the first one.
        bool set_error(rangedl_error error);
        void add_retry();

        [[nodiscard]] auto has_error() const -> bool;
        [[nodiscard]] auto written() const -> std::int64_t;
        [[nodiscard]] auto total_bytes() const -> std::int64_t;
        [[nodiscard]] auto first_error() const -> std::optional<rangedl_error>;
        [[nodiscard]] auto retries() const -> int;

    private:

        mutable std::mutex m_mutex;
        std::int64_t m_total_bytes;
        std::int64_t m_written = 0;
        std::optional<rangedl_error> m_first_error = std::nullopt;
        int m_retries = 0;
    };
}

#endif
