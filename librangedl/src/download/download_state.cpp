// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <utility>

#include "rangedl/core/logging.hpp"

#include "download_state.hpp"

namespace rangedl::download
{
    DownloadState::DownloadState(std::int64_t total_bytes)
        : m_total_bytes(total_bytes)
    {
    }

    void DownloadState::add_written(std::int64_t bytes)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_written += bytes;
    }

    bool DownloadState::set_error(rangedl_error error)
    {
        const std::string message = error.full_message();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_first_error.has_value())
            {
                return false;
            }
            m_first_error = std::move(error);
        }
        LOG_ERROR << "Download failed: " << message;
        return true;
    }

    void DownloadState::add_retry()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_retries;
    }

    auto DownloadState::has_error() const -> bool
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_first_error.has_value();
    }

    auto DownloadState::written() const -> std::int64_t
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_written;
    }

    auto DownloadState::total_bytes() const -> std::int64_t
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_total_bytes;
    }

    auto DownloadState::first_error() const -> std::optional<rangedl_error>
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_first_error;
    }

    auto DownloadState::retries() const -> int
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_retries;
    }
}
