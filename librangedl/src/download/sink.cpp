// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "rangedl/download/sink.hpp"

namespace rangedl::download
{
    /*********************************
     * PositionalSink implementation *
     *********************************/

    std::size_t
    PositionalSink::write_at(std::string_view bytes, std::int64_t offset, std::error_code& ec)
    {
        if (offset < 0)
        {
            ec = std::make_error_code(std::errc::invalid_argument);
            return 0;
        }
        return write_at_impl(bytes, offset, ec);
    }

    /***************************
     * FileSink implementation *
     ***************************/

    auto FileSink::open(const std::filesystem::path& path) -> expected_t<std::unique_ptr<FileSink>>
    {
        auto file = util::PFile::try_open_write(path, /* truncate = */ true, 0644);
        if (!file)
        {
            return make_unexpected(
                fmt::format("Could not open file '{}' for writing", path.string()),
                rangedl_error_code::sink_failure,
                file.error().message()
            );
        }
        // Private constructor, std::make_unique cannot be used.
        return std::unique_ptr<FileSink>(new FileSink(path, std::move(file).value()));
    }

    FileSink::FileSink(std::filesystem::path path, util::PFile file)
        : m_path(std::move(path))
        , m_file(std::move(file))
    {
    }

    auto FileSink::close() -> expected_t<void>
    {
        if (auto res = m_file.try_close(); !res)
        {
            return make_unexpected(
                fmt::format("Could not close file '{}'", m_path.string()),
                rangedl_error_code::sink_failure,
                res.error().message()
            );
        }
        return {};
    }

    auto FileSink::path() const -> const std::filesystem::path&
    {
        return m_path;
    }

    std::size_t
    FileSink::write_at_impl(std::string_view bytes, std::int64_t offset, std::error_code& ec)
    {
        return m_file.try_write_at(bytes, offset, ec);
    }

    /*****************************
     * BufferSink implementation *
     *****************************/

    auto BufferSink::str() const -> std::string
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_buffer;
    }

    auto BufferSink::size() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_buffer.size();
    }

    std::size_t
    BufferSink::write_at_impl(std::string_view bytes, std::int64_t offset, std::error_code& /*ec*/)
    {
        const auto start = static_cast<std::size_t>(offset);
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_buffer.size() < start + bytes.size())
        {
            m_buffer.resize(start + bytes.size(), '\0');
        }
        m_buffer.replace(start, bytes.size(), bytes.data(), bytes.size());
        return bytes.size();
    }
}
