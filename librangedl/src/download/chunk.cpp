// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>

#include "rangedl/download/chunk.hpp"
#include "rangedl/download/sink.hpp"

namespace rangedl::download
{
    Chunk::Chunk(std::int64_t start, std::int64_t size, PositionalSink& sink)
        : m_start(start)
        , m_size(size)
        , p_sink(&sink)
    {
    }

    auto Chunk::start() const noexcept -> std::int64_t
    {
        return m_start;
    }

    auto Chunk::size() const noexcept -> std::int64_t
    {
        return m_size;
    }

    auto Chunk::cursor() const noexcept -> std::int64_t
    {
        return m_cursor;
    }

    auto Chunk::last() const noexcept -> std::int64_t
    {
        return m_start + m_size - 1;
    }

    auto Chunk::is_complete() const noexcept -> bool
    {
        return m_cursor >= m_size;
    }

    auto Chunk::bytes_range() const -> std::string
    {
        return fmt::format("bytes={}-{}", m_start, last());
    }

    auto Chunk::write(std::string_view bytes, std::error_code& ec) -> std::size_t
    {
        if (is_complete())
        {
            return 0;
        }

        const auto remaining = static_cast<std::size_t>(m_size - m_cursor);
        const auto accepted = bytes.substr(0, std::min(remaining, bytes.size()));
        const std::size_t written = p_sink->write_at(accepted, m_start + m_cursor, ec);
        m_cursor += static_cast<std::int64_t>(written);
        return written;
    }

    void Chunk::rewind() noexcept
    {
        m_cursor = 0;
    }

    auto to_string(const Chunk& chunk) -> std::string
    {
        return fmt::format(
            "Chunk{{start={}, size={}, cursor={}}}",
            chunk.start(),
            chunk.size(),
            chunk.cursor()
        );
    }
}
