// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_DOWNLOAD_CHUNK_HPP
#define RANGEDL_DOWNLOAD_CHUNK_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace rangedl::download
{
    class PositionalSink;

    /**
     * A contiguous range of the remote resource, fetched by a single ranged request.
     *
     * `start` and `size` never change; the cursor counts the bytes already written
     * into the sink for the current attempt. A chunk is owned by one worker at a time.
     */
    class Chunk
    {
    public:

        Chunk(std::int64_t start, std::int64_t size, PositionalSink& sink);

        [[nodiscard]] auto start() const noexcept -> std::int64_t;
        [[nodiscard]] auto size() const noexcept -> std::int64_t;
        [[nodiscard]] auto cursor() const noexcept -> std::int64_t;
        /// Offset of the last byte of the chunk (inclusive).
        [[nodiscard]] auto last() const noexcept -> std::int64_t;
        [[nodiscard]] auto is_complete() const noexcept -> bool;

        /// Value of the Range header requesting this chunk, e.g. "bytes=0-1023".
        [[nodiscard]] auto bytes_range() const -> std::string;

        /**
         * Write @p bytes in the sink at `start + cursor` and advance the cursor.
         *
         * Bytes that would go past the end of the chunk are dropped: once the chunk is
         * complete, writing returns 0 without error.
         */
        auto write(std::string_view bytes, std::error_code& ec) -> std::size_t;

        /// Move the cursor back to the beginning of the chunk.
        void rewind() noexcept;

    private:

        std::int64_t m_start;
        std::int64_t m_size;
        std::int64_t m_cursor = 0;
        PositionalSink* p_sink;
    };

    [[nodiscard]] auto to_string(const Chunk& chunk) -> std::string;
}

#endif
