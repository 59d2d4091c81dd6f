// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_DOWNLOAD_SINK_HPP
#define RANGEDL_DOWNLOAD_SINK_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>

#include "rangedl/core/error_handling.hpp"
#include "rangedl/util/pfile.hpp"

namespace rangedl::download
{
    /**
     * Destination of a download, written at explicit offsets.
     *
     * Implementations must accept concurrent calls targeting disjoint ranges.
     */
    class PositionalSink
    {
    public:

        virtual ~PositionalSink() = default;

        PositionalSink(const PositionalSink&) = delete;
        PositionalSink& operator=(const PositionalSink&) = delete;
        PositionalSink(PositionalSink&&) = delete;
        PositionalSink& operator=(PositionalSink&&) = delete;

        /**
         * Write all of @p bytes at @p offset.
         *
         * @returns the number of bytes written. When it is smaller than the size of
         *          @p bytes, @p ec explains why.
         */
        std::size_t write_at(std::string_view bytes, std::int64_t offset, std::error_code& ec);

    protected:

        PositionalSink() = default;

    private:

        virtual std::size_t
        write_at_impl(std::string_view bytes, std::int64_t offset, std::error_code& ec) = 0;
    };

    /**
     * Sink writing into a local file.
     */
    class FileSink final : public PositionalSink
    {
    public:

        /**
         * Create or truncate @p path, with permissions 0644 when created.
         */
        [[nodiscard]] static auto open(const std::filesystem::path& path)
            -> expected_t<std::unique_ptr<FileSink>>;

        ~FileSink() override = default;

        [[nodiscard]] auto close() -> expected_t<void>;
        [[nodiscard]] auto path() const -> const std::filesystem::path&;

    private:

        FileSink(std::filesystem::path path, util::PFile file);

        std::size_t
        write_at_impl(std::string_view bytes, std::int64_t offset, std::error_code& ec) override;

        std::filesystem::path m_path;
        util::PFile m_file;
    };

    /**
     * In-memory sink, growing as needed.
     */
    class BufferSink final : public PositionalSink
    {
    public:

        BufferSink() = default;
        ~BufferSink() override = default;

        [[nodiscard]] auto str() const -> std::string;
        [[nodiscard]] auto size() const -> std::size_t;

    private:

        std::size_t
        write_at_impl(std::string_view bytes, std::int64_t offset, std::error_code& ec) override;

        mutable std::mutex m_mutex;
        std::string m_buffer;
    };
}

#endif
