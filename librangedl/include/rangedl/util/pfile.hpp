// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_UTIL_PFILE_HPP
#define RANGEDL_UTIL_PFILE_HPP

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <system_error>

#include <tl/expected.hpp>

namespace rangedl::util
{
    /**
     * File descriptor opened for positional writes.
     *
     * Writes never move a shared file cursor, so several threads may write
     * through the same ``PFile`` as long as they target disjoint ranges.
     */
    class PFile
    {
    public:

        /**
         * Open a file for writing with the POSIX API, creating it if needed.
         *
         * In case of error, set the error code @p ec.
         *
         * @param truncate discard any previous content of the file.
         * @param permissions mode of the file when it is created.
         */
        static auto try_open_write(  //
            const std::filesystem::path& path,
            bool truncate,
            unsigned int permissions,
            std::error_code& ec
        ) -> PFile;

        static auto try_open_write(  //
            const std::filesystem::path& path,
            bool truncate = true,
            unsigned int permissions = 0644
        ) -> tl::expected<PFile, std::error_code>;

        PFile(PFile&& other) noexcept;
        auto operator=(PFile&& other) noexcept -> PFile&;

        PFile(const PFile&) = delete;
        auto operator=(const PFile&) -> PFile& = delete;

        /**
         * The destructor will close the file descriptor.
         *
         * Errors are reported on stderr only.
         * Explicitly call @ref try_close to get the error.
         */
        ~PFile();

        /**
         * Write all of @p bytes at @p offset.
         *
         * Interrupted and short writes are resumed. If an error occurs, @p ec is set and
         * the number of bytes written before the error is returned.
         */
        auto try_write_at(std::string_view bytes, std::int64_t offset, std::error_code& ec) noexcept
            -> std::size_t;

        void try_close(std::error_code& ec) noexcept;
        [[nodiscard]] auto try_close() noexcept -> tl::expected<void, std::error_code>;

        [[nodiscard]] auto is_open() const noexcept -> bool;
        [[nodiscard]] auto raw() const noexcept -> int;

    private:

        int m_fd = -1;

        explicit PFile(int fd);
    };
}
#endif
