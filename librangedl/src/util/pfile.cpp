// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <iostream>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "rangedl/util/pfile.hpp"

namespace rangedl::util
{
    namespace
    {
        void try_close_impl(int fd, std::error_code& ec) noexcept
        {
            if (fd >= 0)
            {
                if (::close(fd) != 0)
                {
                    ec = std::error_code(errno, std::generic_category());
                }
            }
        }
    }

    PFile::PFile(int fd)
        : m_fd(fd)
    {
    }

    PFile::PFile(PFile&& other) noexcept
        : m_fd(std::exchange(other.m_fd, -1))
    {
    }

    auto PFile::operator=(PFile&& other) noexcept -> PFile&
    {
        std::swap(m_fd, other.m_fd);
        return *this;
    }

    PFile::~PFile()
    {
        auto ec = std::error_code();
        try_close_impl(m_fd, ec);
        if (ec)
        {
            std::cerr << "Developer error: error closing file in PFile::~PFile, "
                         "explicitly call PFile::try_close to handle error.\n";
        }
    }

    auto PFile::try_open_write(
        const std::filesystem::path& path,
        bool truncate,
        unsigned int permissions,
        std::error_code& ec
    ) -> PFile
    {
        int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
        if (truncate)
        {
            flags |= O_TRUNC;
        }
        const int fd = ::open(path.c_str(), flags, static_cast<::mode_t>(permissions));
        if (fd < 0)
        {
            ec = std::error_code(errno, std::generic_category());
        }
        return PFile{ fd };
    }

    auto PFile::try_open_write(const std::filesystem::path& path, bool truncate, unsigned int permissions)
        -> tl::expected<PFile, std::error_code>
    {
        auto io_error = std::error_code();
        auto file = PFile::try_open_write(path, truncate, permissions, io_error);
        if (io_error)
        {
            return tl::unexpected(io_error);
        }
        return { std::move(file) };
    }

    auto PFile::try_write_at(std::string_view bytes, std::int64_t offset, std::error_code& ec) noexcept
        -> std::size_t
    {
        if (m_fd < 0)
        {
            ec = std::make_error_code(std::errc::bad_file_descriptor);
            return 0;
        }

        std::size_t written = 0;
        while (written < bytes.size())
        {
            const auto res = ::pwrite(
                m_fd,
                bytes.data() + written,
                bytes.size() - written,
                static_cast<::off_t>(offset + static_cast<std::int64_t>(written))
            );
            if (res < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                ec = std::error_code(errno, std::generic_category());
                return written;
            }
            if (res == 0)
            {
                ec = std::make_error_code(std::errc::io_error);
                return written;
            }
            written += static_cast<std::size_t>(res);
        }
        return written;
    }

    void PFile::try_close(std::error_code& ec) noexcept
    {
        try_close_impl(m_fd, ec);
        m_fd = -1;  // No need to close in dtor anymore
    }

    auto PFile::try_close() noexcept -> tl::expected<void, std::error_code>
    {
        auto io_error = std::error_code();
        try_close(io_error);
        if (io_error)
        {
            return tl::unexpected(io_error);
        }
        return {};
    }

    auto PFile::is_open() const noexcept -> bool
    {
        return m_fd >= 0;
    }

    auto PFile::raw() const noexcept -> int
    {
        return m_fd;
    }
}
