// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "rangedl/core/error_handling.hpp"

namespace rangedl
{
    auto name_of(rangedl_error_code ec) noexcept -> const char*
    {
        switch (ec)
        {
            case rangedl_error_code::invalid_configuration:
                return "invalid-configuration";
            case rangedl_error_code::sink_failure:
                return "sink-failure";
            case rangedl_error_code::request_build:
                return "request-build";
            case rangedl_error_code::transport:
                return "transport";
            case rangedl_error_code::cancelled:
                return "cancelled";
            case rangedl_error_code::method_not_supported:
                return "method-not-supported";
            case rangedl_error_code::resource_missing:
                return "resource-missing";
            case rangedl_error_code::range_unsupported:
                return "range-unsupported";
            case rangedl_error_code::probe_transport:
                return "probe-transport";
            case rangedl_error_code::probe_failed:
                return "probe-failed";
            case rangedl_error_code::chunk_request_build:
                return "chunk-request-build";
            case rangedl_error_code::chunk_transport:
                return "chunk-transport";
            case rangedl_error_code::chunk_status:
                return "chunk-status";
            case rangedl_error_code::chunk_write:
                return "chunk-write";
            case rangedl_error_code::unknown:
            default:
                return "unknown";
        }
    }

    auto is_probe_error(rangedl_error_code ec) noexcept -> bool
    {
        return ec == rangedl_error_code::method_not_supported
               || ec == rangedl_error_code::probe_transport
               || ec == rangedl_error_code::probe_failed;
    }

    rangedl_error::rangedl_error(const std::string& msg, rangedl_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    rangedl_error::rangedl_error(const char* msg, rangedl_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    rangedl_error::rangedl_error(const std::string& msg, rangedl_error_code ec, std::string cause)
        : base_type(msg)
        , m_error_code(ec)
        , m_cause(std::move(cause))
    {
    }

    rangedl_error_code rangedl_error::error_code() const noexcept
    {
        return m_error_code;
    }

    const std::string& rangedl_error::cause() const noexcept
    {
        return m_cause;
    }

    std::string rangedl_error::full_message() const
    {
        if (m_cause.empty())
        {
            return what();
        }
        return fmt::format("{}: {}", what(), m_cause);
    }

    tl::unexpected<rangedl_error> make_unexpected(const char* msg, rangedl_error_code ec)
    {
        return tl::make_unexpected(rangedl_error(msg, ec));
    }

    tl::unexpected<rangedl_error> make_unexpected(const std::string& msg, rangedl_error_code ec)
    {
        return tl::make_unexpected(rangedl_error(msg, ec));
    }

    tl::unexpected<rangedl_error>
    make_unexpected(const std::string& msg, rangedl_error_code ec, std::string cause)
    {
        return tl::make_unexpected(rangedl_error(msg, ec, std::move(cause)));
    }

    tl::unexpected<rangedl_error>
    requalify(const rangedl_error& error, const std::string& msg, rangedl_error_code ec)
    {
        return tl::make_unexpected(rangedl_error(msg, ec, error.full_message()));
    }
}
