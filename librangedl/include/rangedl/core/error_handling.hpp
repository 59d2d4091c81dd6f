// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_CORE_ERROR_HANDLING_HPP
#define RANGEDL_CORE_ERROR_HANDLING_HPP

#include <stdexcept>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace rangedl
{

    /**********************
     * rangedl exceptions *
     **********************/

    enum class rangedl_error_code
    {
        unknown,
        invalid_configuration,
        sink_failure,
        // Produced by transports, re-qualified by the prober and the fetcher
        request_build,
        transport,
        cancelled,
        // Probe
        method_not_supported,
        resource_missing,
        range_unsupported,
        probe_transport,
        probe_failed,
        // Chunk fetch
        chunk_request_build,
        chunk_transport,
        chunk_status,
        chunk_write
    };

    /// @returns A short identifier of the error code, e.g. "chunk-transport".
    [[nodiscard]] auto name_of(rangedl_error_code ec) noexcept -> const char*;

    /// @returns true for the codes that make up the "probe failed" family.
    [[nodiscard]] auto is_probe_error(rangedl_error_code ec) noexcept -> bool;

    class rangedl_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        rangedl_error(const std::string& msg, rangedl_error_code ec);
        rangedl_error(const char* msg, rangedl_error_code ec);
        rangedl_error(const std::string& msg, rangedl_error_code ec, std::string cause);

        rangedl_error_code error_code() const noexcept;

        /// Underlying cause of the error, empty when there is none.
        const std::string& cause() const noexcept;

        /// Message followed by the cause, if any.
        std::string full_message() const;

    private:

        rangedl_error_code m_error_code;
        std::string m_cause;
    };

    /**********************************
     * helpers around tl::expected    *
     **********************************/

    template <class T, class E = rangedl_error>
    using expected_t = tl::expected<T, E>;

    tl::unexpected<rangedl_error> make_unexpected(const char* msg, rangedl_error_code ec);

    tl::unexpected<rangedl_error> make_unexpected(const std::string& msg, rangedl_error_code ec);

    tl::unexpected<rangedl_error>
    make_unexpected(const std::string& msg, rangedl_error_code ec, std::string cause);

    /**
     * Build a new error of kind @p ec whose cause is the message of @p error.
     *
     * Used when a lower layer error is re-qualified by an upper layer.
     */
    tl::unexpected<rangedl_error>
    requalify(const rangedl_error& error, const std::string& msg, rangedl_error_code ec);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    /***********************************
     * helper functions implementation *
     ***********************************/

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }
}

#endif
