// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_DOWNLOAD_TRANSPORT_HPP
#define RANGEDL_DOWNLOAD_TRANSPORT_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rangedl/core/cancellation.hpp"
#include "rangedl/core/error_handling.hpp"

namespace rangedl::download
{
    namespace http
    {
        inline constexpr int OK = 200;
        inline constexpr int PARTIAL_CONTENT = 206;
        inline constexpr int FORBIDDEN = 403;
        inline constexpr int NOT_FOUND = 404;
        inline constexpr int METHOD_NOT_ALLOWED = 405;
        inline constexpr int RANGE_NOT_SATISFIABLE = 416;

        [[nodiscard]] auto is_success(int http_status) -> bool;
    }

    /// Response headers, names are lower case.
    using header_map = std::map<std::string, std::string>;

    struct TransferData
    {
        int http_status = 0;
        std::string effective_url = "";
        header_map headers = {};
        std::size_t downloaded_size = 0;

        [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>;
    };

    struct TransferRequest
    {
        // Called once with the status and headers, before any body byte is delivered.
        // Returning false ends the transfer early; this is not an error.
        using response_callback_t = std::function<bool(const TransferData&)>;
        // Consumes body bytes. Returning a different size aborts the transfer with an error.
        using data_callback_t = std::function<std::size_t(const char*, std::size_t)>;

        std::string url;
        bool head_only = false;
        // Extra request headers, e.g. "Range: bytes=0-0"
        std::vector<std::string> headers = {};
        response_callback_t on_response = nullptr;
        data_callback_t on_data = nullptr;
    };

    /**
     * The HTTP client used by the downloader.
     *
     * Implementations must be safe to use from several threads at the same time.
     * Errors are reported with the `request_build`, `transport` and `cancelled` codes;
     * HTTP statuses, whatever their value, are not errors at this level.
     */
    class Transport
    {
    public:

        virtual ~Transport() = default;

        Transport(const Transport&) = delete;
        Transport& operator=(const Transport&) = delete;
        Transport(Transport&&) = delete;
        Transport& operator=(Transport&&) = delete;

        auto perform(const TransferRequest& request, const CancellationToken& token)
            -> expected_t<TransferData>;

    protected:

        Transport() = default;

    private:

        virtual auto perform_impl(const TransferRequest& request, const CancellationToken& token)
            -> expected_t<TransferData> = 0;
    };
}

#endif
