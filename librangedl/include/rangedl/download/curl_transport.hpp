// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_DOWNLOAD_CURL_TRANSPORT_HPP
#define RANGEDL_DOWNLOAD_CURL_TRANSPORT_HPP

#include <string>

#include "rangedl/download/parameters.hpp"
#include "rangedl/download/transport.hpp"

namespace rangedl::download
{
    /**
     * Transport based on libcurl.
     *
     * Every request uses its own easy handle, so a single instance can be shared
     * by all the workers of a download. The remote fetch parameters are completed
     * with the environment when the transport is built:
     * - `RANGEDL_NO_LOW_SPEED_LIMIT` disables the low speed limit;
     * - `RANGEDL_SSL_NO_REVOKE` disables certificate revocation checks;
     * - `REQUESTS_CA_BUNDLE` is used when `ssl_verify` is empty;
     * - `NETRC` is forwarded to libcurl.
     */
    class CurlTransport final : public Transport
    {
    public:

        explicit CurlTransport(RemoteFetchParams params = {});
        ~CurlTransport() override = default;

        [[nodiscard]] auto params() const -> const RemoteFetchParams&;

    private:

        auto perform_impl(const TransferRequest& request, const CancellationToken& token)
            -> expected_t<TransferData> override;

        RemoteFetchParams m_params;
        std::string m_netrc_file;
    };
}

#endif
