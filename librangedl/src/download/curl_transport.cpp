// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <chrono>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "rangedl/core/logging.hpp"
#include "rangedl/download/curl_transport.hpp"
#include "rangedl/util/environment.hpp"
#include "rangedl/util/string.hpp"

#include "curl.hpp"

namespace rangedl::download
{
    namespace
    {
        int
        curl_debug_callback(CURL* /* handle */, curl_infotype type, char* data, size_t size, void* userptr)
        {
            auto* logger = reinterpret_cast<spdlog::logger*>(userptr);
            auto log = logging::hide_secrets(std::string_view(data, size));
            switch (type)
            {
                case CURLINFO_TEXT:
                    logger->info(fmt::format("* {}", log));
                    break;
                case CURLINFO_HEADER_OUT:
                    logger->info(fmt::format("> {}", log));
                    break;
                case CURLINFO_HEADER_IN:
                    logger->info(fmt::format("< {}", log));
                    break;
                default:
                    break;
            }
            return 0;
        }

        /**
         * State of a single libcurl transfer, shared with the libcurl callbacks.
         */
        class TransferAttempt
        {
        public:

            TransferAttempt(const TransferRequest& request, const CancellationToken& token);

            void configure(const RemoteFetchParams& params, const std::string& netrc_file);
            auto run() -> expected_t<TransferData>;

        private:

            void notify_response();

            static size_t curl_header_callback(char* buffer, size_t size, size_t nbitems, void* self);
            static size_t curl_write_callback(char* buffer, size_t size, size_t nbitems, void* self);
            static int curl_progress_callback(void* self, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

            CURLHandle m_handle;
            const TransferRequest* p_request;
            const CancellationToken* p_token;
            TransferData m_data;
            bool m_response_notified = false;
            bool m_rejected = false;
        };

        TransferAttempt::TransferAttempt(const TransferRequest& request, const CancellationToken& token)
            : m_handle()
            , p_request(&request)
            , p_token(&token)
        {
        }

        void TransferAttempt::configure(const RemoteFetchParams& params, const std::string& netrc_file)
        {
            m_handle.configure_handle(
                p_request->url,
                params.low_speed_limit,
                params.connect_timeout_secs,
                params.ssl_no_revoke,
                params.ssl_verify,
                netrc_file
            );

            m_handle.set_opt(CURLOPT_NOBODY, p_request->head_only);

            m_handle.set_opt(CURLOPT_HEADERFUNCTION, &TransferAttempt::curl_header_callback);
            m_handle.set_opt(CURLOPT_HEADERDATA, this);

            m_handle.set_opt(CURLOPT_WRITEFUNCTION, &TransferAttempt::curl_write_callback);
            m_handle.set_opt(CURLOPT_WRITEDATA, this);

            m_handle.set_opt(CURLOPT_XFERINFOFUNCTION, &TransferAttempt::curl_progress_callback);
            m_handle.set_opt(CURLOPT_XFERINFODATA, this);
            m_handle.set_opt(CURLOPT_NOPROGRESS, 0L);

            if (auto deadline = p_token->deadline(); deadline.has_value())
            {
                const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
                    deadline.value() - CancellationToken::clock_type::now()
                );
                m_handle.set_opt(CURLOPT_TIMEOUT_MS, std::max(static_cast<long>(remaining.count()), 1L));
            }

            m_handle.set_opt(CURLOPT_VERBOSE, params.verbose);

            m_handle.reset_headers();
            m_handle.add_header(fmt::format("User-Agent: {} {}", params.user_agent, curl_version()));
            m_handle.add_headers(p_request->headers);
            m_handle.set_opt_header();

            auto logger = logging::get_logger(log_source::libcurl);
            m_handle.set_opt(CURLOPT_DEBUGFUNCTION, curl_debug_callback);
            m_handle.set_opt(CURLOPT_DEBUGDATA, logger.get());
        }

        auto TransferAttempt::run() -> expected_t<TransferData>
        {
            const CURLcode res = m_handle.perform();

            // A deadline reached by libcurl surfaces as a timeout
            if (res == CURLE_ABORTED_BY_CALLBACK || (res != CURLE_OK && p_token->is_cancelled()))
            {
                return make_unexpected(
                    fmt::format("Transfer of {} cancelled", p_request->url),
                    rangedl_error_code::cancelled
                );
            }

            if (!CURLHandle::is_curl_res_ok(res) && !(res == CURLE_WRITE_ERROR && m_rejected))
            {
                std::string cause = m_handle.get_error_buffer();
                if (cause.empty())
                {
                    cause = CURLHandle::get_res_error(res);
                }
                return make_unexpected(
                    fmt::format("Transfer of {} failed", p_request->url),
                    rangedl_error_code::transport,
                    std::move(cause)
                );
            }

            // Bodyless responses never reach the write callback
            if (!m_response_notified)
            {
                notify_response();
            }

            LOG_DEBUG << "Transfer finalized, status: " << m_data.http_status << " ["
                      << m_data.effective_url << "] " << m_data.downloaded_size << " bytes";
            return m_data;
        }

        void TransferAttempt::notify_response()
        {
            m_response_notified = true;
            m_data.http_status = m_handle.get_info<int>(CURLINFO_RESPONSE_CODE).value_or(0);
            m_data.effective_url = m_handle.get_curl_effective_url();
            if (p_request->on_response && !p_request->on_response(m_data))
            {
                m_rejected = true;
            }
        }

        size_t
        TransferAttempt::curl_header_callback(char* buffer, size_t size, size_t nbitems, void* self)
        {
            auto* s = reinterpret_cast<TransferAttempt*>(self);

            const size_t buffer_size = size * nbitems;
            const std::string_view header(buffer, buffer_size);

            // A new status line starts the headers of the next response of a redirect chain
            if (util::starts_with(header, "HTTP/"))
            {
                s->m_data.headers.clear();
                return buffer_size;
            }

            auto colon_idx = header.find(':');
            if (colon_idx != std::string_view::npos)
            {
                // http headers are case insensitive!
                const std::string key = util::to_lower(util::strip(header.substr(0, colon_idx)));
                const std::string_view value = util::strip(header.substr(colon_idx + 1));
                s->m_data.headers[key] = std::string(value);
            }

            return buffer_size;
        }

        size_t
        TransferAttempt::curl_write_callback(char* buffer, size_t size, size_t nbitems, void* self)
        {
            auto* s = reinterpret_cast<TransferAttempt*>(self);
            const size_t buffer_size = size * nbitems;

            if (!s->m_response_notified)
            {
                s->notify_response();
            }
            if (s->m_rejected)
            {
                // Return a size _different_ than the expected write size to stop the transfer
                return 0;
            }

            size_t consumed = buffer_size;
            if (s->p_request->on_data)
            {
                consumed = s->p_request->on_data(buffer, buffer_size);
            }
            s->m_data.downloaded_size += consumed;
            return consumed;
        }

        int
        TransferAttempt::curl_progress_callback(void* self, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
        {
            auto* s = reinterpret_cast<TransferAttempt*>(self);
            return s->p_token->is_cancelled() ? 1 : 0;
        }
    }

    /********************************
     * CurlTransport implementation *
     ********************************/

    CurlTransport::CurlTransport(RemoteFetchParams params)
        : m_params(std::move(params))
        , m_netrc_file(util::get_env("NETRC").value_or(""))
    {
        if (util::env_flag("RANGEDL_NO_LOW_SPEED_LIMIT"))
        {
            m_params.low_speed_limit = false;
        }
        if (util::env_flag("RANGEDL_SSL_NO_REVOKE"))
        {
            m_params.ssl_no_revoke = true;
        }
        if (m_params.ssl_verify.empty())
        {
            if (auto ca_bundle = util::get_env("REQUESTS_CA_BUNDLE"); ca_bundle.has_value())
            {
                m_params.ssl_verify = ca_bundle.value();
            }
        }
    }

    auto CurlTransport::params() const -> const RemoteFetchParams&
    {
        return m_params;
    }

    auto CurlTransport::perform_impl(const TransferRequest& request, const CancellationToken& token)
        -> expected_t<TransferData>
    {
        try
        {
            curl::ensure_global_init();
            TransferAttempt attempt(request, token);
            attempt.configure(m_params, m_netrc_file);
            return attempt.run();
        }
        catch (const curl_error& e)
        {
            return make_unexpected(
                fmt::format("Could not build request to {}", request.url),
                rangedl_error_code::request_build,
                e.what()
            );
        }
    }
}
