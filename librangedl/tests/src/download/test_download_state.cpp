// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <catch2/catch_all.hpp>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include "rangedl/core/logging.hpp"

#include "download/download_state.hpp"

using namespace rangedl;
using namespace rangedl::download;

namespace
{
    /// Sink running a callback for every record it receives.
    class CallbackSink final : public spdlog::sinks::base_sink<std::mutex>
    {
    public:

        using callback_t = std::function<void(const std::string&)>;

        explicit CallbackSink(callback_t callback)
            : m_callback(std::move(callback))
        {
        }

    protected:

        void sink_it_(const spdlog::details::log_msg& msg) override
        {
            m_callback(std::string(msg.payload.data(), msg.payload.size()));
        }

        void flush_() override
        {
        }

    private:

        callback_t m_callback;
    };

    TEST_CASE("DownloadState", "[rangedl::download]")
    {
        auto state = DownloadState(100);

        SECTION("Counters")
        {
            state.add_written(40);
            state.add_written(60);
            state.add_retry();
            REQUIRE(state.written() == 100);
            REQUIRE(state.total_bytes() == 100);
            REQUIRE(state.retries() == 1);
            REQUIRE_FALSE(state.has_error());
            REQUIRE_FALSE(state.first_error().has_value());
        }

        SECTION("First error wins")
        {
            REQUIRE(state.set_error(rangedl_error("first", rangedl_error_code::chunk_status)));
            REQUIRE_FALSE(state.set_error(rangedl_error("second", rangedl_error_code::cancelled)));
            REQUIRE(state.has_error());
            REQUIRE(state.first_error()->error_code() == rangedl_error_code::chunk_status);
            REQUIRE(std::string(state.first_error()->what()) == "first");
        }
    }

    TEST_CASE("DownloadState logs errors without holding its lock", "[rangedl::download]")
    {
        const auto previous = logging::get_log_level();
        logging::set_log_level(log_level::err);

        auto state = DownloadState(10);
        std::atomic<bool> other_worker_done = false;
        bool logged_failure = false;
        bool updated_while_logging = false;
        std::thread other_worker;

        auto sink = std::make_shared<CallbackSink>(
            [&](const std::string& record)
            {
                if (record.find("Download failed") == std::string::npos)
                {
                    return;
                }
                logged_failure = true;
                // Another worker must be able to update the state while the record is written
                other_worker = std::thread(
                    [&]
                    {
                        state.add_written(10);
                        other_worker_done = true;
                    }
                );
                const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
                while (!other_worker_done && std::chrono::steady_clock::now() < deadline)
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
                updated_while_logging = other_worker_done;
            }
        );
        auto logger = logging::get_logger(log_source::librangedl);
        logger->sinks().push_back(sink);

        state.set_error(rangedl_error("Could not fetch bytes=0-9", rangedl_error_code::chunk_transport));

        logger->sinks().pop_back();
        logging::set_log_level(previous);
        if (other_worker.joinable())
        {
            other_worker.join();
        }

        REQUIRE(logged_failure);
        REQUIRE(updated_while_logging);
        REQUIRE(state.written() == 10);
    }
}
