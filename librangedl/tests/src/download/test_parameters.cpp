// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <chrono>
#include <vector>

#include <catch2/catch_all.hpp>

#include "rangedl/download/parameters.hpp"

using namespace rangedl;
using namespace rangedl::download;

namespace
{
    TEST_CASE("Units", "[rangedl::download]")
    {
        REQUIRE(KiB == 1024);
        REQUIRE(MiB == 1024 * 1024);
        REQUIRE(GiB == 1024 * MiB);
    }

    TEST_CASE("default_part_determiner", "[rangedl::download]")
    {
        REQUIRE(default_part_determiner(0) == 1);
        REQUIRE(default_part_determiner(MiB - 1) == 1);
        REQUIRE(default_part_determiner(MiB) == 4);
        REQUIRE(default_part_determiner(10 * MiB - 1) == 4);
        REQUIRE(default_part_determiner(10 * MiB) == 16);
        REQUIRE(default_part_determiner(100 * MiB - 1) == 16);
        REQUIRE(default_part_determiner(100 * MiB) == 32);
        REQUIRE(default_part_determiner(10 * GiB) == 32);
    }

    TEST_CASE("DownloaderConfig defaults", "[rangedl::download]")
    {
        const auto config = DownloaderConfig{};
        REQUIRE(config.max_retries == 5);
        REQUIRE(config.max_concurrent == unlimited_concurrency);
        REQUIRE_FALSE(config.chunk_size.has_value());
        REQUIRE_FALSE(config.part_determiner);
        REQUIRE_FALSE(config.chunk_size_determiner);
        REQUIRE(config.retry_wait == std::chrono::milliseconds(0));
        REQUIRE(config.remote_fetch_params.connect_timeout_secs == 10.);
        REQUIRE(config.remote_fetch_params.low_speed_limit);
        REQUIRE(validate(config).has_value());
    }

    TEST_CASE("validate", "[rangedl::download]")
    {
        auto config = DownloaderConfig{};

        SECTION("Negative max_retries")
        {
            config.max_retries = -1;
            const auto res = validate(config);
            REQUIRE_FALSE(res.has_value());
            REQUIRE(res.error().error_code() == rangedl_error_code::invalid_configuration);
        }

        SECTION("Zero retries is valid")
        {
            config.max_retries = 0;
            REQUIRE(validate(config).has_value());
        }

        SECTION("max_concurrent")
        {
            config.max_concurrent = 0;
            REQUIRE_FALSE(validate(config).has_value());
            config.max_concurrent = -2;
            REQUIRE_FALSE(validate(config).has_value());
            config.max_concurrent = 1;
            REQUIRE(validate(config).has_value());
            config.max_concurrent = unlimited_concurrency;
            REQUIRE(validate(config).has_value());
        }

        SECTION("chunk_size")
        {
            config.chunk_size = 0;
            REQUIRE_FALSE(validate(config).has_value());
            config.chunk_size = -4;
            REQUIRE_FALSE(validate(config).has_value());
            config.chunk_size = 1;
            REQUIRE(validate(config).has_value());
        }

        SECTION("retry_wait")
        {
            config.retry_wait = std::chrono::milliseconds(-1);
            REQUIRE_FALSE(validate(config).has_value());
        }

        SECTION("connect_timeout_secs")
        {
            config.remote_fetch_params.connect_timeout_secs = 0.;
            REQUIRE_FALSE(validate(config).has_value());
        }

        SECTION("Both determiners are accepted")
        {
            config.part_determiner = [](std::int64_t) -> std::int64_t { return 2; };
            config.chunk_size_determiner = [](std::int64_t) -> std::int64_t { return 10; };
            REQUIRE(validate(config).has_value());
        }
    }

    TEST_CASE("Options", "[rangedl::download]")
    {
        SECTION("Each option sets its field")
        {
            auto params = RemoteFetchParams{};
            params.user_agent = "tester";

            const auto config = make_config({
                with_max_retries(2),
                with_max_concurrent(3),
                with_chunk_size(4 * KiB),
                with_part_determiner([](std::int64_t) -> std::int64_t { return 5; }),
                with_chunk_size_determiner([](std::int64_t) -> std::int64_t { return 6; }),
                with_retry_wait(std::chrono::milliseconds(7)),
                with_remote_fetch_params(params),
            });

            REQUIRE(config.max_retries == 2);
            REQUIRE(config.max_concurrent == 3);
            REQUIRE(config.chunk_size == 4 * KiB);
            REQUIRE(config.part_determiner(100) == 5);
            REQUIRE(config.chunk_size_determiner(100) == 6);
            REQUIRE(config.retry_wait == std::chrono::milliseconds(7));
            REQUIRE(config.remote_fetch_params.user_agent == "tester");
        }

        SECTION("Applied in order over defaults")
        {
            const auto config = make_config({ with_max_retries(1), with_max_retries(9), nullptr });
            REQUIRE(config.max_retries == 9);
            REQUIRE(config.max_concurrent == unlimited_concurrency);
        }

        SECTION("No option")
        {
            const auto config = make_config({});
            REQUIRE(config.max_retries == 5);
        }
    }
}
