// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_all.hpp>

#include "rangedl/download/sink.hpp"

#include "rangedltests.hpp"

using namespace rangedl;
using namespace rangedl::download;

namespace
{
    TEST_CASE("BufferSink", "[rangedl::download]")
    {
        BufferSink sink;
        std::error_code ec;

        SECTION("Grows on demand")
        {
            REQUIRE(sink.write_at("world", 6, ec) == 5);
            REQUIRE_FALSE(ec);
            REQUIRE(sink.size() == 11);
            REQUIRE(sink.write_at("hello ", 0, ec) == 6);
            REQUIRE(sink.str() == "hello world");
        }

        SECTION("Overwrites in place")
        {
            REQUIRE(sink.write_at("aaaa", 0, ec) == 4);
            REQUIRE(sink.write_at("bb", 1, ec) == 2);
            REQUIRE(sink.str() == "abba");
        }

        SECTION("Negative offset")
        {
            REQUIRE(sink.write_at("data", -1, ec) == 0);
            REQUIRE(ec == std::errc::invalid_argument);
            REQUIRE(sink.size() == 0);
        }

        SECTION("Concurrent disjoint writes")
        {
            const auto body = rangedltests::make_body(8000);
            std::vector<std::thread> writers;
            for (std::size_t i = 0; i < 8; ++i)
            {
                writers.emplace_back(
                    [&sink, &body, i]
                    {
                        std::error_code lec;
                        const auto start = i * 1000;
                        for (std::size_t j = 0; j < 1000; j += 100)
                        {
                            sink.write_at(
                                std::string_view(body).substr(start + j, 100),
                                static_cast<std::int64_t>(start + j),
                                lec
                            );
                        }
                    }
                );
            }
            for (auto& w : writers)
            {
                w.join();
            }
            REQUIRE(sink.str() == body);
        }
    }

    TEST_CASE("FileSink", "[rangedl::download]")
    {
        const auto tmp_dir = rangedltests::TemporaryDirectory();
        const auto path = tmp_dir.path() / "out.bin";
        std::error_code ec;

        SECTION("Positional writes")
        {
            auto sink = FileSink::open(path);
            REQUIRE(sink.has_value());
            REQUIRE(sink.value()->path() == path);
            REQUIRE(sink.value()->write_at("CD", 2, ec) == 2);
            REQUIRE(sink.value()->write_at("AB", 0, ec) == 2);
            REQUIRE_FALSE(ec);
            REQUIRE(sink.value()->close().has_value());
            REQUIRE(rangedltests::read_file(path) == "ABCD");
        }

        SECTION("Truncates previous content")
        {
            rangedltests::write_file(path, "a previous and much longer content");
            auto sink = FileSink::open(path);
            REQUIRE(sink.has_value());
            REQUIRE(sink.value()->write_at("HELLO", 0, ec) == 5);
            REQUIRE(sink.value()->close().has_value());
            REQUIRE(rangedltests::read_file(path) == "HELLO");
        }

        SECTION("Cannot open")
        {
            auto sink = FileSink::open(tmp_dir.path() / "missing" / "out.bin");
            REQUIRE_FALSE(sink.has_value());
            REQUIRE(sink.error().error_code() == rangedl_error_code::sink_failure);
            REQUIRE_FALSE(sink.error().cause().empty());
        }

        SECTION("Write after close")
        {
            auto sink = FileSink::open(path);
            REQUIRE(sink.has_value());
            REQUIRE(sink.value()->close().has_value());
            REQUIRE(sink.value()->write_at("late", 0, ec) == 0);
            REQUIRE(ec);
        }
    }
}
