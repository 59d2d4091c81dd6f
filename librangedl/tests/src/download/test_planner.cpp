// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdint>
#include <initializer_list>
#include <vector>

#include <catch2/catch_all.hpp>

#include "rangedl/download/planner.hpp"
#include "rangedl/download/sink.hpp"

using namespace rangedl::download;

namespace
{
    auto fixed_parts(std::int64_t parts) -> part_determiner_t
    {
        return [parts](std::int64_t) { return parts; };
    }

    auto fixed_size(std::int64_t size) -> chunk_size_determiner_t
    {
        return [size](std::int64_t) { return size; };
    }

    auto sizes_of(const std::vector<Chunk>& chunks) -> std::vector<std::int64_t>
    {
        std::vector<std::int64_t> sizes;
        for (const auto& chunk : chunks)
        {
            sizes.push_back(chunk.size());
        }
        return sizes;
    }

    auto starts_of(const Batch& batch) -> std::vector<std::int64_t>
    {
        std::vector<std::int64_t> starts;
        for (const auto& chunk : batch)
        {
            starts.push_back(chunk.start());
        }
        return starts;
    }

    TEST_CASE("resolve_partition", "[rangedl::download]")
    {
        auto config = DownloaderConfig{};

        SECTION("Empty resource")
        {
            const auto plan = resolve_partition(0, config);
            REQUIRE(plan.num_parts == 0);
        }

        SECTION("Default determiner")
        {
            REQUIRE(resolve_partition(5, config).num_parts == 1);
            REQUIRE(resolve_partition(5, config).chunk_size == 5);
            REQUIRE(resolve_partition(10 * MiB, config).num_parts == 16);
            REQUIRE(resolve_partition(10 * MiB, config).chunk_size == 10 * MiB / 16);
        }

        SECTION("chunk_size first")
        {
            config.chunk_size = 512 * KiB;
            config.part_determiner = fixed_parts(7);
            config.chunk_size_determiner = fixed_size(3);
            const auto plan = resolve_partition(MiB + 1, config);
            REQUIRE(plan.num_parts == 3);
            REQUIRE(plan.chunk_size == 512 * KiB);
        }

        SECTION("part_determiner before chunk_size_determiner")
        {
            config.part_determiner = fixed_parts(4);
            config.chunk_size_determiner = fixed_size(3);
            const auto plan = resolve_partition(2048, config);
            REQUIRE(plan.num_parts == 4);
            REQUIRE(plan.chunk_size == 512);
        }

        SECTION("chunk_size_determiner")
        {
            config.chunk_size_determiner = fixed_size(300);
            const auto plan = resolve_partition(1000, config);
            REQUIRE(plan.num_parts == 4);
            REQUIRE(plan.chunk_size == 300);
        }

        SECTION("Determiner results are clamped")
        {
            config.part_determiner = fixed_parts(0);
            REQUIRE(resolve_partition(100, config).num_parts == 1);

            config.part_determiner = fixed_parts(-3);
            REQUIRE(resolve_partition(100, config).num_parts == 1);

            config.part_determiner = fixed_parts(1000);
            REQUIRE(resolve_partition(10, config).num_parts == 10);
            REQUIRE(resolve_partition(10, config).chunk_size == 1);

            config.part_determiner = nullptr;
            config.chunk_size_determiner = fixed_size(0);
            REQUIRE(resolve_partition(10, config).num_parts == 10);
        }

        SECTION("Configuration is not modified")
        {
            config.part_determiner = fixed_parts(4);
            const auto plan = resolve_partition(2048, config);
            REQUIRE(plan.chunk_size == 512);
            REQUIRE_FALSE(config.chunk_size.has_value());
        }
    }

    TEST_CASE("plan_chunks", "[rangedl::download]")
    {
        BufferSink sink;
        auto config = DownloaderConfig{};

        SECTION("Empty resource")
        {
            REQUIRE(plan_chunks(0, config, sink).empty());
        }

        SECTION("Single byte")
        {
            const auto chunks = plan_chunks(1, config, sink);
            REQUIRE(chunks.size() == 1);
            REQUIRE(chunks[0].bytes_range() == "bytes=0-0");
        }

        SECTION("Remainder in the last chunk")
        {
            config.chunk_size = 512 * KiB;
            const auto chunks = plan_chunks(MiB + 1, config, sink);
            REQUIRE(sizes_of(chunks) == std::vector<std::int64_t>{ 524288, 524288, 1 });
        }

        SECTION("Modulus in the last chunk")
        {
            config.part_determiner = fixed_parts(3);
            const auto chunks = plan_chunks(10, config, sink);
            REQUIRE(sizes_of(chunks) == std::vector<std::int64_t>{ 3, 3, 4 });
        }

        SECTION("Chunk size larger than the resource")
        {
            config.chunk_size = 4096;
            const auto chunks = plan_chunks(100, config, sink);
            REQUIRE(sizes_of(chunks) == std::vector<std::int64_t>{ 100 });
        }
    }

    TEST_CASE("plan_chunks tiles the resource", "[rangedl::download]")
    {
        BufferSink sink;

        std::vector<DownloaderConfig> configs(1);
        for (std::int64_t size : std::initializer_list<std::int64_t>{ 1, 3, 1000, 4096, 2 * MiB })
        {
            configs.emplace_back().chunk_size = size;
        }
        for (std::int64_t parts : { -5, 0, 1, 3, 16, 1000000 })
        {
            configs.emplace_back().part_determiner = fixed_parts(parts);
        }
        for (std::int64_t size : { 0, 7, 65536 })
        {
            configs.emplace_back().chunk_size_determiner = fixed_size(size);
        }

        for (std::int64_t total : { 1, 2, 3, 7, 100, 1023, 1024, 1025, 65537 })
        {
            for (const auto& config : configs)
            {
                const auto chunks = plan_chunks(total, config, sink);
                REQUIRE_FALSE(chunks.empty());

                std::int64_t expected_start = 0;
                for (const auto& chunk : chunks)
                {
                    REQUIRE(chunk.start() == expected_start);
                    REQUIRE(chunk.size() > 0);
                    REQUIRE(chunk.cursor() == 0);
                    expected_start += chunk.size();
                }
                REQUIRE(expected_start == total);
            }
        }
    }

    TEST_CASE("batch_chunks", "[rangedl::download]")
    {
        BufferSink sink;
        auto make_chunks = [&sink](std::int64_t count)
        {
            auto config = DownloaderConfig{};
            config.chunk_size = 10;
            return plan_chunks(count * 10, config, sink);
        };

        SECTION("Unlimited concurrency")
        {
            const auto batches = batch_chunks(make_chunks(5), unlimited_concurrency);
            REQUIRE(batches.size() == 5);
            for (const auto& batch : batches)
            {
                REQUIRE(batch.size() == 1);
            }
        }

        SECTION("Fewer chunks than workers")
        {
            const auto batches = batch_chunks(make_chunks(3), 8);
            REQUIRE(batches.size() == 3);
        }

        SECTION("As many chunks as workers")
        {
            const auto batches = batch_chunks(make_chunks(4), 4);
            REQUIRE(batches.size() == 4);
        }

        SECTION("Even split")
        {
            const auto batches = batch_chunks(make_chunks(4), 2);
            REQUIRE(batches.size() == 2);
            REQUIRE(starts_of(batches[0]) == std::vector<std::int64_t>{ 0, 10 });
            REQUIRE(starts_of(batches[1]) == std::vector<std::int64_t>{ 20, 30 });
        }

        SECTION("Tail batch takes the overflow")
        {
            const auto batches = batch_chunks(make_chunks(10), 3);
            REQUIRE(batches.size() == 3);
            REQUIRE(starts_of(batches[0]) == std::vector<std::int64_t>{ 0, 10, 20 });
            REQUIRE(starts_of(batches[1]) == std::vector<std::int64_t>{ 30, 40, 50 });
            REQUIRE(starts_of(batches[2]) == std::vector<std::int64_t>{ 60, 70, 80, 90 });
        }

        SECTION("Index past the last batch")
        {
            const auto batches = batch_chunks(make_chunks(7), 2);
            REQUIRE(batches.size() == 2);
            REQUIRE(starts_of(batches[0]) == std::vector<std::int64_t>{ 0, 10, 20 });
            REQUIRE(starts_of(batches[1]) == std::vector<std::int64_t>{ 30, 40, 50, 60 });
        }

        SECTION("No chunk")
        {
            REQUIRE(batch_chunks({}, 4).empty());
            REQUIRE(batch_chunks({}, unlimited_concurrency).empty());
        }
    }
}
