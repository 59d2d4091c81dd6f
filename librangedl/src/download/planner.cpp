// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "rangedl/core/logging.hpp"
#include "rangedl/download/planner.hpp"

namespace rangedl::download
{
    namespace
    {
        auto ceil_div(std::int64_t num, std::int64_t den) -> std::int64_t
        {
            return num / den + ((num % den) != 0 ? 1 : 0);
        }

        auto plan_from_part_count(std::int64_t total_size, std::int64_t num_parts) -> PartitionPlan
        {
            num_parts = std::clamp(num_parts, std::int64_t(1), total_size);
            return { num_parts, total_size / num_parts };
        }

        auto plan_from_chunk_size(std::int64_t total_size, std::int64_t chunk_size) -> PartitionPlan
        {
            chunk_size = std::max(chunk_size, std::int64_t(1));
            return { ceil_div(total_size, chunk_size), chunk_size };
        }
    }

    auto resolve_partition(std::int64_t total_size, const DownloaderConfig& config) -> PartitionPlan
    {
        if (total_size <= 0)
        {
            return { 0, 0 };
        }

        if (config.chunk_size.has_value() && config.chunk_size.value() > 0)
        {
            return plan_from_chunk_size(total_size, config.chunk_size.value());
        }

        if (config.part_determiner)
        {
            return plan_from_part_count(total_size, config.part_determiner(total_size));
        }

        if (config.chunk_size_determiner)
        {
            return plan_from_chunk_size(total_size, config.chunk_size_determiner(total_size));
        }

        return plan_from_part_count(total_size, default_part_determiner(total_size));
    }

    auto plan_chunks(std::int64_t total_size, const PartitionPlan& plan, PositionalSink& sink)
        -> std::vector<Chunk>
    {
        std::vector<Chunk> chunks;
        if (total_size <= 0 || plan.num_parts <= 0 || plan.chunk_size <= 0)
        {
            return chunks;
        }

        chunks.reserve(static_cast<std::size_t>(plan.num_parts));
        for (std::int64_t i = 0; i < plan.num_parts; ++i)
        {
            const std::int64_t start = i * plan.chunk_size;
            const std::int64_t size = (i == plan.num_parts - 1) ? total_size - start
                                                                 : plan.chunk_size;
            chunks.emplace_back(start, size, sink);
        }
        return chunks;
    }

    auto plan_chunks(std::int64_t total_size, const DownloaderConfig& config, PositionalSink& sink)
        -> std::vector<Chunk>
    {
        const PartitionPlan plan = resolve_partition(total_size, config);
        LOG_DEBUG << "Splitting " << total_size << " bytes into " << plan.num_parts
                  << " chunks of " << plan.chunk_size << " bytes";
        return plan_chunks(total_size, plan, sink);
    }

    auto batch_chunks(std::vector<Chunk> chunks, int max_concurrent) -> std::vector<Batch>
    {
        std::vector<Batch> batches;
        const std::size_t chunk_count = chunks.size();

        if (max_concurrent == unlimited_concurrency || max_concurrent <= 0
            || chunk_count <= static_cast<std::size_t>(max_concurrent))
        {
            batches.reserve(chunk_count);
            for (auto& chunk : chunks)
            {
                batches.push_back(Batch{ std::move(chunk) });
            }
            return batches;
        }

        const auto batch_count = static_cast<std::size_t>(max_concurrent);
        const std::size_t batch_size = chunk_count / batch_count;
        batches.resize(batch_count);
        for (auto& batch : batches)
        {
            batch.reserve(batch_size);
        }

        for (std::size_t i = 0; i < chunk_count; ++i)
        {
            const std::size_t batch_index = std::min(i / batch_size, batch_count - 1);
            batches[batch_index].push_back(std::move(chunks[i]));
        }
        return batches;
    }
}
