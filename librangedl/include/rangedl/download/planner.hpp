// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_DOWNLOAD_PLANNER_HPP
#define RANGEDL_DOWNLOAD_PLANNER_HPP

#include <cstdint>
#include <vector>

#include "rangedl/download/chunk.hpp"
#include "rangedl/download/parameters.hpp"

namespace rangedl::download
{
    class PositionalSink;

    struct PartitionPlan
    {
        std::int64_t num_parts = 0;
        // Nominal size of every chunk but the last one
        std::int64_t chunk_size = 0;
    };

    /**
     * Choose the number of chunks and their nominal size for @p total_size bytes.
     *
     * The first option set wins, in this order: `chunk_size`, `part_determiner`,
     * `chunk_size_determiner`, then `default_part_determiner`. Determiner results
     * lower than 1 are clamped to 1, and a part count cannot exceed @p total_size.
     * The configuration is never modified.
     */
    [[nodiscard]] auto resolve_partition(std::int64_t total_size, const DownloaderConfig& config)
        -> PartitionPlan;

    /**
     * Build the chunks tiling `[0, total_size)`; the last chunk absorbs the remainder.
     */
    [[nodiscard]] auto
    plan_chunks(std::int64_t total_size, const PartitionPlan& plan, PositionalSink& sink)
        -> std::vector<Chunk>;

    [[nodiscard]] auto
    plan_chunks(std::int64_t total_size, const DownloaderConfig& config, PositionalSink& sink)
        -> std::vector<Chunk>;

    /// Chunks processed sequentially by a single worker.
    using Batch = std::vector<Chunk>;

    /**
     * Group @p chunks into batches.
     *
     * With unlimited concurrency, or no more chunks than @p max_concurrent, each chunk
     * gets its own batch. Otherwise exactly @p max_concurrent batches are built and chunk
     * `i` goes to batch `i / (chunk_count / max_concurrent)`, the last batch taking
     * the overflow. Chunks within a batch stay ordered by offset.
     */
    [[nodiscard]] auto batch_chunks(std::vector<Chunk> chunks, int max_concurrent)
        -> std::vector<Batch>;
}

#endif
