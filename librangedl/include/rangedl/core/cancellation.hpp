// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_CORE_CANCELLATION_HPP
#define RANGEDL_CORE_CANCELLATION_HPP

#include <chrono>
#include <memory>
#include <optional>

namespace rangedl
{
    /**
     * Cooperative cancellation handle.
     *
     * Copies share the same state: cancelling any copy cancels all of them.
     * A token may also carry a deadline, after which it reports itself as
     * cancelled without anyone calling @ref cancel.
     *
     * libcurl transfers poll the token from their progress callback, which runs
     * about once per second while a transfer is idle: an explicit @ref cancel may
     * take up to a second to interrupt a stalled transfer. A deadline is also
     * handed to libcurl as the transfer timeout and is honoured without that delay.
     */
    class CancellationToken
    {
    public:

        using clock_type = std::chrono::steady_clock;

        CancellationToken();

        [[nodiscard]] static auto with_deadline(clock_type::time_point deadline) -> CancellationToken;
        [[nodiscard]] static auto with_timeout(clock_type::duration timeout) -> CancellationToken;

        void cancel() const noexcept;
        [[nodiscard]] auto is_cancelled() const noexcept -> bool;
        [[nodiscard]] auto deadline() const noexcept -> std::optional<clock_type::time_point>;

    private:

        struct State;
        std::shared_ptr<State> p_state;
    };
}

#endif
