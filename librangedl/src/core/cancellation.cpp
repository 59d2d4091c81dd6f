// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>
#include <optional>

#include "rangedl/core/cancellation.hpp"

namespace rangedl
{
    struct CancellationToken::State
    {
        std::atomic<bool> cancelled = false;
        std::optional<clock_type::time_point> deadline = std::nullopt;
    };

    CancellationToken::CancellationToken()
        : p_state(std::make_shared<State>())
    {
    }

    auto CancellationToken::with_deadline(clock_type::time_point deadline) -> CancellationToken
    {
        CancellationToken token;
        token.p_state->deadline = deadline;
        return token;
    }

    auto CancellationToken::with_timeout(clock_type::duration timeout) -> CancellationToken
    {
        return with_deadline(clock_type::now() + timeout);
    }

    void CancellationToken::cancel() const noexcept
    {
        p_state->cancelled.store(true, std::memory_order_release);
    }

    auto CancellationToken::is_cancelled() const noexcept -> bool
    {
        if (p_state->cancelled.load(std::memory_order_acquire))
        {
            return true;
        }
        return p_state->deadline.has_value() && clock_type::now() >= p_state->deadline.value();
    }

    auto CancellationToken::deadline() const noexcept -> std::optional<clock_type::time_point>
    {
        return p_state->deadline;
    }
}
