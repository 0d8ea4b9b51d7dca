/*

backoff.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace mailcast::detail
{

/**
 * Retry policy for send attempts on one session.
 * The delay computation is a pure function of the attempt number unless jitter is enabled.
 */
struct retry_policy
{
    /// Total attempts for one recipient, first try included
    unsigned int max_attempts = 3;

    /// Delay before the second attempt
    std::chrono::milliseconds initial_delay{1000};

    /// Upper bound for any single delay
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff (2.0 doubles delay each attempt)
    double backoff_multiplier = 2.0;

    /// Random jitter in [0, 1), 0.25 = +/-25%
    double jitter_factor = 0.0;

    /// No retries at all
    static retry_policy none()
    {
        retry_policy policy;
        policy.max_attempts = 1;
        return policy;
    }

    /// Short delays, used by tests and the fast_test preset
    static retry_policy immediate(unsigned int attempts = 3)
    {
        retry_policy policy;
        policy.max_attempts = attempts;
        policy.initial_delay = std::chrono::milliseconds{1};
        policy.max_delay = std::chrono::milliseconds{5};
        return policy;
    }

    /**
     * Delay to wait after failed attempt `attempt` (1-based) before the next one.
     * delay(n) = min(initial_delay * multiplier^(n-1), max_delay)
     */
    [[nodiscard]] std::chrono::milliseconds delay(unsigned int attempt) const
    {
        if (attempt <= 1)
            return clamp(initial_delay);

        double delay_ms = static_cast<double>(initial_delay.count());
        for (unsigned int i = 1; i < attempt; ++i)
        {
            delay_ms *= backoff_multiplier;
            if (delay_ms > static_cast<double>(max_delay.count()))
            {
                delay_ms = static_cast<double>(max_delay.count());
                break;
            }
        }

        if (jitter_factor > 0.0)
        {
            thread_local std::mt19937 rng(std::random_device{}());
            std::uniform_real_distribution<double> dist(1.0 - jitter_factor, 1.0 + jitter_factor);
            delay_ms *= dist(rng);
        }

        return clamp(std::chrono::milliseconds(static_cast<std::int64_t>(delay_ms)));
    }

    /// True when another attempt is allowed after `attempts_made` attempts.
    [[nodiscard]] bool should_retry(unsigned int attempts_made) const noexcept
    {
        return attempts_made < max_attempts;
    }

private:
    [[nodiscard]] std::chrono::milliseconds clamp(std::chrono::milliseconds value) const noexcept
    {
        if (value > max_delay)
            return max_delay;
        if (value.count() < 0)
            return std::chrono::milliseconds{0};
        return value;
    }
};

} // namespace mailcast::detail
