#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Header-only backoff policies for retry loops.
 *
 * Each policy answers two questions: how long to wait before attempt
 * @c iteration + 1 (`delay(iteration)`), and, via `operator()`, performs that
 * wait on the calling thread. Callers that need to intercept the wait (tests,
 * code that sleeps on a condition variable) use `delay()` and do the waiting
 * themselves.
 *
 * Usage Scenarios:
 * - LoadBalancer, no candidate available: LinearBackoff (base * (n + 1))
 * - LoadBalancer, candidate failed validation: ConstantBackoff
 * - Unit Tests: NoBackoff
 */

#include <chrono>
#include <thread>

namespace workerpool::utils
{

// ============================================================================
// Backoff Strategies
// ============================================================================

/**
 * @brief Linearly growing backoff: wait base, 2*base, 3*base, ...
 *
 * Used while the pool has no healthy instance at all; recovery usually needs
 * a full health cycle, so the wait grows with every empty selection.
 *
 * @example
 * LinearBackoff backoff(std::chrono::seconds(1));
 * for (int attempt = 0; attempt <= max_retries; ++attempt) {
 *     if (try_select()) break;
 *     backoff(attempt); // 1s, 2s, 3s, ...
 * }
 */
struct LinearBackoff
{
    std::chrono::milliseconds base;

    explicit LinearBackoff(std::chrono::milliseconds b = std::chrono::milliseconds(1000))
        : base(b)
    {
    }

    [[nodiscard]] std::chrono::milliseconds delay(int iteration) const noexcept
    {
        return base * (iteration + 1);
    }

    void operator()(int iteration) const noexcept { std::this_thread::sleep_for(delay(iteration)); }
};

/**
 * @brief Constant backoff strategy with fixed delay.
 * @details Always waits the same duration regardless of iteration count.
 */
struct ConstantBackoff
{
    std::chrono::milliseconds base;

    explicit ConstantBackoff(std::chrono::milliseconds d = std::chrono::milliseconds(100))
        : base(d)
    {
    }

    [[nodiscard]] std::chrono::milliseconds delay(int iteration) const noexcept
    {
        (void)iteration;
        return base;
    }

    void operator()(int iteration) const noexcept { std::this_thread::sleep_for(delay(iteration)); }
};

/**
 * @brief Exponential backoff capped at @c cap.
 * @details base, 2*base, 4*base, ... never exceeding cap. Used for restarting
 *          a loop after repeated unexpected errors.
 */
struct ExponentialBackoff
{
    std::chrono::milliseconds base;
    std::chrono::milliseconds cap;

    explicit ExponentialBackoff(std::chrono::milliseconds b = std::chrono::milliseconds(100),
                                std::chrono::milliseconds c = std::chrono::milliseconds(30000))
        : base(b), cap(c)
    {
    }

    [[nodiscard]] std::chrono::milliseconds delay(int iteration) const noexcept
    {
        auto d = base;
        for (int i = 0; i < iteration && d < cap; ++i)
        {
            d *= 2;
        }
        return d < cap ? d : cap;
    }

    void operator()(int iteration) const noexcept { std::this_thread::sleep_for(delay(iteration)); }
};

/**
 * @brief No-op backoff strategy.
 * WARNING: only for tests; a retry loop with NoBackoff spins.
 */
struct NoBackoff
{
    [[nodiscard]] std::chrono::milliseconds delay(int iteration) const noexcept
    {
        (void)iteration;
        return std::chrono::milliseconds(0);
    }

    void operator()(int iteration) const noexcept { (void)iteration; }
};

} // namespace workerpool::utils
