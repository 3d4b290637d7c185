#pragma once

#include <t9s/core/Error.hpp>

#include <cstddef>
#include <functional>
#include <optional>

namespace T9 {

/**
 * Executor: interface for running background jobs.
 *
 * Contract
 * --------
 * - submit(...) returns std::nullopt on success, or an Error on refusal
 *   (executor shutting down).
 * - shutdown() stops accepting jobs, wakes the workers and lets the jobs that
 *   already started finish. Queued jobs that never started are dropped.
 * - size() is the number of worker threads.
 *
 * Implementations must accept concurrent submit() calls and a shutdown() while
 * jobs are still running.
 */
struct Executor {
    using Job = std::function<void()>;

    virtual ~Executor() = default;

    virtual auto submit(Job job) -> std::optional<Error> = 0;
    virtual auto shutdown() -> void                      = 0;
    virtual auto size() const -> std::size_t             = 0;
};

} // namespace T9
