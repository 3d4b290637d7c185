#pragma once
#include <t9s/app/Action.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace T9 {

// Multi-producer queue feeding the single reducer loop. Workers post
// completions; only the runtime thread pops.
class ActionChannel {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    // Returns false once the channel is closed; the action is dropped.
    auto post(Action action) -> bool;

    auto try_pop() -> std::optional<Action>;

    // Blocks until an action arrives, the deadline passes or the channel closes.
    auto wait_pop(TimePoint deadline) -> std::optional<Action>;

    auto close() -> void;

    [[nodiscard]] auto closed() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<Action>      queue_;
    bool                    closed_ = false;
};

} // namespace T9
