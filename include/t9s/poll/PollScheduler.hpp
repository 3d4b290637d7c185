#pragma once
#include <t9s/app/AppState.hpp>

#include <chrono>
#include <cstdint>
#include <optional>

namespace T9 {

// base * 2^errors, capped at the configured maximum. The exponent stops growing
// at 16 so the shift cannot overflow.
[[nodiscard]] auto EffectiveInterval(PollingConfig const& config, std::uint32_t errorCount) -> std::chrono::milliseconds;

/**
 * PollScheduler: decides when the next PollTick is due.
 *
 * The runtime calls observe() after every reduction. Polling is armed only
 * while it is enabled and the connection is up; a change of location re-anchors
 * the period so a freshly loaded view is not refreshed right away. The scheduler
 * never touches state; it only reads the snapshot it is given.
 */
class PollScheduler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    auto observe(AppState const& state, TimePoint now) -> void;
    auto on_tick(TimePoint now) -> void;

    [[nodiscard]] auto due(TimePoint now) const -> bool;
    [[nodiscard]] auto deadline() const -> std::optional<TimePoint>;
    [[nodiscard]] auto armed() const -> bool { return armed_; }
    [[nodiscard]] auto current_interval() const -> std::chrono::milliseconds { return interval_; }

private:
    bool                      armed_ = false;
    TimePoint                 anchor_{};
    std::chrono::milliseconds interval_{0};
    std::optional<Location>   location_;
};

} // namespace T9
