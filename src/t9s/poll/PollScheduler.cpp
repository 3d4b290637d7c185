#include <t9s/poll/PollScheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace T9 {

auto EffectiveInterval(PollingConfig const& config, std::uint32_t errorCount) -> std::chrono::milliseconds {
    auto const exponent = std::min<std::uint32_t>(errorCount, 16);
    auto const scaled   = config.base_interval * (std::int64_t{1} << exponent);
    return std::min(scaled, std::max(config.max_interval, config.base_interval));
}

auto PollScheduler::observe(AppState const& state, TimePoint now) -> void {
    bool const active = state.polling.enabled && state.connection == ConnectionStatus::Connected;
    if (!active) {
        if (armed_) {
            t9_log("PollScheduler disarmed", "PollScheduler");
        }
        armed_ = false;
        location_.reset();
        return;
    }

    interval_ = EffectiveInterval(state.polling, state.error_count);
    if (!armed_ || location_ != state.location) {
        armed_    = true;
        anchor_   = now;
        location_ = state.location;
        t9_log("PollScheduler armed, interval " + std::to_string(interval_.count()) + "ms", "PollScheduler");
    }
}

auto PollScheduler::on_tick(TimePoint now) -> void {
    anchor_ = now;
}

auto PollScheduler::due(TimePoint now) const -> bool {
    return armed_ && now >= anchor_ + interval_;
}

auto PollScheduler::deadline() const -> std::optional<TimePoint> {
    if (!armed_) {
        return std::nullopt;
    }
    return anchor_ + interval_;
}

} // namespace T9
