#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace T9 {

enum class ScheduleState {
    Active = 0,
    Paused
};

struct Schedule {
    std::string                schedule_id;
    std::string                workflow_type;
    ScheduleState              state{ScheduleState::Active};
    std::string                spec_description;
    std::string                task_queue;
    std::optional<std::string> next_run;
    std::vector<std::string>   recent_actions;
    std::int64_t               action_count{0};
    std::optional<std::string> notes;

    [[nodiscard]] auto paused() const -> bool { return state == ScheduleState::Paused; }

    bool operator==(Schedule const&) const = default;
};

} // namespace T9
