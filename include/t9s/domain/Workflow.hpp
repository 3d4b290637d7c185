#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace T9 {

enum class WorkflowStatus {
    Unknown = 0,
    Running,
    Completed,
    Failed,
    Canceled,
    Terminated,
    TimedOut,
    ContinuedAsNew
};

[[nodiscard]] auto workflowStatusLabel(WorkflowStatus status) -> std::string_view;
// Accepts both "RUNNING" and "WORKFLOW_EXECUTION_STATUS_RUNNING".
[[nodiscard]] auto parseWorkflowStatus(std::string_view text) -> WorkflowStatus;

struct WorkflowSummary {
    std::string                workflow_id;
    std::string                run_id;
    std::string                workflow_type;
    WorkflowStatus             status{WorkflowStatus::Unknown};
    std::string                start_time;
    std::optional<std::string> close_time;
    std::string                task_queue;
    std::optional<std::int64_t> history_length;

    bool operator==(WorkflowSummary const&) const = default;
};

enum class PendingActivityState {
    Unknown = 0,
    Scheduled,
    Started,
    CancelRequested,
    Paused,
    PauseRequested
};

[[nodiscard]] auto pendingActivityStateLabel(PendingActivityState state) -> std::string_view;
[[nodiscard]] auto parsePendingActivityState(std::string_view text) -> PendingActivityState;

struct PendingActivity {
    std::string                activity_id;
    std::string                activity_type;
    PendingActivityState       state{PendingActivityState::Unknown};
    int                        attempt{1};
    int                        maximum_attempts{0};
    std::optional<std::string> scheduled_time;
    std::optional<std::string> last_started_time;
    std::optional<std::string> expiration_time;
    std::optional<std::string> last_failure;
    bool                       paused{false};

    bool operator==(PendingActivity const&) const = default;
};

struct WorkflowDetail {
    WorkflowSummary                    summary;
    std::optional<std::string>         execution_time;
    std::optional<std::string>         parent_workflow_id;
    std::map<std::string, std::string> memo;
    std::map<std::string, std::string> search_attributes;
    std::vector<PendingActivity>       pending_activities;

    bool operator==(WorkflowDetail const&) const = default;
};

struct HistoryEvent {
    std::int64_t event_id{0};
    std::string  event_type;
    std::string  event_time;
    std::string  details;

    bool operator==(HistoryEvent const&) const = default;
};

} // namespace T9
