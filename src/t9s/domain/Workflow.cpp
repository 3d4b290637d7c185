#include <t9s/domain/Workflow.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace T9 {

namespace {

constexpr std::string_view kStatusPrefix{"WORKFLOW_EXECUTION_STATUS_"};
constexpr std::string_view kActivityStatePrefix{"PENDING_ACTIVITY_STATE_"};

constexpr std::array<std::pair<std::string_view, WorkflowStatus>, 7> kStatusNames{{
    {"RUNNING", WorkflowStatus::Running},
    {"COMPLETED", WorkflowStatus::Completed},
    {"FAILED", WorkflowStatus::Failed},
    {"CANCELED", WorkflowStatus::Canceled},
    {"TERMINATED", WorkflowStatus::Terminated},
    {"TIMED_OUT", WorkflowStatus::TimedOut},
    {"CONTINUED_AS_NEW", WorkflowStatus::ContinuedAsNew},
}};

constexpr std::array<std::pair<std::string_view, PendingActivityState>, 5> kActivityStateNames{{
    {"SCHEDULED", PendingActivityState::Scheduled},
    {"STARTED", PendingActivityState::Started},
    {"CANCEL_REQUESTED", PendingActivityState::CancelRequested},
    {"PAUSED", PendingActivityState::Paused},
    {"PAUSE_REQUESTED", PendingActivityState::PauseRequested},
}};

auto strip_prefix(std::string_view text, std::string_view prefix) -> std::string_view {
    if (text.starts_with(prefix)) {
        text.remove_prefix(prefix.size());
    }
    return text;
}

} // namespace

auto workflowStatusLabel(WorkflowStatus status) -> std::string_view {
    switch (status) {
    case WorkflowStatus::Running:
        return "Running";
    case WorkflowStatus::Completed:
        return "Completed";
    case WorkflowStatus::Failed:
        return "Failed";
    case WorkflowStatus::Canceled:
        return "Canceled";
    case WorkflowStatus::Terminated:
        return "Terminated";
    case WorkflowStatus::TimedOut:
        return "TimedOut";
    case WorkflowStatus::ContinuedAsNew:
        return "ContinuedAsNew";
    case WorkflowStatus::Unknown:
        break;
    }
    return "Unknown";
}

auto parseWorkflowStatus(std::string_view text) -> WorkflowStatus {
    auto name = strip_prefix(text, kStatusPrefix);
    auto it   = std::find_if(kStatusNames.begin(), kStatusNames.end(), [&](auto const& entry) { return entry.first == name; });
    return it == kStatusNames.end() ? WorkflowStatus::Unknown : it->second;
}

auto pendingActivityStateLabel(PendingActivityState state) -> std::string_view {
    switch (state) {
    case PendingActivityState::Scheduled:
        return "Scheduled";
    case PendingActivityState::Started:
        return "Started";
    case PendingActivityState::CancelRequested:
        return "CancelRequested";
    case PendingActivityState::Paused:
        return "Paused";
    case PendingActivityState::PauseRequested:
        return "PauseRequested";
    case PendingActivityState::Unknown:
        break;
    }
    return "Unknown";
}

auto parsePendingActivityState(std::string_view text) -> PendingActivityState {
    auto name = strip_prefix(text, kActivityStatePrefix);
    auto it   = std::find_if(kActivityStateNames.begin(), kActivityStateNames.end(), [&](auto const& entry) {
        return entry.first == name;
    });
    return it == kActivityStateNames.end() ? PendingActivityState::Unknown : it->second;
}

} // namespace T9
