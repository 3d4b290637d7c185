#pragma once
#include <t9s/kinds/KindId.hpp>

#include <optional>
#include <string>
#include <variant>

namespace T9 {

struct WorkflowIdentity {
    std::string                workflow_id;
    std::optional<std::string> run_id;

    bool operator==(WorkflowIdentity const&) const = default;
};

struct ScheduleIdentity {
    std::string schedule_id;

    bool operator==(ScheduleIdentity const&) const = default;
};

// Pending activities only exist inside a workflow execution, so the identity
// carries the owning workflow.
struct ActivityIdentity {
    std::string                workflow_id;
    std::optional<std::string> run_id;
    std::string                activity_id;

    bool operator==(ActivityIdentity const&) const = default;
};

struct TaskQueueIdentity {
    std::string name;

    bool operator==(TaskQueueIdentity const&) const = default;
};

using Identity = std::variant<WorkflowIdentity, ScheduleIdentity, ActivityIdentity, TaskQueueIdentity>;

[[nodiscard]] inline auto identityKind(Identity const& identity) -> KindId {
    switch (identity.index()) {
    case 0:
        return KindId::WorkflowExecution;
    case 1:
        return KindId::Schedule;
    case 2:
        return KindId::Activity;
    default:
        return KindId::TaskQueue;
    }
}

[[nodiscard]] inline auto owningWorkflow(Identity const& identity) -> std::optional<WorkflowIdentity> {
    if (auto const* wf = std::get_if<WorkflowIdentity>(&identity)) {
        return *wf;
    }
    if (auto const* activity = std::get_if<ActivityIdentity>(&identity)) {
        return WorkflowIdentity{activity->workflow_id, activity->run_id};
    }
    return std::nullopt;
}

} // namespace T9
