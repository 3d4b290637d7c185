#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace T9 {

enum class KindId : std::uint8_t {
    WorkflowExecution = 0,
    Schedule,
    Activity,
    TaskQueue
};

inline constexpr std::size_t kKindCount = 4;

inline constexpr std::array<KindId, kKindCount> kAllKinds{
    KindId::WorkflowExecution, KindId::Schedule, KindId::Activity, KindId::TaskQueue};

[[nodiscard]] constexpr auto kindIndex(KindId kind) -> std::size_t {
    return static_cast<std::size_t>(kind);
}

[[nodiscard]] inline auto kindName(KindId kind) -> std::string_view {
    switch (kind) {
    case KindId::WorkflowExecution:
        return "workflow_execution";
    case KindId::Schedule:
        return "schedule";
    case KindId::Activity:
        return "activity";
    case KindId::TaskQueue:
        return "task_queue";
    }
    return "unknown";
}

enum class OperationId : std::uint8_t {
    CancelWorkflow = 0,
    TerminateWorkflow,
    SignalWorkflow,
    PauseSchedule,
    TriggerSchedule,
    DeleteSchedule,
    PauseActivity,
    UnpauseActivity,
    ResetActivity
};

[[nodiscard]] inline auto operationName(OperationId op) -> std::string_view {
    switch (op) {
    case OperationId::CancelWorkflow:
        return "cancel_workflow";
    case OperationId::TerminateWorkflow:
        return "terminate_workflow";
    case OperationId::SignalWorkflow:
        return "signal_workflow";
    case OperationId::PauseSchedule:
        return "pause_schedule";
    case OperationId::TriggerSchedule:
        return "trigger_schedule";
    case OperationId::DeleteSchedule:
        return "delete_schedule";
    case OperationId::PauseActivity:
        return "pause_activity";
    case OperationId::UnpauseActivity:
        return "unpause_activity";
    case OperationId::ResetActivity:
        return "reset_activity";
    }
    return "unknown";
}

} // namespace T9
