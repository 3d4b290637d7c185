#include <t9s/kinds/KindRegistry.hpp>

#include <t9s/app/AppState.hpp>

#include <algorithm>
#include <string>

namespace T9 {

namespace {

constexpr std::string_view kTerminateReason{"Terminated from t9s"};

auto short_time(std::optional<std::string> const& iso) -> std::string {
    if (!iso || iso->empty()) {
        return "-";
    }
    std::string text = iso->substr(0, std::min<std::size_t>(iso->size(), 19));
    std::replace(text.begin(), text.end(), 'T', ' ');
    return text;
}

auto short_time(std::string const& iso) -> std::string {
    return short_time(std::optional<std::string>{iso});
}

auto leaf_is(AppState const& state, KindId kind) -> bool {
    return !state.location.route.empty() && state.location.leaf().kind == kind;
}

template <typename T>
auto selected_item(AppState const& state, KindId kind) -> T const* {
    auto const& slot = state.collection(kind);
    if (!slot.items) {
        return nullptr;
    }
    auto const* items = std::get_if<std::vector<T>>(&*slot.items);
    if (items == nullptr || slot.selection >= items->size()) {
        return nullptr;
    }
    return &(*items)[slot.selection];
}

template <typename T>
auto detail_payload(AppState const& state) -> T const* {
    if (!state.detail.payload) {
        return nullptr;
    }
    return std::get_if<T>(&*state.detail.payload);
}

template <typename T>
auto collection_items(AppState const& state, KindId kind) -> std::vector<T> const* {
    auto const& slot = state.collection(kind);
    if (!slot.items) {
        return nullptr;
    }
    return std::get_if<std::vector<T>>(&*slot.items);
}

auto focused_workflow(AppState const& state) -> WorkflowSummary const* {
    if (!leaf_is(state, KindId::WorkflowExecution)) {
        return nullptr;
    }
    if (state.location.leaf().id) {
        auto const* detail = detail_payload<WorkflowDetail>(state);
        return detail != nullptr ? &detail->summary : nullptr;
    }
    return selected_item<WorkflowSummary>(state, KindId::WorkflowExecution);
}

auto focused_schedule(AppState const& state) -> Schedule const* {
    if (!leaf_is(state, KindId::Schedule)) {
        return nullptr;
    }
    if (state.location.leaf().id) {
        return detail_payload<Schedule>(state);
    }
    return selected_item<Schedule>(state, KindId::Schedule);
}

auto focused_activity(AppState const& state) -> PendingActivity const* {
    if (!leaf_is(state, KindId::Activity)) {
        return nullptr;
    }
    if (state.location.leaf().id) {
        return detail_payload<PendingActivity>(state);
    }
    return selected_item<PendingActivity>(state, KindId::Activity);
}

auto run_operation(OperationId op, OperationTarget target, AppState const& state) -> std::vector<Effect> {
    return {RunOperation{state.location.ns, op, std::move(target)}};
}

auto quote_filter_value(std::string_view value) -> std::string {
    std::string quoted{"'"};
    for (char ch : value) {
        if (ch == '\'' || ch == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('\'');
    return quoted;
}

// -- workflows ---------------------------------------------------------------

auto workflow_summary_lines(WorkflowDetail const& detail) -> std::vector<std::string> {
    auto const&              s = detail.summary;
    std::vector<std::string> lines{
        "Workflow ID:    " + s.workflow_id,
        "Run ID:         " + s.run_id,
        "Type:           " + s.workflow_type,
        "Status:         " + std::string{workflowStatusLabel(s.status)},
        "Start Time:     " + short_time(s.start_time),
        "Close Time:     " + short_time(s.close_time),
        "Task Queue:     " + s.task_queue,
        "History Length: " + (s.history_length ? std::to_string(*s.history_length) : std::string{"-"}),
    };
    if (detail.parent_workflow_id) {
        lines.push_back("Parent:         " + *detail.parent_workflow_id);
    }
    if (!detail.memo.empty()) {
        lines.emplace_back("");
        lines.emplace_back("Memo");
        for (auto const& [key, value] : detail.memo) {
            lines.push_back("  " + key + ": " + value);
        }
    }
    if (!detail.search_attributes.empty()) {
        lines.emplace_back("");
        lines.emplace_back("Search Attributes");
        for (auto const& [key, value] : detail.search_attributes) {
            lines.push_back("  " + key + ": " + value);
        }
    }
    return lines;
}

auto workflow_io_lines(AppState const& state) -> std::vector<std::string> {
    if (state.history.events.empty()) {
        return {state.history.loading ? "Loading history..." : "No input or result recorded"};
    }
    std::vector<std::string> lines;
    for (auto const& event : state.history.events) {
        if (event.event_type == "WorkflowExecutionStarted" || event.event_type == "EVENT_TYPE_WORKFLOW_EXECUTION_STARTED") {
            lines.emplace_back("Input");
            lines.push_back("  " + event.details);
        }
        if (event.event_type.find("WorkflowExecutionCompleted") != std::string::npos
            || event.event_type == "EVENT_TYPE_WORKFLOW_EXECUTION_COMPLETED") {
            lines.emplace_back("Result");
            lines.push_back("  " + event.details);
        }
        if (event.event_type.find("WorkflowExecutionFailed") != std::string::npos
            || event.event_type == "EVENT_TYPE_WORKFLOW_EXECUTION_FAILED") {
            lines.emplace_back("Failure");
            lines.push_back("  " + event.details);
        }
    }
    if (lines.empty()) {
        lines.emplace_back("No input or result recorded");
    }
    return lines;
}

auto workflow_history_lines(AppState const& state) -> std::vector<std::string> {
    if (state.history.events.empty()) {
        return {state.history.loading ? "Loading history..." : "No events"};
    }
    std::vector<std::string> lines;
    lines.reserve(state.history.events.size());
    for (auto const& event : state.history.events) {
        std::string line = std::to_string(event.event_id);
        line.resize(std::max<std::size_t>(line.size(), 6), ' ');
        line += short_time(event.event_time) + "  " + event.event_type;
        lines.push_back(std::move(line));
    }
    return lines;
}

auto pending_activity_lines(std::vector<PendingActivity> const& activities) -> std::vector<std::string> {
    if (activities.empty()) {
        return {"No pending activities"};
    }
    std::vector<std::string> lines;
    for (auto const& activity : activities) {
        lines.push_back(activity.activity_id + "  " + activity.activity_type + "  "
                        + std::string{pendingActivityStateLabel(activity.state)} + "  attempt "
                        + std::to_string(activity.attempt));
        if (activity.last_failure) {
            lines.push_back("    last failure: " + *activity.last_failure);
        }
    }
    lines.emplace_back("");
    lines.emplace_back("Press Enter to open the activity list");
    return lines;
}

enum WorkflowTab : std::size_t {
    kWorkflowSummaryTab = 0,
    kWorkflowIoTab,
    kWorkflowHistoryTab,
    kWorkflowPendingTab,
    kWorkflowTaskQueueTab
};

auto make_workflow_spec() -> KindSpec {
    KindSpec spec;
    spec.id               = KindId::WorkflowExecution;
    spec.label            = "Workflows";
    spec.segment          = "workflows";
    spec.aliases          = {"workflow", "wf"};
    spec.root_addressable = true;
    spec.children         = {KindId::Activity};

    spec.identity.parse = [](std::string_view token, RouteSegment const*, QueryMap& query) -> std::optional<Identity> {
        WorkflowIdentity identity{std::string{token}, std::nullopt};
        auto             it = query.find(std::string{kQueryRunId});
        if (it != query.end()) {
            if (!it->second.empty()) {
                identity.run_id = it->second;
            }
            query.erase(it);
        }
        return identity;
    };
    spec.identity.format = [](Identity const& identity, QueryMap& query) -> std::string {
        auto const& wf = std::get<WorkflowIdentity>(identity);
        if (wf.run_id) {
            query.insert_or_assign(std::string{kQueryRunId}, *wf.run_id);
        }
        return wf.workflow_id;
    };
    spec.identity.label = [](Identity const& identity) -> std::string {
        return std::get<WorkflowIdentity>(identity).workflow_id;
    };

    CollectionSpec collection;
    collection.columns = {{"STATUS", 14}, {"WORKFLOW ID", 0}, {"TYPE", 28}, {"START TIME", 20}};
    collection.rows    = [](AppState const& state) {
        std::vector<Row> rows;
        if (auto const* items = collection_items<WorkflowSummary>(state, KindId::WorkflowExecution)) {
            rows.reserve(items->size());
            for (auto const& wf : *items) {
                rows.push_back({std::string{workflowStatusLabel(wf.status)}, wf.workflow_id, wf.workflow_type, short_time(wf.start_time)});
            }
        }
        return rows;
    };
    collection.is_loading = [](AppState const& state) { return state.collection(KindId::WorkflowExecution).loading; };
    collection.row_identity = [](AppState const& state, std::size_t row) -> std::optional<Identity> {
        auto const* items = collection_items<WorkflowSummary>(state, KindId::WorkflowExecution);
        if (items == nullptr || row >= items->size()) {
            return std::nullopt;
        }
        auto const&                run = (*items)[row].run_id;
        std::optional<std::string> runId;
        if (!run.empty()) {
            runId = run;
        }
        return WorkflowIdentity{(*items)[row].workflow_id, runId};
    };
    collection.base_filter = [](RouteSegment const& parent) -> std::optional<std::string> {
        if (!parent.id) {
            return std::nullopt;
        }
        if (auto const* schedule = std::get_if<ScheduleIdentity>(&*parent.id)) {
            return "TemporalScheduledById = " + quote_filter_value(schedule->schedule_id);
        }
        return std::nullopt;
    };
    collection.supports_filter = true;
    collection.pollable        = true;
    collection.paged           = true;
    collection.empty_label     = "No workflows found";
    spec.collection            = std::move(collection);

    DetailSpec detail;
    detail.tabs = {
        {"Summary", "summary", {}},
        {"Input/Output", "io", {"input", "output", "input-output"}},
        {"History", "history", {"events"}},
        {"Pending Activities", "pending", {"activities", "pending-activities"}},
        {"Task Queue", "task-queue", {"taskqueue", "tq"}},
    };
    detail.lines = [](AppState const& state, std::size_t tab) -> std::vector<std::string> {
        auto const* wf = detail_payload<WorkflowDetail>(state);
        if (tab == kWorkflowIoTab) {
            return workflow_io_lines(state);
        }
        if (tab == kWorkflowHistoryTab) {
            return workflow_history_lines(state);
        }
        if (wf == nullptr) {
            return {state.detail.loading ? "Loading workflow..." : "Workflow not loaded"};
        }
        switch (tab) {
        case kWorkflowPendingTab:
            return pending_activity_lines(wf->pending_activities);
        case kWorkflowTaskQueueTab:
            return {"Task Queue: " + wf->summary.task_queue, "", "Press Enter to inspect pollers"};
        default:
            return workflow_summary_lines(*wf);
        }
    };
    detail.companion_loads = [](std::string const& ns, Identity const& identity, std::size_t tab) -> std::vector<Effect> {
        if (tab != kWorkflowIoTab && tab != kWorkflowHistoryTab) {
            return {};
        }
        return {LoadHistory{ns, std::get<WorkflowIdentity>(identity)}};
    };
    detail.select = [](AppState const& state, std::size_t tab) -> std::optional<Location> {
        auto const& leaf = state.location.leaf();
        if (!leaf.id) {
            return std::nullopt;
        }
        if (tab == kWorkflowPendingTab) {
            return MakeChildCollectionLocation(state.location.ns, *leaf.id, KindId::Activity);
        }
        if (tab == kWorkflowTaskQueueTab) {
            auto const* wf = detail_payload<WorkflowDetail>(state);
            if (wf != nullptr && !wf->summary.task_queue.empty()) {
                return MakeDetailLocation(state.location.ns, TaskQueueIdentity{wf->summary.task_queue});
            }
        }
        return std::nullopt;
    };
    detail.pollable = true;
    spec.detail     = std::move(detail);

    auto running = [](AppState const& state) {
        auto const* wf = focused_workflow(state);
        return wf != nullptr && wf->status == WorkflowStatus::Running;
    };

    OperationSpec cancel;
    cancel.id                    = OperationId::CancelWorkflow;
    cancel.label                 = "Cancel workflow";
    cancel.key                   = KeyBinding::Char('c');
    cancel.requires_confirmation = true;
    cancel.applicability         = running;
    cancel.to_effects            = [](OperationTarget const& target, AppState const& state) {
        return run_operation(OperationId::CancelWorkflow, target, state);
    };
    spec.operations.push_back(std::move(cancel));

    OperationSpec terminate;
    terminate.id                    = OperationId::TerminateWorkflow;
    terminate.label                 = "Terminate workflow";
    terminate.key                   = KeyBinding::Char('t');
    terminate.requires_confirmation = true;
    terminate.applicability         = running;
    terminate.to_effects            = [](OperationTarget const& target, AppState const& state) {
        auto withReason = target;
        withReason.params.try_emplace(std::string{kParamReason}, std::string{kTerminateReason});
        return run_operation(OperationId::TerminateWorkflow, std::move(withReason), state);
    };
    spec.operations.push_back(std::move(terminate));

    // Signals need a name, so they come from the command line rather than a key.
    OperationSpec signal;
    signal.id            = OperationId::SignalWorkflow;
    signal.label         = "Signal workflow";
    signal.applicability = running;
    signal.to_effects    = [](OperationTarget const& target, AppState const& state) {
        return run_operation(OperationId::SignalWorkflow, target, state);
    };
    spec.operations.push_back(std::move(signal));
    return spec;
}

// -- schedules ---------------------------------------------------------------

auto schedule_lines(Schedule const& schedule) -> std::vector<std::string> {
    std::vector<std::string> lines{
        "Schedule ID:   " + schedule.schedule_id,
        "Workflow Type: " + schedule.workflow_type,
        "State:         " + std::string{schedule.paused() ? "Paused" : "Active"},
        "Spec:          " + (schedule.spec_description.empty() ? std::string{"-"} : schedule.spec_description),
        "Task Queue:    " + (schedule.task_queue.empty() ? std::string{"-"} : schedule.task_queue),
        "Next Run:      " + short_time(schedule.next_run),
        "Total Actions: " + std::to_string(schedule.action_count),
    };
    if (schedule.notes && !schedule.notes->empty()) {
        lines.push_back("Notes:         " + *schedule.notes);
    }
    lines.emplace_back("");
    lines.emplace_back("Press Enter to list workflows started by this schedule");
    return lines;
}

auto make_schedule_spec() -> KindSpec {
    KindSpec spec;
    spec.id               = KindId::Schedule;
    spec.label            = "Schedules";
    spec.segment          = "schedules";
    spec.aliases          = {"schedule", "sch"};
    spec.root_addressable = true;
    spec.children         = {KindId::WorkflowExecution};

    spec.identity.parse = [](std::string_view token, RouteSegment const*, QueryMap&) -> std::optional<Identity> {
        return ScheduleIdentity{std::string{token}};
    };
    spec.identity.format = [](Identity const& identity, QueryMap&) -> std::string {
        return std::get<ScheduleIdentity>(identity).schedule_id;
    };
    spec.identity.label = [](Identity const& identity) -> std::string {
        return std::get<ScheduleIdentity>(identity).schedule_id;
    };

    CollectionSpec collection;
    collection.columns = {{"SCHEDULE ID", 0}, {"WORKFLOW TYPE", 28}, {"STATE", 8}, {"NEXT RUN", 20}};
    collection.rows    = [](AppState const& state) {
        std::vector<Row> rows;
        if (auto const* items = collection_items<Schedule>(state, KindId::Schedule)) {
            rows.reserve(items->size());
            for (auto const& schedule : *items) {
                rows.push_back({schedule.schedule_id, schedule.workflow_type, schedule.paused() ? "Paused" : "Active",
                                short_time(schedule.next_run)});
            }
        }
        return rows;
    };
    collection.is_loading   = [](AppState const& state) { return state.collection(KindId::Schedule).loading; };
    collection.row_identity = [](AppState const& state, std::size_t row) -> std::optional<Identity> {
        auto const* items = collection_items<Schedule>(state, KindId::Schedule);
        if (items == nullptr || row >= items->size()) {
            return std::nullopt;
        }
        return ScheduleIdentity{(*items)[row].schedule_id};
    };
    collection.supports_filter = true;
    collection.pollable        = true;
    collection.empty_label     = "No schedules found";
    spec.collection            = std::move(collection);

    DetailSpec detail;
    detail.tabs  = {{"Summary", "summary", {}}, {"Recent Actions", "actions", {"recent"}}};
    detail.lines = [](AppState const& state, std::size_t tab) -> std::vector<std::string> {
        auto const* schedule = detail_payload<Schedule>(state);
        if (schedule == nullptr) {
            return {state.detail.loading ? "Loading schedule..." : "Schedule not loaded"};
        }
        if (tab == 1) {
            if (schedule->recent_actions.empty()) {
                return {"No recent actions"};
            }
            std::vector<std::string> lines;
            for (auto const& action : schedule->recent_actions) {
                lines.push_back(short_time(action));
            }
            return lines;
        }
        return schedule_lines(*schedule);
    };
    detail.select = [](AppState const& state, std::size_t) -> std::optional<Location> {
        auto const& leaf = state.location.leaf();
        if (!leaf.id) {
            return std::nullopt;
        }
        return MakeChildCollectionLocation(state.location.ns, *leaf.id, KindId::WorkflowExecution);
    };
    detail.pollable = true;
    spec.detail     = std::move(detail);

    auto has_schedule = [](AppState const& state) { return focused_schedule(state) != nullptr; };

    OperationSpec pause;
    pause.id            = OperationId::PauseSchedule;
    pause.label         = "Pause/unpause schedule";
    pause.key           = KeyBinding::Char('p');
    pause.applicability = has_schedule;
    pause.to_effects    = [](OperationTarget const& target, AppState const& state) {
        auto toggled = target;
        if (!toggled.params.contains(std::string{kParamPause})) {
            auto const* schedule = focused_schedule(state);
            bool        paused   = schedule != nullptr && schedule->paused();
            toggled.params.insert_or_assign(std::string{kParamPause}, paused ? "false" : "true");
        }
        return run_operation(OperationId::PauseSchedule, std::move(toggled), state);
    };
    spec.operations.push_back(std::move(pause));

    OperationSpec trigger;
    trigger.id                    = OperationId::TriggerSchedule;
    trigger.label                 = "Trigger schedule";
    trigger.key                   = KeyBinding::Char('T');
    trigger.requires_confirmation = true;
    trigger.applicability         = has_schedule;
    trigger.to_effects            = [](OperationTarget const& target, AppState const& state) {
        return run_operation(OperationId::TriggerSchedule, target, state);
    };
    spec.operations.push_back(std::move(trigger));

    OperationSpec remove;
    remove.id                    = OperationId::DeleteSchedule;
    remove.label                 = "Delete schedule";
    remove.key                   = KeyBinding::Char('d');
    remove.requires_confirmation = true;
    remove.removes_target        = true;
    remove.applicability         = has_schedule;
    remove.to_effects            = [](OperationTarget const& target, AppState const& state) {
        return run_operation(OperationId::DeleteSchedule, target, state);
    };
    spec.operations.push_back(std::move(remove));
    return spec;
}

// -- activities --------------------------------------------------------------

auto activity_lines(PendingActivity const& activity) -> std::vector<std::string> {
    std::vector<std::string> lines{
        "Activity ID:    " + activity.activity_id,
        "Type:           " + activity.activity_type,
        "State:          " + std::string{pendingActivityStateLabel(activity.state)} + (activity.paused ? " (paused)" : ""),
        "Attempt:        " + std::to_string(activity.attempt)
            + (activity.maximum_attempts > 0 ? " of " + std::to_string(activity.maximum_attempts) : std::string{}),
        "Scheduled:      " + short_time(activity.scheduled_time),
        "Last Started:   " + short_time(activity.last_started_time),
        "Expires:        " + short_time(activity.expiration_time),
    };
    if (activity.last_failure) {
        lines.emplace_back("");
        lines.emplace_back("Last Failure");
        lines.push_back("  " + *activity.last_failure);
    }
    return lines;
}

auto make_activity_spec() -> KindSpec {
    KindSpec spec;
    spec.id               = KindId::Activity;
    spec.label            = "Activities";
    spec.segment          = "activities";
    spec.aliases          = {"activity"};
    spec.root_addressable = false;

    spec.identity.parse = [](std::string_view token, RouteSegment const* parent, QueryMap&) -> std::optional<Identity> {
        if (parent == nullptr || !parent->id) {
            return std::nullopt;
        }
        auto const* workflow = std::get_if<WorkflowIdentity>(&*parent->id);
        if (workflow == nullptr) {
            return std::nullopt;
        }
        return ActivityIdentity{workflow->workflow_id, workflow->run_id, std::string{token}};
    };
    spec.identity.format = [](Identity const& identity, QueryMap&) -> std::string {
        return std::get<ActivityIdentity>(identity).activity_id;
    };
    spec.identity.label = [](Identity const& identity) -> std::string {
        return std::get<ActivityIdentity>(identity).activity_id;
    };

    CollectionSpec collection;
    collection.columns = {{"ACTIVITY ID", 16}, {"TYPE", 0}, {"STATE", 16}, {"ATTEMPT", 8}, {"LAST FAILURE", 32}};
    collection.rows    = [](AppState const& state) {
        std::vector<Row> rows;
        if (auto const* items = collection_items<PendingActivity>(state, KindId::Activity)) {
            rows.reserve(items->size());
            for (auto const& activity : *items) {
                std::string stateLabel{pendingActivityStateLabel(activity.state)};
                if (activity.paused && activity.state != PendingActivityState::Paused) {
                    stateLabel += " (paused)";
                }
                rows.push_back({activity.activity_id, activity.activity_type, stateLabel, std::to_string(activity.attempt),
                                activity.last_failure.value_or("")});
            }
        }
        return rows;
    };
    collection.is_loading   = [](AppState const& state) { return state.collection(KindId::Activity).loading; };
    collection.row_identity = [](AppState const& state, std::size_t row) -> std::optional<Identity> {
        auto const* items = collection_items<PendingActivity>(state, KindId::Activity);
        auto const* owner = state.location.parent();
        if (items == nullptr || row >= items->size() || owner == nullptr || !owner->id) {
            return std::nullopt;
        }
        auto const* workflow = std::get_if<WorkflowIdentity>(&*owner->id);
        if (workflow == nullptr) {
            return std::nullopt;
        }
        return ActivityIdentity{workflow->workflow_id, workflow->run_id, (*items)[row].activity_id};
    };
    collection.supports_filter = false;
    collection.pollable        = true;
    collection.empty_label     = "No pending activities";
    spec.collection            = std::move(collection);

    DetailSpec detail;
    detail.tabs  = {{"Summary", "summary", {}}};
    detail.lines = [](AppState const& state, std::size_t) -> std::vector<std::string> {
        auto const* activity = detail_payload<PendingActivity>(state);
        if (activity == nullptr) {
            return {state.detail.loading ? "Loading activity..." : "Activity is no longer pending"};
        }
        return activity_lines(*activity);
    };
    detail.pollable = true;
    spec.detail     = std::move(detail);

    OperationSpec pause;
    pause.id            = OperationId::PauseActivity;
    pause.label         = "Pause activity";
    pause.key           = KeyBinding::Char('p');
    pause.applicability = [](AppState const& state) {
        auto const* activity = focused_activity(state);
        return activity != nullptr && !activity->paused;
    };
    pause.to_effects = [](OperationTarget const& target, AppState const& state) {
        return run_operation(OperationId::PauseActivity, target, state);
    };
    spec.operations.push_back(std::move(pause));

    OperationSpec unpause;
    unpause.id            = OperationId::UnpauseActivity;
    unpause.label         = "Unpause activity";
    unpause.key           = KeyBinding::Char('u');
    unpause.applicability = [](AppState const& state) {
        auto const* activity = focused_activity(state);
        return activity != nullptr && activity->paused;
    };
    unpause.to_effects = [](OperationTarget const& target, AppState const& state) {
        return run_operation(OperationId::UnpauseActivity, target, state);
    };
    spec.operations.push_back(std::move(unpause));

    OperationSpec reset;
    reset.id                    = OperationId::ResetActivity;
    reset.label                 = "Reset activity";
    reset.key                   = KeyBinding::Char('R');
    reset.requires_confirmation = true;
    reset.applicability         = [](AppState const& state) { return focused_activity(state) != nullptr; };
    reset.to_effects            = [](OperationTarget const& target, AppState const& state) {
        return run_operation(OperationId::ResetActivity, target, state);
    };
    spec.operations.push_back(std::move(reset));
    return spec;
}

// -- task queues -------------------------------------------------------------

auto make_task_queue_spec() -> KindSpec {
    KindSpec spec;
    spec.id               = KindId::TaskQueue;
    spec.label            = "Task Queues";
    spec.segment          = "task-queues";
    spec.aliases          = {"task-queue", "taskqueues", "tq"};
    spec.root_addressable = true;

    spec.identity.parse = [](std::string_view token, RouteSegment const*, QueryMap&) -> std::optional<Identity> {
        return TaskQueueIdentity{std::string{token}};
    };
    spec.identity.format = [](Identity const& identity, QueryMap&) -> std::string {
        return std::get<TaskQueueIdentity>(identity).name;
    };
    spec.identity.label = [](Identity const& identity) -> std::string {
        return std::get<TaskQueueIdentity>(identity).name;
    };

    DetailSpec detail;
    detail.tabs  = {{"Pollers", "pollers", {}}};
    detail.lines = [](AppState const& state, std::size_t) -> std::vector<std::string> {
        auto const* info = detail_payload<TaskQueueInfo>(state);
        if (info == nullptr) {
            return {state.detail.loading ? "Loading task queue..." : "Task queue not loaded"};
        }
        std::vector<std::string> lines{"Task Queue: " + info->name};
        if (info->backlog_count_hint) {
            lines.push_back("Backlog:    " + std::to_string(*info->backlog_count_hint));
        }
        lines.emplace_back("");
        if (info->pollers.empty()) {
            lines.emplace_back("No pollers");
            return lines;
        }
        lines.emplace_back("Pollers");
        for (auto const& poller : info->pollers) {
            lines.push_back("  " + poller.identity + "  last access " + short_time(poller.last_access_time));
        }
        return lines;
    };
    detail.pollable = true;
    spec.detail     = std::move(detail);
    return spec;
}

} // namespace

auto RegisterBuiltinKinds(KindRegistryBuilder& builder) -> std::optional<Error> {
    if (auto error = builder.add(make_workflow_spec())) {
        return error;
    }
    if (auto error = builder.add(make_schedule_spec())) {
        return error;
    }
    if (auto error = builder.add(make_activity_spec())) {
        return error;
    }
    return builder.add(make_task_queue_spec());
}

} // namespace T9
