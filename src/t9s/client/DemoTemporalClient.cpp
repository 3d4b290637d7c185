#include <t9s/client/DemoTemporalClient.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <string_view>
#include <utility>

namespace T9 {

namespace {

constexpr std::string_view kDefaultNamespace{"default"};
constexpr std::string_view kStagingNamespace{"staging"};

struct Clause {
    std::string key;
    std::string value;
};

auto trim(std::string_view text, std::string_view extra = {}) -> std::string_view {
    auto strip = [extra](char ch) {
        return ch == ' ' || ch == '\t' || extra.find(ch) != std::string_view::npos;
    };
    while (!text.empty() && strip(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && strip(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto parse_filter(std::string_view filter) -> Expected<std::vector<Clause>> {
    constexpr std::string_view kAnd{" AND "};
    std::vector<Clause>        clauses;
    while (!trim(filter).empty()) {
        auto cut    = filter.find(kAnd);
        auto clause = trim(filter.substr(0, cut), "()");
        filter      = cut == std::string_view::npos ? std::string_view{} : filter.substr(cut + kAnd.size());

        auto equals = clause.find('=');
        if (equals == std::string_view::npos) {
            return std::unexpected(Error{Error::Code::ValidationError, "unsupported query clause: " + std::string{clause}});
        }
        auto key   = trim(clause.substr(0, equals));
        auto value = trim(clause.substr(equals + 1), "'\"");
        if (key.empty() || value.empty()) {
            return std::unexpected(Error{Error::Code::ValidationError, "unsupported query clause: " + std::string{clause}});
        }
        clauses.push_back(Clause{std::string{key}, std::string{value}});
    }
    return clauses;
}

auto matches(WorkflowSummary const& summary, std::optional<std::string> const& scheduledBy, Clause const& clause)
    -> Expected<bool> {
    if (clause.key == "WorkflowId") {
        return summary.workflow_id == clause.value;
    }
    if (clause.key == "WorkflowType") {
        return summary.workflow_type == clause.value;
    }
    if (clause.key == "ExecutionStatus") {
        return workflowStatusLabel(summary.status) == clause.value;
    }
    if (clause.key == "TaskQueue") {
        return summary.task_queue == clause.value;
    }
    if (clause.key == "TemporalScheduledById") {
        return scheduledBy == clause.value;
    }
    return std::unexpected(Error{Error::Code::ValidationError, "unknown search attribute " + clause.key});
}

auto page_offset(std::optional<std::string> const& token) -> std::size_t {
    if (!token || token->empty()) {
        return 0;
    }
    std::size_t offset = 0;
    auto        result = std::from_chars(token->data(), token->data() + token->size(), offset);
    return result.ec == std::errc{} ? offset : 0;
}

auto two_digits(int value) -> std::string {
    return value < 10 ? "0" + std::to_string(value) : std::to_string(value);
}

// Minutes after 2024-01-15T08:00:00Z.
auto demo_time(int minutes) -> std::string {
    int day  = 15 + minutes / (24 * 60);
    int hour = 8 + (minutes / 60) % 24;
    if (hour >= 24) {
        hour -= 24;
        ++day;
    }
    return "2024-01-" + two_digits(day) + "T" + two_digits(hour) + ":" + two_digits(minutes % 60) + ":00Z";
}

auto not_found(std::string what) -> Error {
    return Error{Error::Code::NotFoundError, std::move(what) + " not found"};
}

auto param(OperationTarget const& target, std::string_view key) -> std::optional<std::string> {
    auto it = target.params.find(std::string{key});
    if (it == target.params.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

DemoTemporalClient::DemoTemporalClient()
    : DemoTemporalClient(Options{}) {}

DemoTemporalClient::DemoTemporalClient(Options options)
    : options_(options) {
    if (options_.page_size <= 0) {
        options_.page_size = 50;
    }
    seed();
}

auto DemoTemporalClient::seed() -> void {
    namespaces_ = {
            Namespace{std::string{kDefaultNamespace}, "Registered", "Default namespace", std::nullopt, "72h"},
            Namespace{std::string{kStagingNamespace}, "Registered", "Pre-production", "ops@example.com", "24h"},
    };

    auto add = [this](std::string ns, std::string id, std::string type, WorkflowStatus status, std::string queue,
                      std::string input) -> StoredWorkflow& {
        WorkflowSummary summary;
        summary.workflow_id   = std::move(id);
        summary.run_id        = "run-" + std::to_string(++runCounter_);
        summary.workflow_type = std::move(type);
        summary.status        = status;
        summary.task_queue    = std::move(queue);
        return add_workflow(std::move(ns), std::move(summary), std::move(input));
    };

    auto ns = std::string{kDefaultNamespace};
    add(ns, "order-12345", "OrderWorkflow", WorkflowStatus::Running, "orders", R"({"orderId":"12345","amount":99.99})");
    add(ns, "order-67890", "OrderWorkflow", WorkflowStatus::Completed, "orders", R"({"orderId":"67890","amount":149.5})");
    add(ns, "order-11111", "OrderWorkflow", WorkflowStatus::Failed, "orders", R"({"orderId":"11111","amount":25})");
    add(ns, "payment-abc123", "PaymentWorkflow", WorkflowStatus::Running, "payments", R"({"paymentId":"abc123","method":"credit_card"})");
    add(ns, "notify-user-001", "NotificationWorkflow", WorkflowStatus::Completed, "notifications", R"({"userId":"user-001","channel":"email"})");
    add(ns, "pipeline-daily-2024", "DataPipelineWorkflow", WorkflowStatus::TimedOut, "pipelines", R"({"date":"2024-01-15"})");
    add(ns, "onboard-alice", "UserOnboardingWorkflow", WorkflowStatus::Canceled, "onboarding", R"({"userId":"alice","plan":"pro"})");
    add(ns, "cleanup-old-sessions", "CleanupWorkflow", WorkflowStatus::Terminated, "maintenance", R"({"olderThanDays":30})");
    add(ns, "monitor-prod-cluster", "MonitoringWorkflow", WorkflowStatus::Running, "monitoring", R"({"cluster":"prod-us-east-1"})");
    add(std::string{kStagingNamespace}, "order-staging-1", "OrderWorkflow", WorkflowStatus::Running, "orders", R"({"orderId":"s-1"})");

    auto& order = add(ns, "order-99999", "OrderWorkflow", WorkflowStatus::Running, "orders", R"({"orderId":"99999","amount":10})");
    order.detail.memo["customer"]                  = R"("dana@example.com")";
    order.detail.search_attributes["CustomStatus"] = R"("awaiting-payment")";
    order.detail.pending_activities.push_back(PendingActivity{
            "charge-card", "ChargeCard", PendingActivityState::Started, 3, 5, demo_time(1), demo_time(2), std::nullopt,
            "card declined", false});
    order.detail.pending_activities.push_back(PendingActivity{
            "send-receipt", "SendReceipt", PendingActivityState::Scheduled, 1, 0, demo_time(1), std::nullopt, std::nullopt,
            std::nullopt, false});

    Schedule payroll;
    payroll.schedule_id      = "payroll-weekly";
    payroll.workflow_type    = "PayrollWorkflow";
    payroll.spec_description = "0 9 * * MON";
    payroll.task_queue       = "payroll";
    payroll.next_run         = "2024-01-22T09:00:00Z";
    payroll.action_count     = 2;
    payroll.recent_actions   = {"2024-01-08T09:00:00Z", "2024-01-15T09:00:00Z"};
    schedules_.push_back(StoredSchedule{ns, payroll});

    Schedule report;
    report.schedule_id      = "report-monthly";
    report.workflow_type    = "ReportGeneratorWorkflow";
    report.state            = ScheduleState::Paused;
    report.spec_description = "every 720h";
    report.task_queue       = "reports";
    report.notes            = "paused until the new template ships";
    schedules_.push_back(StoredSchedule{ns, report});

    for (auto const& when : {"2024-01-08T09:00:00Z", "2024-01-15T09:00:00Z"}) {
        auto& run = add(ns, std::string{"payroll-weekly-"} + when, "PayrollWorkflow",
                        std::string_view{when}.starts_with("2024-01-15") ? WorkflowStatus::Running : WorkflowStatus::Completed,
                        "payroll", R"({"period":"weekly"})");
        run.scheduled_by = "payroll-weekly";
    }

    taskQueues_ = {
            TaskQueueInfo{"orders", {TaskQueuePoller{"worker-1@orders", demo_time(3), 100.0}, TaskQueuePoller{"worker-2@orders", demo_time(3), 100.0}}, 4},
            TaskQueueInfo{"payments", {TaskQueuePoller{"worker-1@payments", demo_time(3), 50.0}}, 0},
            TaskQueueInfo{"payroll", {}, 12},
    };
}

auto DemoTemporalClient::add_workflow(std::string ns, WorkflowSummary summary, std::string input) -> StoredWorkflow& {
    StoredWorkflow stored;
    stored.ns                     = std::move(ns);
    summary.start_time            = next_time();
    stored.detail.summary         = std::move(summary);
    stored.detail.execution_time  = stored.detail.summary.start_time;
    stored.history.push_back(HistoryEvent{1, "WorkflowExecutionStarted", stored.detail.summary.start_time, std::move(input)});
    stored.history.push_back(HistoryEvent{2, "WorkflowTaskScheduled", stored.detail.summary.start_time, "{}"});

    switch (stored.detail.summary.status) {
    case WorkflowStatus::Completed:
        stored.history.push_back(HistoryEvent{3, "WorkflowExecutionCompleted", next_time(), R"({"ok":true})"});
        break;
    case WorkflowStatus::Failed:
        stored.history.push_back(HistoryEvent{3, "WorkflowExecutionFailed", next_time(), "activity ChargeCard failed"});
        break;
    case WorkflowStatus::TimedOut:
        stored.history.push_back(HistoryEvent{3, "WorkflowExecutionTimedOut", next_time(), "{}"});
        break;
    case WorkflowStatus::Canceled:
        stored.history.push_back(HistoryEvent{3, "WorkflowExecutionCanceled", next_time(), "{}"});
        break;
    case WorkflowStatus::Terminated:
        stored.history.push_back(HistoryEvent{3, "WorkflowExecutionTerminated", next_time(), "manual cleanup"});
        break;
    default:
        break;
    }
    if (stored.detail.summary.status != WorkflowStatus::Running) {
        stored.detail.summary.close_time = stored.history.back().event_time;
    }
    stored.detail.summary.history_length = static_cast<std::int64_t>(stored.history.size());

    // Newest first, as the visibility API lists them.
    workflows_.insert(workflows_.begin(), std::move(stored));
    return workflows_.front();
}

auto DemoTemporalClient::find_workflow(std::string const& ns, WorkflowIdentity const& identity) -> StoredWorkflow* {
    for (auto& workflow : workflows_) {
        auto const& summary = workflow.detail.summary;
        if (workflow.ns == ns && summary.workflow_id == identity.workflow_id
            && (!identity.run_id || identity.run_id->empty() || *identity.run_id == summary.run_id)) {
            return &workflow;
        }
    }
    return nullptr;
}

auto DemoTemporalClient::find_schedule(std::string const& ns, std::string const& id) -> StoredSchedule* {
    auto it = std::find_if(schedules_.begin(), schedules_.end(), [&](StoredSchedule const& stored) {
        return stored.ns == ns && stored.schedule.schedule_id == id;
    });
    return it == schedules_.end() ? nullptr : &*it;
}

auto DemoTemporalClient::next_time() -> std::string {
    return demo_time(clock_++);
}

auto DemoTemporalClient::unreachable() -> std::optional<Error> {
    calls_.fetch_add(1);
    if (!reachable_.load()) {
        return Error{Error::Code::ConnectionError, "demo server unreachable"};
    }
    return std::nullopt;
}

auto DemoTemporalClient::setReachable(bool reachable) -> void {
    reachable_.store(reachable);
}

auto DemoTemporalClient::callCount() const -> std::size_t {
    return calls_.load();
}

auto DemoTemporalClient::matching_workflows(std::string const& ns, std::optional<std::string> const& filter)
    -> Expected<std::vector<WorkflowSummary>> {
    auto clauses = parse_filter(filter.value_or(""));
    if (!clauses) {
        return std::unexpected(std::move(clauses.error()));
    }
    std::vector<WorkflowSummary> matching;
    for (auto const& workflow : workflows_) {
        if (workflow.ns != ns) {
            continue;
        }
        bool keep = true;
        for (auto const& clause : *clauses) {
            auto hit = matches(workflow.detail.summary, workflow.scheduled_by, clause);
            if (!hit) {
                return std::unexpected(std::move(hit.error()));
            }
            keep = keep && *hit;
        }
        if (keep) {
            matching.push_back(workflow.detail.summary);
        }
    }
    return matching;
}

auto DemoTemporalClient::list_collection(KindId kind, CollectionQuery const& query, std::optional<std::string> const& pageToken)
    -> Expected<Page> {
    if (auto error = unreachable()) {
        return std::unexpected(std::move(*error));
    }
    std::lock_guard<std::mutex> lock(mutex_);

    switch (kind) {
    case KindId::WorkflowExecution: {
        auto found = matching_workflows(query.ns, query.filter);
        if (!found) {
            return std::unexpected(std::move(found.error()));
        }
        auto const& matching = *found;
        auto        offset = std::min(page_offset(pageToken), matching.size());
        auto end    = std::min(offset + static_cast<std::size_t>(options_.page_size), matching.size());
        std::vector<WorkflowSummary> page(matching.begin() + static_cast<std::ptrdiff_t>(offset),
                                          matching.begin() + static_cast<std::ptrdiff_t>(end));
        std::optional<std::string> next;
        if (end < matching.size()) {
            next = std::to_string(end);
        }
        return Page{std::move(page), std::move(next)};
    }
    case KindId::Schedule: {
        std::vector<Schedule> items;
        for (auto const& stored : schedules_) {
            if (stored.ns != query.ns) {
                continue;
            }
            if (query.filter && !query.filter->empty() && stored.schedule.schedule_id.find(*query.filter) == std::string::npos
                && stored.schedule.workflow_type.find(*query.filter) == std::string::npos) {
                continue;
            }
            items.push_back(stored.schedule);
        }
        return Page{std::move(items), std::nullopt};
    }
    case KindId::Activity: {
        auto const* parent = query.parent ? std::get_if<WorkflowIdentity>(&*query.parent) : nullptr;
        if (parent == nullptr) {
            return std::unexpected(Error{Error::Code::ValidationError, "activities are listed per workflow"});
        }
        auto* workflow = find_workflow(query.ns, *parent);
        if (workflow == nullptr) {
            return std::unexpected(not_found("workflow " + parent->workflow_id));
        }
        return Page{workflow->detail.pending_activities, std::nullopt};
    }
    case KindId::TaskQueue:
        break;
    }
    return std::unexpected(Error{Error::Code::OperationNotFound, std::string{kindName(kind)} + " has no collection"});
}

auto DemoTemporalClient::describe(KindId kind, std::string const& ns, Identity const& identity) -> Expected<DetailPayload> {
    if (auto error = unreachable()) {
        return std::unexpected(std::move(*error));
    }
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto const* wf = std::get_if<WorkflowIdentity>(&identity); wf != nullptr && kind == KindId::WorkflowExecution) {
        auto* workflow = find_workflow(ns, *wf);
        if (workflow == nullptr) {
            return std::unexpected(not_found("workflow " + wf->workflow_id));
        }
        return DetailPayload{workflow->detail};
    }
    if (auto const* id = std::get_if<ScheduleIdentity>(&identity); id != nullptr && kind == KindId::Schedule) {
        auto* stored = find_schedule(ns, id->schedule_id);
        if (stored == nullptr) {
            return std::unexpected(not_found("schedule " + id->schedule_id));
        }
        return DetailPayload{stored->schedule};
    }
    if (auto const* activity = std::get_if<ActivityIdentity>(&identity); activity != nullptr && kind == KindId::Activity) {
        auto* workflow = find_workflow(ns, WorkflowIdentity{activity->workflow_id, activity->run_id});
        if (workflow == nullptr) {
            return std::unexpected(not_found("workflow " + activity->workflow_id));
        }
        for (auto const& pending : workflow->detail.pending_activities) {
            if (pending.activity_id == activity->activity_id) {
                return DetailPayload{pending};
            }
        }
        return std::unexpected(not_found("activity " + activity->activity_id));
    }
    if (auto const* queue = std::get_if<TaskQueueIdentity>(&identity); queue != nullptr && kind == KindId::TaskQueue) {
        for (auto const& info : taskQueues_) {
            if (info.name == queue->name) {
                return DetailPayload{info};
            }
        }
        return DetailPayload{TaskQueueInfo{queue->name, {}, 0}};
    }
    return std::unexpected(Error{Error::Code::ValidationError, "identity does not match kind " + std::string{kindName(kind)}});
}

auto DemoTemporalClient::history(std::string const& ns, WorkflowIdentity const& workflow) -> Expected<std::vector<HistoryEvent>> {
    if (auto error = unreachable()) {
        return std::unexpected(std::move(*error));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto*                       stored = find_workflow(ns, workflow);
    if (stored == nullptr) {
        return std::unexpected(not_found("workflow " + workflow.workflow_id));
    }
    return stored->history;
}

auto DemoTemporalClient::count_workflows(std::string const& ns, std::optional<std::string> const& filter) -> Expected<WorkflowCount> {
    if (auto error = unreachable()) {
        return std::unexpected(std::move(*error));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = matching_workflows(ns, filter);
    if (!found) {
        return std::unexpected(std::move(found.error()));
    }
    return WorkflowCount{found->size()};
}

auto DemoTemporalClient::list_namespaces() -> Expected<std::vector<Namespace>> {
    if (auto error = unreachable()) {
        return std::unexpected(std::move(*error));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return namespaces_;
}

auto DemoTemporalClient::append_event(StoredWorkflow& workflow, std::string eventType, std::string details) -> void {
    auto id = static_cast<std::int64_t>(workflow.history.size()) + 1;
    workflow.history.push_back(HistoryEvent{id, std::move(eventType), next_time(), std::move(details)});
    workflow.detail.summary.history_length = static_cast<std::int64_t>(workflow.history.size());
}

auto DemoTemporalClient::close_workflow(StoredWorkflow& workflow, WorkflowStatus status, std::string eventType, std::string details)
    -> Expected<void> {
    if (workflow.detail.summary.status != WorkflowStatus::Running) {
        return std::unexpected(not_found("running workflow " + workflow.detail.summary.workflow_id));
    }
    append_event(workflow, std::move(eventType), std::move(details));
    workflow.detail.summary.status     = status;
    workflow.detail.summary.close_time = workflow.history.back().event_time;
    workflow.detail.pending_activities.clear();
    return {};
}

auto DemoTemporalClient::invoke(std::string const& ns, OperationId op, OperationTarget const& target) -> Expected<void> {
    if (auto error = unreachable()) {
        return std::unexpected(std::move(*error));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    t9_log("demo invoke " + std::string{operationName(op)}, "DemoTemporalClient");

    switch (op) {
    case OperationId::CancelWorkflow:
    case OperationId::TerminateWorkflow:
    case OperationId::SignalWorkflow: {
        auto const* identity = std::get_if<WorkflowIdentity>(&target.identity);
        auto*       workflow = identity != nullptr ? find_workflow(ns, *identity) : nullptr;
        if (workflow == nullptr) {
            return std::unexpected(not_found("workflow"));
        }
        if (op == OperationId::CancelWorkflow) {
            return close_workflow(*workflow, WorkflowStatus::Canceled, "WorkflowExecutionCanceled", "{}");
        }
        if (op == OperationId::TerminateWorkflow) {
            return close_workflow(*workflow, WorkflowStatus::Terminated, "WorkflowExecutionTerminated",
                                  param(target, kParamReason).value_or(""));
        }
        auto name = param(target, kParamSignalName);
        if (!name || name->empty()) {
            return std::unexpected(Error{Error::Code::ValidationError, "signal name is required"});
        }
        auto input = param(target, kParamInput).value_or("");
        if (!input.empty() && nlohmann::json::parse(input, nullptr, false).is_discarded()) {
            return std::unexpected(Error{Error::Code::ValidationError, "signal input is not valid JSON"});
        }
        if (workflow->detail.summary.status != WorkflowStatus::Running) {
            return std::unexpected(not_found("running workflow " + identity->workflow_id));
        }
        append_event(*workflow, "WorkflowExecutionSignaled", *name + (input.empty() ? "" : " " + input));
        return {};
    }
    case OperationId::PauseSchedule:
    case OperationId::TriggerSchedule:
    case OperationId::DeleteSchedule: {
        auto const* identity = std::get_if<ScheduleIdentity>(&target.identity);
        auto*       stored   = identity != nullptr ? find_schedule(ns, identity->schedule_id) : nullptr;
        if (stored == nullptr) {
            return std::unexpected(not_found("schedule"));
        }
        if (op == OperationId::DeleteSchedule) {
            std::erase_if(schedules_, [&](StoredSchedule const& other) { return &other == stored; });
            return {};
        }
        if (op == OperationId::PauseSchedule) {
            bool pause           = param(target, kParamPause).value_or("true") == "true";
            stored->schedule.state = pause ? ScheduleState::Paused : ScheduleState::Active;
            return {};
        }
        auto schedule = stored->schedule;
        auto when     = next_time();
        stored->schedule.recent_actions.push_back(when);
        stored->schedule.action_count += 1;

        WorkflowSummary summary;
        summary.workflow_id   = schedule.schedule_id + "-" + when;
        summary.run_id        = "run-" + std::to_string(++runCounter_);
        summary.workflow_type = schedule.workflow_type;
        summary.status        = WorkflowStatus::Running;
        summary.task_queue    = schedule.task_queue;
        add_workflow(ns, std::move(summary), "{}").scheduled_by = schedule.schedule_id;
        return {};
    }
    case OperationId::PauseActivity:
    case OperationId::UnpauseActivity:
    case OperationId::ResetActivity: {
        auto const* identity = std::get_if<ActivityIdentity>(&target.identity);
        auto*       workflow = identity != nullptr ? find_workflow(ns, WorkflowIdentity{identity->workflow_id, identity->run_id})
                                                   : nullptr;
        if (workflow == nullptr) {
            return std::unexpected(not_found("workflow"));
        }
        auto& pending = workflow->detail.pending_activities;
        auto  it      = std::find_if(pending.begin(), pending.end(),
                                     [&](PendingActivity const& activity) { return activity.activity_id == identity->activity_id; });
        if (it == pending.end()) {
            return std::unexpected(not_found("activity " + identity->activity_id));
        }
        if (op == OperationId::PauseActivity) {
            it->paused = true;
            it->state  = PendingActivityState::Paused;
        } else if (op == OperationId::UnpauseActivity) {
            it->paused = false;
            it->state  = PendingActivityState::Scheduled;
        } else {
            it->attempt      = 1;
            it->last_failure = std::nullopt;
            it->state        = it->paused ? PendingActivityState::Paused : PendingActivityState::Scheduled;
        }
        return {};
    }
    }
    return std::unexpected(Error{Error::Code::OperationNotFound, std::string{operationName(op)}});
}

auto DemoTemporalClient::ping() -> Expected<void> {
    if (auto error = unreachable()) {
        return std::unexpected(std::move(*error));
    }
    return {};
}

} // namespace T9
