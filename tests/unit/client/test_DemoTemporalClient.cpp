#include <t9s/client/DemoTemporalClient.hpp>

#include <doctest/doctest.h>

#include <algorithm>

using namespace T9;

namespace {

auto workflows(Expected<Page> const& page) -> std::vector<WorkflowSummary> const& {
    REQUIRE(page.has_value());
    return std::get<std::vector<WorkflowSummary>>(page->items);
}

auto query(std::optional<std::string> filter = std::nullopt, std::string ns = "default") -> CollectionQuery {
    return CollectionQuery{std::move(ns), std::move(filter), std::nullopt};
}

} // namespace

TEST_SUITE("client.demo") {
    TEST_CASE("Workflows are listed per namespace, newest first") {
        DemoTemporalClient client;
        auto               page  = client.list_collection(KindId::WorkflowExecution, query(), std::nullopt);
        auto const&        items = workflows(page);
        CHECK(items.size() == 12);
        CHECK_FALSE(page->next_page_token.has_value());
        CHECK(items.front().start_time > items.back().start_time);
        CHECK(std::none_of(items.begin(), items.end(), [](WorkflowSummary const& wf) { return wf.workflow_id == "order-staging-1"; }));

        auto staging = client.list_collection(KindId::WorkflowExecution, query(std::nullopt, "staging"), std::nullopt);
        CHECK(workflows(staging).size() == 1);
    }

    TEST_CASE("Filters understand AND-joined equality clauses") {
        DemoTemporalClient client;
        auto running = client.list_collection(KindId::WorkflowExecution, query("ExecutionStatus = 'Running'"), std::nullopt);
        for (auto const& wf : workflows(running)) {
            CHECK(wf.status == WorkflowStatus::Running);
        }

        auto orders = client.list_collection(KindId::WorkflowExecution,
                                             query("(WorkflowType='OrderWorkflow') AND (ExecutionStatus='Failed')"), std::nullopt);
        REQUIRE(workflows(orders).size() == 1);
        CHECK(workflows(orders)[0].workflow_id == "order-11111");

        auto scheduled = client.list_collection(
                KindId::WorkflowExecution,
                query("(TemporalScheduledById = 'payroll-weekly') AND (ExecutionStatus='Running')"), std::nullopt);
        REQUIRE(workflows(scheduled).size() == 1);
        CHECK(workflows(scheduled)[0].workflow_type == "PayrollWorkflow");
    }

    TEST_CASE("Unsupported filters are validation errors") {
        DemoTemporalClient client;
        auto bad = client.list_collection(KindId::WorkflowExecution, query("StartTime > '2024'"), std::nullopt);
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::ValidationError);

        auto unknown = client.list_collection(KindId::WorkflowExecution, query("Color = 'red'"), std::nullopt);
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code == Error::Code::ValidationError);
    }

    TEST_CASE("Counts follow the same filters as the list") {
        DemoTemporalClient client;
        auto               all = client.count_workflows("default", std::nullopt);
        REQUIRE(all.has_value());
        CHECK(all->count == 12);

        auto failed = client.count_workflows("default", std::string{"(WorkflowType='OrderWorkflow') AND (ExecutionStatus='Failed')"});
        REQUIRE(failed.has_value());
        CHECK(failed->count == 1);

        auto bad = client.count_workflows("default", std::string{"Color = 'red'"});
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::ValidationError);
    }

    TEST_CASE("Paging hands out offsets as tokens") {
        DemoTemporalClient client(DemoTemporalClient::Options{5});
        auto               first = client.list_collection(KindId::WorkflowExecution, query(), std::nullopt);
        CHECK(workflows(first).size() == 5);
        REQUIRE(first->next_page_token == std::optional<std::string>{"5"});

        auto second = client.list_collection(KindId::WorkflowExecution, query(), first->next_page_token);
        CHECK(workflows(second).size() == 5);
        CHECK(workflows(second).front().workflow_id != workflows(first).front().workflow_id);

        auto third = client.list_collection(KindId::WorkflowExecution, query(), second->next_page_token);
        CHECK(workflows(third).size() == 2);
        CHECK_FALSE(third->next_page_token.has_value());
    }

    TEST_CASE("Schedules and activities") {
        DemoTemporalClient client;
        auto               schedules = client.list_collection(KindId::Schedule, query(), std::nullopt);
        REQUIRE(schedules.has_value());
        CHECK(std::get<std::vector<Schedule>>(schedules->items).size() == 2);

        auto payroll = client.list_collection(KindId::Schedule, query("Payroll"), std::nullopt);
        REQUIRE(payroll.has_value());
        CHECK(std::get<std::vector<Schedule>>(payroll->items).size() == 1);

        CollectionQuery activities{"default", std::nullopt, Identity{WorkflowIdentity{"order-99999", std::nullopt}}};
        auto            pending = client.list_collection(KindId::Activity, activities, std::nullopt);
        REQUIRE(pending.has_value());
        CHECK(std::get<std::vector<PendingActivity>>(pending->items).size() == 2);

        auto orphan = client.list_collection(KindId::Activity, query(), std::nullopt);
        REQUIRE_FALSE(orphan.has_value());
        CHECK(orphan.error().code == Error::Code::ValidationError);

        CHECK_FALSE(client.list_collection(KindId::TaskQueue, query(), std::nullopt).has_value());
    }

    TEST_CASE("Describe each kind") {
        DemoTemporalClient client;
        auto               wf = client.describe(KindId::WorkflowExecution, "default", WorkflowIdentity{"order-99999", std::nullopt});
        REQUIRE(wf.has_value());
        CHECK(std::get<WorkflowDetail>(*wf).pending_activities.size() == 2);

        auto schedule = client.describe(KindId::Schedule, "default", ScheduleIdentity{"report-monthly"});
        REQUIRE(schedule.has_value());
        CHECK(std::get<Schedule>(*schedule).paused());

        auto activity = client.describe(KindId::Activity, "default", ActivityIdentity{"order-99999", std::nullopt, "charge-card"});
        REQUIRE(activity.has_value());
        CHECK(std::get<PendingActivity>(*activity).attempt == 3);

        auto queue = client.describe(KindId::TaskQueue, "default", TaskQueueIdentity{"orders"});
        REQUIRE(queue.has_value());
        CHECK(std::get<TaskQueueInfo>(*queue).pollers.size() == 2);

        auto missing = client.describe(KindId::WorkflowExecution, "default", WorkflowIdentity{"nope", std::nullopt});
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFoundError);

        auto mismatch = client.describe(KindId::Schedule, "default", WorkflowIdentity{"order-99999", std::nullopt});
        REQUIRE_FALSE(mismatch.has_value());
        CHECK(mismatch.error().code == Error::Code::ValidationError);
    }

    TEST_CASE("Cancel closes the run and appends history") {
        DemoTemporalClient client;
        WorkflowIdentity   id{"order-12345", std::nullopt};
        auto               before = client.history("default", id);
        REQUIRE(before.has_value());

        OperationTarget target{KindId::WorkflowExecution, id, {}};
        CHECK(client.invoke("default", OperationId::CancelWorkflow, target).has_value());

        auto detail = client.describe(KindId::WorkflowExecution, "default", id);
        REQUIRE(detail.has_value());
        CHECK(std::get<WorkflowDetail>(*detail).summary.status == WorkflowStatus::Canceled);
        auto after = client.history("default", id);
        REQUIRE(after.has_value());
        CHECK(after->size() == before->size() + 1);
        CHECK(after->back().event_type == "WorkflowExecutionCanceled");

        // A closed run cannot be cancelled twice.
        auto again = client.invoke("default", OperationId::CancelWorkflow, target);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code == Error::Code::NotFoundError);
    }

    TEST_CASE("Signals need a name and valid JSON input") {
        DemoTemporalClient client;
        OperationTarget    target{KindId::WorkflowExecution, WorkflowIdentity{"payment-abc123", std::nullopt}, {}};
        CHECK(client.invoke("default", OperationId::SignalWorkflow, target).error().code == Error::Code::ValidationError);

        target.params[std::string{kParamSignalName}] = "approve";
        target.params[std::string{kParamInput}]      = "{not json";
        CHECK(client.invoke("default", OperationId::SignalWorkflow, target).error().code == Error::Code::ValidationError);

        target.params[std::string{kParamInput}] = R"({"by":"ops"})";
        CHECK(client.invoke("default", OperationId::SignalWorkflow, target).has_value());
        auto events = client.history("default", WorkflowIdentity{"payment-abc123", std::nullopt});
        REQUIRE(events.has_value());
        CHECK(events->back().event_type == "WorkflowExecutionSignaled");
        CHECK(events->back().details == R"(approve {"by":"ops"})");
    }

    TEST_CASE("Schedule operations") {
        DemoTemporalClient client;
        OperationTarget    target{KindId::Schedule, ScheduleIdentity{"payroll-weekly"}, {{std::string{kParamPause}, "true"}}};
        REQUIRE(client.invoke("default", OperationId::PauseSchedule, target).has_value());
        CHECK(std::get<Schedule>(*client.describe(KindId::Schedule, "default", target.identity)).paused());

        REQUIRE(client.invoke("default", OperationId::TriggerSchedule, target).has_value());
        auto scheduled = client.list_collection(KindId::WorkflowExecution,
                                                query("TemporalScheduledById = 'payroll-weekly'"), std::nullopt);
        CHECK(workflows(scheduled).size() == 3);
        CHECK(std::get<Schedule>(*client.describe(KindId::Schedule, "default", target.identity)).action_count == 3);

        REQUIRE(client.invoke("default", OperationId::DeleteSchedule, target).has_value());
        auto gone = client.describe(KindId::Schedule, "default", target.identity);
        REQUIRE_FALSE(gone.has_value());
        CHECK(gone.error().code == Error::Code::NotFoundError);
    }

    TEST_CASE("Activity operations") {
        DemoTemporalClient client;
        OperationTarget    target{KindId::Activity, ActivityIdentity{"order-99999", std::nullopt, "charge-card"}, {}};
        REQUIRE(client.invoke("default", OperationId::PauseActivity, target).has_value());
        auto paused = client.describe(KindId::Activity, "default", target.identity);
        CHECK(std::get<PendingActivity>(*paused).paused);

        REQUIRE(client.invoke("default", OperationId::ResetActivity, target).has_value());
        auto reset = std::get<PendingActivity>(*client.describe(KindId::Activity, "default", target.identity));
        CHECK(reset.attempt == 1);
        CHECK_FALSE(reset.last_failure.has_value());
        CHECK(reset.state == PendingActivityState::Paused);

        REQUIRE(client.invoke("default", OperationId::UnpauseActivity, target).has_value());
        CHECK_FALSE(std::get<PendingActivity>(*client.describe(KindId::Activity, "default", target.identity)).paused);
    }

    TEST_CASE("Unreachable server fails every call with a connection error") {
        DemoTemporalClient client;
        client.setReachable(false);
        CHECK(client.ping().error().code == Error::Code::ConnectionError);
        CHECK(client.list_namespaces().error().code == Error::Code::ConnectionError);
        CHECK(client.list_collection(KindId::Schedule, query(), std::nullopt).error().code == Error::Code::ConnectionError);
        CHECK(client.callCount() == 3);

        client.setReachable(true);
        CHECK(client.ping().has_value());
        auto namespaces = client.list_namespaces();
        REQUIRE(namespaces.has_value());
        CHECK(namespaces->size() == 2);
    }
}
