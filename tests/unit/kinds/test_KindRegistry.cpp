#include <t9s/app/AppState.hpp>
#include <t9s/kinds/KindRegistry.hpp>

#include <doctest/doctest.h>

using namespace T9;

namespace {

auto minimal_spec(KindId id, std::string segment) -> KindSpec {
    KindSpec spec;
    spec.id      = id;
    spec.label   = segment;
    spec.segment = std::move(segment);
    spec.identity.parse = [](std::string_view token, RouteSegment const*, QueryMap&) -> std::optional<Identity> {
        return TaskQueueIdentity{std::string{token}};
    };
    spec.identity.format = [](Identity const&, QueryMap&) -> std::string { return "x"; };
    spec.identity.label  = [](Identity const&) -> std::string { return "x"; };
    DetailSpec detail;
    detail.tabs  = {{"Main", "main", {}}};
    detail.lines = [](AppState const&, std::size_t) -> std::vector<std::string> { return {}; };
    spec.detail  = std::move(detail);
    return spec;
}

auto workflow_list_state(WorkflowStatus status) -> AppState {
    auto state = MakeInitialState(MakeCollectionLocation("default", KindId::WorkflowExecution), PollingConfig{});
    WorkflowSummary wf;
    wf.workflow_id   = "order-1";
    wf.run_id        = "run-1";
    wf.workflow_type = "OrderWorkflow";
    wf.status        = status;
    state.collection(KindId::WorkflowExecution).items = std::vector<WorkflowSummary>{wf};
    return state;
}

} // namespace

TEST_SUITE("kinds.registry") {
    TEST_CASE("Default registry covers every kind") {
        auto registry = MakeDefaultKindRegistry();
        REQUIRE(registry.has_value());
        for (auto kind : kAllKinds) {
            CHECK(registry->get(kind).id == kind);
            CHECK_FALSE(registry->get(kind).segment.empty());
        }
        CHECK(registry->get(KindId::TaskQueue).collection == std::nullopt);
        CHECK_FALSE(registry->get(KindId::Activity).root_addressable);
        CHECK(registry->get(KindId::Schedule).allowsChild(KindId::WorkflowExecution));
        CHECK(registry->get(KindId::WorkflowExecution).allowsChild(KindId::Activity));
    }

    TEST_CASE("Segments and aliases resolve to kinds") {
        auto registry = MakeDefaultKindRegistry();
        REQUIRE(registry.has_value());
        CHECK(registry->kindForSegment("workflows") == KindId::WorkflowExecution);
        CHECK(registry->kindForSegment("wf") == KindId::WorkflowExecution);
        CHECK(registry->kindForSegment("schedules") == KindId::Schedule);
        CHECK(registry->kindForSegment("activities") == KindId::Activity);
        CHECK(registry->kindForSegment("tq") == KindId::TaskQueue);
        CHECK(registry->kindForSegment("Workflows") == std::nullopt);
        CHECK(registry->kindForSegment("") == std::nullopt);
    }

    TEST_CASE("Detail tabs resolve slugs and aliases") {
        auto registry = MakeDefaultKindRegistry();
        REQUIRE(registry.has_value());
        auto const& detail = *registry->get(KindId::WorkflowExecution).detail;
        CHECK(detail.tabIndex(std::nullopt) == 0);
        CHECK(detail.tabIndex(std::string{"history"}) == 2);
        CHECK(detail.tabIndex(std::string{"events"}) == 2);
        CHECK(detail.tabIndex(std::string{"input"}) == 1);
        CHECK(detail.tabIndex(std::string{"no-such-tab"}) == 0);
    }

    TEST_CASE("Builder rejects bad registrations") {
        SUBCASE("Duplicate kind") {
            KindRegistryBuilder builder;
            CHECK_FALSE(builder.add(minimal_spec(KindId::TaskQueue, "queues")));
            auto error = builder.add(minimal_spec(KindId::TaskQueue, "other"));
            REQUIRE(error.has_value());
            CHECK(error->code == Error::Code::InvalidConfiguration);
        }
        SUBCASE("Segment collision") {
            KindRegistryBuilder builder;
            CHECK_FALSE(builder.add(minimal_spec(KindId::TaskQueue, "things")));
            CHECK(builder.add(minimal_spec(KindId::Schedule, "things")).has_value());
        }
        SUBCASE("No views") {
            KindRegistryBuilder builder;
            auto                spec = minimal_spec(KindId::TaskQueue, "queues");
            spec.detail.reset();
            CHECK(builder.add(std::move(spec)).has_value());
        }
        SUBCASE("Operations sharing a key") {
            KindRegistryBuilder builder;
            auto                spec = minimal_spec(KindId::TaskQueue, "queues");
            for (auto id : {OperationId::PauseActivity, OperationId::ResetActivity}) {
                OperationSpec op;
                op.id            = id;
                op.label         = "op";
                op.key           = KeyBinding::Char('x');
                op.applicability = [](AppState const&) { return true; };
                op.to_effects    = [](OperationTarget const&, AppState const&) { return std::vector<Effect>{}; };
                spec.operations.push_back(std::move(op));
            }
            auto error = builder.add(std::move(spec));
            REQUIRE(error.has_value());
            CHECK(error->message->find("share key") != std::string::npos);
        }
        SUBCASE("Missing kinds fail finalize") {
            KindRegistryBuilder builder;
            CHECK_FALSE(builder.add(minimal_spec(KindId::TaskQueue, "queues")));
            auto registry = std::move(builder).finalize();
            REQUIRE_FALSE(registry.has_value());
            CHECK(registry.error().code == Error::Code::InvalidConfiguration);
        }
    }

    TEST_CASE("Operations follow the focused item") {
        auto registry = MakeDefaultKindRegistry();
        REQUIRE(registry.has_value());

        auto running = workflow_list_state(WorkflowStatus::Running);
        auto ops     = registry->operations_for(KindId::WorkflowExecution, running);
        REQUIRE(ops.size() == 3);
        CHECK(ops[0]->id == OperationId::CancelWorkflow);
        CHECK(ops[1]->id == OperationId::TerminateWorkflow);
        CHECK(ops[2]->id == OperationId::SignalWorkflow);

        auto completed = workflow_list_state(WorkflowStatus::Completed);
        CHECK(registry->operations_for(KindId::WorkflowExecution, completed).empty());
    }

    TEST_CASE("Resolving an operation produces a RunOperation effect") {
        auto registry = MakeDefaultKindRegistry();
        REQUIRE(registry.has_value());
        auto state = workflow_list_state(WorkflowStatus::Running);

        OperationTarget target{KindId::WorkflowExecution, WorkflowIdentity{"order-1", "run-1"}, {}};
        auto            effects = registry->resolve_effects(KindId::WorkflowExecution, OperationId::TerminateWorkflow, target, state);
        REQUIRE(effects.has_value());
        REQUIRE(effects->size() == 1);
        auto const& run = std::get<RunOperation>(effects->front());
        CHECK(run.ns == "default");
        CHECK(run.op == OperationId::TerminateWorkflow);
        CHECK(run.target.params.contains(std::string{kParamReason}));

        auto missing = registry->resolve_effects(KindId::WorkflowExecution, OperationId::DeleteSchedule, target, state);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::OperationNotFound);
    }

    TEST_CASE("Schedule pause toggles from the current state") {
        auto registry = MakeDefaultKindRegistry();
        REQUIRE(registry.has_value());
        auto state = MakeInitialState(MakeCollectionLocation("default", KindId::Schedule), PollingConfig{});
        Schedule schedule;
        schedule.schedule_id = "report-monthly";
        schedule.state       = ScheduleState::Paused;
        state.collection(KindId::Schedule).items = std::vector<Schedule>{schedule};

        OperationTarget target{KindId::Schedule, ScheduleIdentity{"report-monthly"}, {}};
        auto effects = registry->resolve_effects(KindId::Schedule, OperationId::PauseSchedule, target, state);
        REQUIRE(effects.has_value());
        auto const& run = std::get<RunOperation>(effects->front());
        CHECK(run.target.params.at(std::string{kParamPause}) == "false");
    }
}
