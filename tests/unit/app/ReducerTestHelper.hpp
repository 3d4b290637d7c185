#pragma once
#include <t9s/app/AppState.hpp>
#include <t9s/app/Reducer.hpp>
#include <t9s/kinds/KindRegistry.hpp>

#include <doctest/doctest.h>

#include <string>
#include <utility>
#include <vector>

namespace T9::Testing {

inline auto MakeRegistry() -> KindRegistry {
    auto registry = MakeDefaultKindRegistry();
    REQUIRE(registry.has_value());
    return std::move(*registry);
}

inline auto MakeWorkflow(std::string id, WorkflowStatus status = WorkflowStatus::Running) -> WorkflowSummary {
    WorkflowSummary wf;
    wf.workflow_id   = std::move(id);
    wf.run_id        = wf.workflow_id + "-run";
    wf.workflow_type = "OrderWorkflow";
    wf.status        = status;
    wf.start_time    = "2024-01-15T08:00:00Z";
    wf.task_queue    = "orders";
    return wf;
}

inline auto MakeWorkflows(std::size_t count) -> std::vector<WorkflowSummary> {
    std::vector<WorkflowSummary> items;
    for (std::size_t i = 0; i < count; ++i) {
        items.push_back(MakeWorkflow("wf-" + std::to_string(i)));
    }
    return items;
}

template <typename T>
auto FindEffect(std::vector<Effect> const& effects) -> T const* {
    for (auto const& effect : effects) {
        if (auto const* found = std::get_if<T>(&effect)) {
            return found;
        }
    }
    return nullptr;
}

template <typename T>
auto CountEffects(std::vector<Effect> const& effects) -> std::size_t {
    std::size_t count = 0;
    for (auto const& effect : effects) {
        if (std::holds_alternative<T>(effect)) {
            ++count;
        }
    }
    return count;
}

// Owns a registry, a reducer and the current state; dispatch() feeds one action
// through and keeps the effects it produced.
struct ReducerHarness {
    KindRegistry        registry = MakeRegistry();
    Reducer             reducer{registry};
    AppState            state = MakeInitialState(MakeCollectionLocation("default", KindId::WorkflowExecution), PollingConfig{});
    std::vector<Effect> effects;

    auto dispatch(Action const& action) -> std::vector<Effect> const& {
        auto result = reducer.reduce(state, action);
        state       = std::move(result.state);
        effects     = std::move(result.effects);
        return effects;
    }

    auto key(KeyCommand command) -> std::vector<Effect> const& { return dispatch(KeyPressed{KeyAction::Of(command)}); }

    // Opens location and completes its collection load with items.
    template <typename Items>
    auto loadCollection(Location location, Items items, std::optional<std::string> nextPage = std::nullopt) -> LoadCollection {
        dispatch(Navigate{std::move(location)});
        auto const* request = FindEffect<LoadCollection>(effects);
        REQUIRE(request != nullptr);
        auto copy = *request;
        dispatch(DataLoaded{copy, Page{std::move(items), std::move(nextPage)}});
        return copy;
    }
};

} // namespace T9::Testing
