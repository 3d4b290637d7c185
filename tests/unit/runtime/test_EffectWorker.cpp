#include <t9s/client/DemoTemporalClient.hpp>
#include <t9s/runtime/ActionChannel.hpp>
#include <t9s/runtime/EffectWorker.hpp>

#include <doctest/doctest.h>

#include <atomic>
#include <stdexcept>

using namespace T9;
using namespace std::chrono_literals;

namespace {

// Answers every call with the configured error, or throws when asked to.
class ScriptedClient final : public TemporalClient {
public:
    std::optional<Error> failure;
    bool                 throws = false;
    std::atomic<int>     calls{0};

    auto list_collection(KindId, CollectionQuery const&, std::optional<std::string> const&) -> Expected<Page> override {
        return answer(Page{std::vector<WorkflowSummary>{}, std::nullopt});
    }
    auto describe(KindId, std::string const&, Identity const&) -> Expected<DetailPayload> override {
        return answer(DetailPayload{TaskQueueInfo{"orders", {}, 0}});
    }
    auto history(std::string const&, WorkflowIdentity const&) -> Expected<std::vector<HistoryEvent>> override {
        return answer(std::vector<HistoryEvent>{});
    }
    auto count_workflows(std::string const&, std::optional<std::string> const&) -> Expected<WorkflowCount> override {
        return answer(WorkflowCount{7});
    }
    auto list_namespaces() -> Expected<std::vector<Namespace>> override { return answer(std::vector<Namespace>{}); }
    auto invoke(std::string const&, OperationId, OperationTarget const&) -> Expected<void> override {
        ++calls;
        if (throws) {
            throw std::runtime_error("socket exploded");
        }
        if (failure) {
            return std::unexpected(*failure);
        }
        return {};
    }
    auto ping() -> Expected<void> override {
        ++calls;
        if (failure) {
            return std::unexpected(*failure);
        }
        return {};
    }

private:
    template <typename T>
    auto answer(T value) -> Expected<T> {
        ++calls;
        if (throws) {
            throw std::runtime_error("socket exploded");
        }
        if (failure) {
            return std::unexpected(*failure);
        }
        return value;
    }
};

auto waitFor(ActionChannel& channel) -> std::optional<Action> {
    return channel.wait_pop(ActionChannel::Clock::now() + 5s);
}

} // namespace

TEST_SUITE("runtime.effects") {
    TEST_CASE("Each effect maps to exactly one completion") {
        ScriptedClient client;
        LoadCollection load{KindId::WorkflowExecution, CollectionQuery{"default", std::nullopt, std::nullopt}, std::nullopt};

        auto loaded = RunEffect(client, load);
        REQUIRE(loaded.has_value());
        auto const& data = std::get<DataLoaded>(*loaded);
        CHECK(std::get<LoadCollection>(data.request) == load);
        CHECK(std::holds_alternative<Page>(data.payload));

        CHECK(std::holds_alternative<DataLoaded>(*RunEffect(client, LoadNamespaces{})));
        CHECK(std::holds_alternative<DataLoaded>(*RunEffect(client, LoadHistory{"default", WorkflowIdentity{"a", std::nullopt}})));

        LoadWorkflowCount count{CollectionQuery{"default", std::string{"WorkflowType='A'"}, std::nullopt}};
        auto              counted = std::get<DataLoaded>(*RunEffect(client, count));
        CHECK(std::get<LoadWorkflowCount>(counted.request) == count);
        CHECK(std::get<WorkflowCount>(counted.payload).count == 7);

        RunOperation op{"default", OperationId::CancelWorkflow, OperationTarget{KindId::WorkflowExecution, WorkflowIdentity{"a", std::nullopt}, {}}};
        CHECK(std::get<OperationSucceeded>(*RunEffect(client, op)).request == op);

        auto connected = std::get<ConnectionChanged>(*RunEffect(client, CheckConnection{}));
        CHECK(connected.status == ConnectionStatus::Connected);

        CHECK_FALSE(RunEffect(client, SetTimer{10ms, TimerId::Toast, 1}).has_value());
        CHECK(client.calls.load() == 6);
    }

    TEST_CASE("Client errors become failure completions") {
        ScriptedClient client;
        client.failure = Error{Error::Code::ConnectionError, "refused"};

        auto failed = RunEffect(client, LoadDetail{KindId::TaskQueue, "default", TaskQueueIdentity{"orders"}});
        REQUIRE(failed.has_value());
        CHECK(std::get<DataLoadFailed>(*failed).error.code == Error::Code::ConnectionError);

        RunOperation op{"default", OperationId::TerminateWorkflow, OperationTarget{}};
        CHECK(std::get<OperationFailed>(*RunEffect(client, op)).error.message == std::optional<std::string>{"refused"});

        auto down = std::get<ConnectionChanged>(*RunEffect(client, CheckConnection{}));
        CHECK(down.status == ConnectionStatus::Disconnected);
        REQUIRE(down.error.has_value());
        CHECK(down.error->code == Error::Code::ConnectionError);
    }

    TEST_CASE("Exceptions from the client are reported, not lost") {
        ScriptedClient client;
        client.throws = true;

        auto failed = RunEffect(client, LoadNamespaces{});
        REQUIRE(failed.has_value());
        auto const& load = std::get<DataLoadFailed>(*failed);
        CHECK(std::holds_alternative<LoadNamespaces>(load.request));
        CHECK(load.error.code == Error::Code::UnknownError);
        CHECK(load.error.message == std::optional<std::string>{"socket exploded"});

        RunOperation op{"default", OperationId::CancelWorkflow, OperationTarget{}};
        CHECK(std::holds_alternative<OperationFailed>(*RunEffect(client, op)));
    }

    TEST_CASE("Worker posts completions to the channel") {
        DemoTemporalClient client;
        ActionChannel      channel;
        EffectWorker       worker(client, channel, 2);

        LoadCollection load{KindId::Schedule, CollectionQuery{"default", std::nullopt, std::nullopt}, std::nullopt};
        CHECK_FALSE(worker.dispatch(load).has_value());
        auto action = waitFor(channel);
        REQUIRE(action.has_value());
        auto const& data = std::get<DataLoaded>(*action);
        CHECK(std::get<LoadCollection>(data.request) == load);
        CHECK(std::get<std::vector<Schedule>>(std::get<Page>(data.payload).items).size() == 2);
    }

    TEST_CASE("Timers fire in deadline order") {
        DemoTemporalClient client;
        ActionChannel      channel;
        EffectWorker       worker(client, channel, 1);

        CHECK_FALSE(worker.dispatch(SetTimer{60ms, TimerId::Reconnect, 0}).has_value());
        CHECK_FALSE(worker.dispatch(SetTimer{10ms, TimerId::Toast, 7}).has_value());

        auto first = waitFor(channel);
        REQUIRE(first.has_value());
        CHECK(std::get<TimerElapsed>(*first).timer == TimerId::Toast);
        CHECK(std::get<TimerElapsed>(*first).generation == 7);

        auto second = waitFor(channel);
        REQUIRE(second.has_value());
        CHECK(std::get<TimerElapsed>(*second).timer == TimerId::Reconnect);
        CHECK(worker.pendingTimers() == 0);
    }

    TEST_CASE("Shutdown refuses new work and pending timers never fire") {
        DemoTemporalClient client;
        ActionChannel      channel;
        EffectWorker       worker(client, channel, 1);

        CHECK_FALSE(worker.dispatch(SetTimer{1h, TimerId::Toast, 1}).has_value());
        worker.shutdown();
        worker.shutdown();

        auto refused = worker.dispatch(LoadNamespaces{});
        REQUIRE(refused.has_value());
        CHECK(refused->code == Error::Code::Unavailable);
        CHECK_FALSE(channel.try_pop().has_value());
    }
}
