#include <t9s/poll/PollScheduler.hpp>

#include <doctest/doctest.h>

using namespace T9;
using namespace std::chrono_literals;

namespace {

auto connectedState() -> AppState {
    auto state       = MakeInitialState(MakeCollectionLocation("default", KindId::WorkflowExecution), PollingConfig{true, 1000ms, 8000ms});
    state.connection = ConnectionStatus::Connected;
    return state;
}

} // namespace

TEST_SUITE("poll.scheduler") {
    TEST_CASE("Backoff doubles per error and stops at the cap") {
        PollingConfig config{true, 1000ms, 8000ms};
        CHECK(EffectiveInterval(config, 0) == 1000ms);
        CHECK(EffectiveInterval(config, 1) == 2000ms);
        CHECK(EffectiveInterval(config, 3) == 8000ms);
        CHECK(EffectiveInterval(config, 4) == 8000ms);
        CHECK(EffectiveInterval(config, 4000000000u) == 8000ms);

        PollingConfig inverted{true, 5000ms, 1000ms};
        CHECK(EffectiveInterval(inverted, 2) == 5000ms);
    }

    TEST_CASE("Armed only while connected and enabled") {
        PollScheduler scheduler;
        auto const    t0    = PollScheduler::Clock::now();
        auto          state = connectedState();

        state.connection = ConnectionStatus::Unknown;
        scheduler.observe(state, t0);
        CHECK_FALSE(scheduler.armed());
        CHECK_FALSE(scheduler.deadline().has_value());
        CHECK_FALSE(scheduler.due(t0 + 1h));

        state.connection = ConnectionStatus::Connected;
        scheduler.observe(state, t0);
        CHECK(scheduler.armed());
        CHECK(scheduler.deadline() == std::optional<PollScheduler::TimePoint>{t0 + 1000ms});

        state.polling.enabled = false;
        scheduler.observe(state, t0 + 10ms);
        CHECK_FALSE(scheduler.armed());
    }

    TEST_CASE("Ticks fire once per interval") {
        PollScheduler scheduler;
        auto const    t0 = PollScheduler::Clock::now();
        scheduler.observe(connectedState(), t0);

        CHECK_FALSE(scheduler.due(t0 + 999ms));
        CHECK(scheduler.due(t0 + 1000ms));
        scheduler.on_tick(t0 + 1000ms);
        CHECK_FALSE(scheduler.due(t0 + 1500ms));
        CHECK(scheduler.due(t0 + 2000ms));
    }

    TEST_CASE("A new location restarts the period") {
        PollScheduler scheduler;
        auto const    t0    = PollScheduler::Clock::now();
        auto          state = connectedState();
        scheduler.observe(state, t0);

        // Same location: the anchor stays.
        scheduler.observe(state, t0 + 900ms);
        CHECK(scheduler.due(t0 + 1000ms));

        state.location = MakeCollectionLocation("default", KindId::Schedule);
        scheduler.observe(state, t0 + 900ms);
        CHECK_FALSE(scheduler.due(t0 + 1000ms));
        CHECK(scheduler.due(t0 + 1900ms));
    }

    TEST_CASE("Errors stretch the interval") {
        PollScheduler scheduler;
        auto const    t0    = PollScheduler::Clock::now();
        auto          state = connectedState();
        state.error_count   = 2;
        scheduler.observe(state, t0);
        CHECK(scheduler.current_interval() == 4000ms);
        CHECK_FALSE(scheduler.due(t0 + 3000ms));
    }
}
