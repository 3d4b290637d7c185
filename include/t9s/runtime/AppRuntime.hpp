#pragma once
#include <t9s/app/Action.hpp>
#include <t9s/app/AppState.hpp>
#include <t9s/app/Reducer.hpp>
#include <t9s/input/KeyInput.hpp>
#include <t9s/poll/PollScheduler.hpp>
#include <t9s/runtime/ActionChannel.hpp>
#include <t9s/runtime/EffectWorker.hpp>

#include <chrono>
#include <cstddef>

namespace T9 {

class KindRegistry;
class TemporalClient;

namespace UI {
class Terminal;
} // namespace UI

/**
 * AppRuntime: the single owner of AppState.
 *
 * One thread runs the loop: read terminal input, drain the completions the
 * worker posted, reduce every action in arrival order, hand the resulting
 * effects to the EffectWorker and redraw when anything changed. Key sequence
 * deadlines and poll ticks are driven from the same loop with the steady clock,
 * so nothing else ever touches the state.
 */
class AppRuntime {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    struct Options {
        std::chrono::milliseconds key_timeout{500};
        // Longest wait on the terminal before completions are drained again.
        std::chrono::milliseconds frame_interval{50};
        std::size_t               worker_threads = 4;
    };

    AppRuntime(KindRegistry const& registry, TemporalClient& client, UI::Terminal& terminal, AppState initial, Options options);
    ~AppRuntime();

    AppRuntime(AppRuntime const&)                    = delete;
    auto operator=(AppRuntime const&) -> AppRuntime& = delete;

    // Loads the initial view and checks the connection.
    auto start() -> void;

    // One loop iteration; false once the state asks to quit.
    auto step() -> bool;

    // start() then step() until quit; returns the process exit code.
    auto run() -> int;

    auto stop() -> void;

    // Posts from any thread; the action is reduced on the next step.
    auto post(Action action) -> bool;

    // Reduces one action right away on the calling (runtime) thread.
    auto apply(Action const& action) -> void;

    [[nodiscard]] auto state() const -> AppState const& { return state_; }
    [[nodiscard]] auto pollScheduler() const -> PollScheduler const& { return poll_; }
    [[nodiscard]] auto keyInput() const -> KeyInput const& { return keys_; }

private:
    auto wait_budget(TimePoint now) const -> std::chrono::milliseconds;
    auto handle_key(KeyEvent const& event, TimePoint now) -> void;
    auto drain() -> void;
    auto tick(TimePoint now) -> void;
    auto render() -> void;

    KindRegistry const& registry_;
    UI::Terminal&       terminal_;
    Options             options_;
    Reducer             reducer_;
    KeyInput            keys_;
    AppState            state_;
    ActionChannel       channel_;
    EffectWorker        worker_;
    PollScheduler       poll_;
    bool                dirty_   = true;
    bool                started_ = false;
    bool                stopped_ = false;
};

} // namespace T9
