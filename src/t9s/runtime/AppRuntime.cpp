#include <t9s/runtime/AppRuntime.hpp>

#include <t9s/core/Error.hpp>
#include <t9s/input/Keymap.hpp>
#include <t9s/kinds/KindRegistry.hpp>
#include <t9s/nav/Uri.hpp>
#include <t9s/ui/Frame.hpp>
#include <t9s/ui/Terminal.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <utility>
#include <variant>

namespace T9 {

AppRuntime::AppRuntime(KindRegistry const& registry, TemporalClient& client, UI::Terminal& terminal, AppState initial, Options options)
    : registry_(registry),
      terminal_(terminal),
      options_(options),
      reducer_(registry),
      keys_(DefaultKeymap(), options.key_timeout),
      state_(std::move(initial)),
      worker_(client, channel_, options.worker_threads) {}

AppRuntime::~AppRuntime() {
    this->stop();
}

auto AppRuntime::start() -> void {
    if (started_) {
        return;
    }
    started_ = true;
    t9_log("Runtime starting at " + FormatDeepLink(state_.location, registry_), "AppRuntime");
    this->apply(Navigate{state_.location});
    if (auto error = worker_.dispatch(CheckConnection{})) {
        t9_log("Connection check not dispatched: " + describeError(*error), "AppRuntime", "Error");
    }
    poll_.observe(state_, Clock::now());
    this->render();
}

auto AppRuntime::step() -> bool {
    if (state_.should_quit || stopped_) {
        return false;
    }
    auto const now = Clock::now();
    if (auto event = terminal_.poll(this->wait_budget(now))) {
        if (auto const* key = std::get_if<KeyEvent>(&*event)) {
            this->handle_key(*key, Clock::now());
        } else {
            dirty_ = true;
        }
    }
    this->drain();
    this->tick(Clock::now());
    if (dirty_) {
        this->render();
    }
    return !state_.should_quit;
}

auto AppRuntime::run() -> int {
#ifdef T9_LOG_DEBUG
    set_thread_name("Runtime");
#endif
    this->start();
    while (this->step()) {
    }
    t9_log("Runtime leaving the loop", "AppRuntime");
    this->stop();
    return 0;
}

auto AppRuntime::stop() -> void {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    channel_.close();
    worker_.shutdown();
}

auto AppRuntime::post(Action action) -> bool {
    return channel_.post(std::move(action));
}

auto AppRuntime::apply(Action const& action) -> void {
    auto result = reducer_.reduce(std::move(state_), action);
    state_      = std::move(result.state);
    for (auto& effect : result.effects) {
        if (auto error = worker_.dispatch(std::move(effect))) {
            t9_log("Effect not dispatched: " + describeError(*error), "AppRuntime", "Error");
        }
    }
    poll_.observe(state_, Clock::now());
    dirty_ = true;
}

auto AppRuntime::wait_budget(TimePoint now) const -> std::chrono::milliseconds {
    auto budget = options_.frame_interval;
    auto clamp  = [&](TimePoint deadline) {
        auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        budget    = std::min(budget, std::max(left, std::chrono::milliseconds{0}));
    };
    if (auto deadline = keys_.deadline()) {
        clamp(*deadline);
    }
    if (auto deadline = poll_.deadline()) {
        clamp(*deadline);
    }
    return budget;
}

auto AppRuntime::handle_key(KeyEvent const& event, TimePoint now) -> void {
    auto const context    = KeyContextFor(state_);
    auto const operations = OperationBindingsFor(state_, registry_);
    if (auto action = keys_.handle(event, context, operations, now)) {
        this->apply(KeyPressed{std::move(*action)});
    }
}

auto AppRuntime::drain() -> void {
    while (auto action = channel_.try_pop()) {
        this->apply(*action);
    }
}

auto AppRuntime::tick(TimePoint now) -> void {
    keys_.expire(now);
    if (poll_.due(now)) {
        poll_.on_tick(now);
        this->apply(PollTick{});
    }
}

auto AppRuntime::render() -> void {
    auto const size  = terminal_.size();
    auto const frame = UI::BuildFrame(state_, registry_, keys_.keymap(), size.columns, size.rows);
    terminal_.draw(frame);
    dirty_ = false;
}

} // namespace T9
