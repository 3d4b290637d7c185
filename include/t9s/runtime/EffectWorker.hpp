#pragma once
#include <t9s/app/Action.hpp>
#include <t9s/app/Effect.hpp>
#include <t9s/core/Error.hpp>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace T9 {

class ActionChannel;
class TaskPool;
class TemporalClient;

// Runs one effect against the client and returns its completion. SetTimer has
// no synchronous completion and yields nullopt. Any exception escaping the
// client becomes a failure completion; nothing is lost silently.
[[nodiscard]] auto RunEffect(TemporalClient& client, Effect const& effect) -> std::optional<Action>;

/**
 * EffectWorker: executes effects off the UI thread.
 *
 * Client calls run on a TaskPool and post exactly one completion action each to
 * the channel. Timers are kept by a dedicated thread that posts TimerElapsed
 * when they come due. shutdown() stops both; completions racing with shutdown
 * are dropped by the closed channel.
 */
class EffectWorker {
public:
    EffectWorker(TemporalClient& client, ActionChannel& channel, std::size_t threads = 4);
    ~EffectWorker();

    EffectWorker(EffectWorker const&)                    = delete;
    auto operator=(EffectWorker const&) -> EffectWorker& = delete;

    auto dispatch(Effect effect) -> std::optional<Error>;
    auto shutdown() -> void;

    [[nodiscard]] auto pendingTimers() const -> std::size_t;

private:
    using Clock = std::chrono::steady_clock;

    auto timer_loop(std::stop_token stop) -> void;

    TemporalClient&                          client_;
    ActionChannel&                           channel_;
    std::unique_ptr<TaskPool>                pool_;
    mutable std::mutex                       timerMutex_;
    std::condition_variable_any              timerCv_;
    std::multimap<Clock::time_point, TimerElapsed> timers_;
    std::jthread                             timerThread_;
};

} // namespace T9
