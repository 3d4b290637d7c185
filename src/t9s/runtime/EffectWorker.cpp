#include <t9s/runtime/EffectWorker.hpp>

#include <t9s/client/TemporalClient.hpp>
#include <t9s/runtime/ActionChannel.hpp>

#include "log/TaggedLogger.hpp"
#include "task/TaskPool.hpp"

#include <exception>

namespace T9 {

namespace {

template <typename Request, typename Value>
auto load_completion(Request const& request, Expected<Value> result) -> Action {
    if (!result) {
        return DataLoadFailed{LoadRequest{request}, std::move(result.error())};
    }
    return DataLoaded{LoadRequest{request}, LoadPayload{std::move(*result)}};
}

auto failure_for(Effect const& effect, Error error) -> std::optional<Action> {
    if (auto const* op = std::get_if<RunOperation>(&effect)) {
        return OperationFailed{*op, std::move(error)};
    }
    if (std::holds_alternative<CheckConnection>(effect)) {
        return ConnectionChanged{ConnectionStatus::Disconnected, std::move(error)};
    }
    if (std::holds_alternative<SetTimer>(effect)) {
        return std::nullopt;
    }
    LoadRequest request = std::visit(
            [](auto const& concrete) -> LoadRequest {
                using T = std::decay_t<decltype(concrete)>;
                if constexpr (std::is_same_v<T, LoadCollection> || std::is_same_v<T, LoadDetail> || std::is_same_v<T, LoadHistory>
                              || std::is_same_v<T, LoadWorkflowCount> || std::is_same_v<T, LoadNamespaces>) {
                    return concrete;
                } else {
                    return LoadNamespaces{};
                }
            },
            effect);
    return DataLoadFailed{std::move(request), std::move(error)};
}

auto run(TemporalClient& client, Effect const& effect) -> std::optional<Action> {
    if (auto const* load = std::get_if<LoadCollection>(&effect)) {
        return load_completion(*load, client.list_collection(load->kind, load->query, load->page_token));
    }
    if (auto const* load = std::get_if<LoadDetail>(&effect)) {
        return load_completion(*load, client.describe(load->kind, load->ns, load->identity));
    }
    if (auto const* load = std::get_if<LoadHistory>(&effect)) {
        return load_completion(*load, client.history(load->ns, load->workflow));
    }
    if (auto const* load = std::get_if<LoadWorkflowCount>(&effect)) {
        return load_completion(*load, client.count_workflows(load->query.ns, load->query.filter));
    }
    if (auto const* load = std::get_if<LoadNamespaces>(&effect)) {
        return load_completion(*load, client.list_namespaces());
    }
    if (auto const* op = std::get_if<RunOperation>(&effect)) {
        auto result = client.invoke(op->ns, op->op, op->target);
        if (!result) {
            return OperationFailed{*op, std::move(result.error())};
        }
        return OperationSucceeded{*op};
    }
    if (std::holds_alternative<CheckConnection>(effect)) {
        auto result = client.ping();
        if (!result) {
            return ConnectionChanged{ConnectionStatus::Disconnected, std::move(result.error())};
        }
        return ConnectionChanged{ConnectionStatus::Connected, std::nullopt};
    }
    return std::nullopt;
}

} // namespace

auto RunEffect(TemporalClient& client, Effect const& effect) -> std::optional<Action> {
    try {
        return run(client, effect);
    } catch (std::exception const& error) {
        t9_log(std::string{"RunEffect caught: "} + error.what(), "EffectWorker", "Error");
        return failure_for(effect, Error{Error::Code::UnknownError, error.what()});
    }
}

EffectWorker::EffectWorker(TemporalClient& client, ActionChannel& channel, std::size_t threads)
    : client_(client),
      channel_(channel),
      pool_(std::make_unique<TaskPool>(threads)),
      timerThread_([this](std::stop_token stop) { timer_loop(std::move(stop)); }) {}

EffectWorker::~EffectWorker() {
    shutdown();
}

auto EffectWorker::dispatch(Effect effect) -> std::optional<Error> {
    if (auto const* timer = std::get_if<SetTimer>(&effect)) {
        {
            std::lock_guard<std::mutex> lock(timerMutex_);
            timers_.emplace(Clock::now() + timer->delay, TimerElapsed{timer->timer, timer->generation});
        }
        timerCv_.notify_all();
        return std::nullopt;
    }
    return pool_->submit([this, effect = std::move(effect)] {
        if (auto completion = RunEffect(client_, effect)) {
            if (!channel_.post(std::move(*completion))) {
                t9_log("EffectWorker dropped completion after close", "EffectWorker");
            }
        }
    });
}

auto EffectWorker::shutdown() -> void {
    if (timerThread_.joinable()) {
        timerThread_.request_stop();
        timerCv_.notify_all();
        timerThread_.join();
    }
    pool_->shutdown();
}

auto EffectWorker::pendingTimers() const -> std::size_t {
    std::lock_guard<std::mutex> lock(timerMutex_);
    return timers_.size();
}

auto EffectWorker::timer_loop(std::stop_token stop) -> void {
#ifdef T9_LOG_DEBUG
    set_thread_name("Timers");
#endif
    std::unique_lock<std::mutex> lock(timerMutex_);
    while (!stop.stop_requested()) {
        if (timers_.empty()) {
            timerCv_.wait(lock, stop, [this] { return !timers_.empty(); });
            continue;
        }
        auto next = timers_.begin()->first;
        if (Clock::now() < next) {
            timerCv_.wait_until(lock, stop, next, [this, next] { return !timers_.empty() && timers_.begin()->first < next; });
            continue;
        }
        auto fired = timers_.begin()->second;
        timers_.erase(timers_.begin());
        lock.unlock();
        if (!channel_.post(fired)) {
            return;
        }
        lock.lock();
    }
}

} // namespace T9
