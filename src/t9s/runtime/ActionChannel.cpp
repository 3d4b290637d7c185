#include <t9s/runtime/ActionChannel.hpp>

namespace T9 {

auto ActionChannel::post(Action action) -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(action));
    }
    cv_.notify_one();
    return true;
}

auto ActionChannel::try_pop() -> std::optional<Action> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto action = std::move(queue_.front());
    queue_.pop_front();
    return action;
}

auto ActionChannel::wait_pop(TimePoint deadline) -> std::optional<Action> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto action = std::move(queue_.front());
    queue_.pop_front();
    return action;
}

auto ActionChannel::close() -> void {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto ActionChannel::closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

auto ActionChannel::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace T9
