#pragma once
#include "task/Executor.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace T9 {

class TaskPool : public Executor {
public:
    explicit TaskPool(std::size_t threadCount = std::thread::hardware_concurrency());
    ~TaskPool() override;

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto submit(Job job) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto size() const -> std::size_t override;

    [[nodiscard]] auto activeJobs() const -> std::size_t { return activeTasks.load(); }

private:
    auto workerFunction() -> void;

    std::vector<std::jthread> workers;
    std::queue<Job>           tasks;
    std::mutex                mutex;
    std::condition_variable   taskCV;
    std::atomic<bool>         shuttingDown{false};
    std::atomic<std::size_t>  activeWorkers{0};
    std::atomic<std::size_t>  activeTasks{0};
};

} // namespace T9
