#include "task/TaskPool.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <system_error>

namespace T9 {

TaskPool::TaskPool(std::size_t threadCount) {
    t9_log("TaskPool::TaskPool constructing", "TaskPool");
    if (threadCount == 0)
        threadCount = 1;
    for (std::size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&TaskPool::workerFunction, this);
            ++activeWorkers;
        } catch (std::system_error const& error) {
            t9_log(std::string{"TaskPool::TaskPool failed to spawn worker: "} + error.what(), "TaskPool", "Error");
            break; // keep the workers that did start
        }
    }
    t9_log("TaskPool::TaskPool constructed with workers=" + std::to_string(activeWorkers.load()), "TaskPool");
}

TaskPool::~TaskPool() {
    t9_log("TaskPool::~TaskPool", "TaskPool");
    shutdown();
}

auto TaskPool::submit(Job job) -> std::optional<Error> {
    if (!job) {
        return Error{Error::Code::UnknownError, "Empty job"};
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (shuttingDown) {
            t9_log("TaskPool::submit refused: shutting down", "TaskPool");
            return Error{Error::Code::Unavailable, "Executor shutting down"};
        }
        if (workers.empty()) {
            return Error{Error::Code::Unavailable, "Executor has no workers"};
        }
        tasks.push(std::move(job));
    }
    taskCV.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    t9_log("TaskPool::shutdown begin", "TaskPool");
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->shuttingDown) {
            this->shuttingDown = true;
            std::queue<Job> dropped;
            this->tasks.swap(dropped);
        }
    }
    this->taskCV.notify_all();

    for (auto& th : this->workers) {
        if (th.joinable()) {
            th.join();
        }
    }
    this->workers.clear();
    activeWorkers = 0;
    t9_log("TaskPool::shutdown all workers joined", "TaskPool");
}

auto TaskPool::size() const -> std::size_t {
    return this->workers.size();
}

auto TaskPool::workerFunction() -> void {
    t9_log("TaskPool::workerFunction start", "TaskPool");
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            taskCV.wait(lock, [this] { return this->shuttingDown || !this->tasks.empty(); });

            if (this->shuttingDown) {
                break;
            }
            job = std::move(tasks.front());
            tasks.pop();
        }

        ++activeTasks;
        try {
            job();
        } catch (std::exception const& error) {
            t9_log(std::string{"Exception in job: "} + error.what(), "TaskPool", "Error");
        }
        --activeTasks;
    }
    t9_log("TaskPool::workerFunction exit", "TaskPool");
}

} // namespace T9
