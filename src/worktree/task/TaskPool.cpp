#include "worktree/task/TaskPool.hpp"
#include "worktree/log/TaggedLogger.hpp"

#include <exception>
#include <string>
#include <system_error>

namespace WT {

TaskPool& TaskPool::Instance() {
    // Leak-on-exit singleton to avoid destructor-order races with hosts destroyed at exit
    static TaskPool* instance = []() -> TaskPool* {
        return new TaskPool();
    }();
    return *instance;
}

TaskPool::TaskPool(size_t threadCount) {
    wt_log("TaskPool::TaskPool constructing", "TaskPool");
    if (threadCount == 0) threadCount = 1;
    activeWorkers = 0;
    for (size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&TaskPool::workerFunction, this);
            ++activeWorkers;
        } catch (std::system_error const& error) {
            wt_log(std::string("TaskPool::TaskPool failed to spawn worker: ") + error.what(), "TaskPool", "Error");
            break;
        }
    }
    wt_log("TaskPool::TaskPool constructed with workers=" + std::to_string(activeWorkers.load()), "TaskPool");
}

TaskPool::~TaskPool() {
    wt_log("TaskPool::~TaskPool", "TaskPool");
    shutdown();
}

auto TaskPool::addTask(std::weak_ptr<Task>&& task) -> std::optional<Error> {
    std::lock_guard<std::mutex> lock(mutex);
    if (shuttingDown) {
        wt_log("TaskPool::addTask refused: shutting down", "TaskPool");
        return Error{Error::Code::ExecutorShutdown, "Executor shutting down"};
    }
    auto locked = task.lock();
    if (!locked) {
        wt_log("TaskPool::addTask task expired before enqueue", "TaskPool");
        return Error{Error::Code::Expired, "Task expired before enqueue"};
    }
    if (!locked->markQueued()) {
        // Already queued or running somewhere; nothing to do.
        wt_log("TaskPool::addTask task already started: " + locked->label(), "TaskPool");
        return std::nullopt;
    }
    wt_log("TaskPool::addTask enqueuing " + locked->label(), "TaskPool");
    tasks.push(std::move(task));
    taskCV.notify_one();
    return std::nullopt;
}

auto TaskPool::submit(std::weak_ptr<Task>&& task) -> std::optional<Error> {
    return this->addTask(std::move(task));
}

auto TaskPool::shutdown() -> void {
    wt_log("TaskPool::shutdown begin", "TaskPool");
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            for (auto& th : this->workers) {
                if (th.joinable()) th.join();
            }
            return;
        }
        this->shuttingDown = true;
        this->taskCV.notify_all();
    }

    for (auto& th : this->workers) {
        if (th.joinable()) {
            th.join();
        }
    }
    activeWorkers = 0;

    this->workers.clear();
    std::lock_guard<std::mutex> lock(this->mutex);
    while (!this->tasks.empty()) {
        this->tasks.pop();
    }
    wt_log("TaskPool::shutdown ends", "TaskPool");
}

auto TaskPool::size() const -> size_t {
    return this->workers.size();
}

auto TaskPool::activeTaskCount() const -> size_t {
    return this->activeTasks.load();
}

auto TaskPool::workerFunction() -> void {
    while (true) {
        std::weak_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            taskCV.wait(lock, [this] { return this->shuttingDown || !this->tasks.empty(); });

            if (this->shuttingDown && this->tasks.empty()) {
                break;
            }

            task = std::move(tasks.front());
            tasks.pop();
        }

        auto strongTask = task.lock();
        if (!strongTask) {
            wt_log("TaskPool::workerFunction task released before it ran; skipping", "TaskPool");
            continue;
        }

        if (!strongTask->markRunning()) {
            wt_log("TaskPool::workerFunction task " + strongTask->label() + " is not queued; skipping", "TaskPool");
            continue;
        }
        ++activeTasks;
        try {
            strongTask->function(*strongTask);
            strongTask->markCompleted();
        } catch (std::exception const& error) {
            strongTask->markFailed();
            wt_log("Exception in task " + strongTask->label() + ": " + error.what(), "Task", "Error");
        }
        --activeTasks;
    }

    --activeWorkers;
}

} // namespace WT
