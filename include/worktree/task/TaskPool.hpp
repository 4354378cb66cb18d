#pragma once
#include "worktree/core/Error.hpp"
#include "worktree/task/Executor.hpp"
#include "worktree/task/Task.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace WT {

class TaskPool : public Executor {
public:
    explicit TaskPool(size_t threadCount = std::thread::hardware_concurrency());
    ~TaskPool();

    // Process-wide pool used when HostOptions names no executor.
    static TaskPool& Instance();

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto submit(std::weak_ptr<Task>&& task) -> std::optional<Error> override;
    auto addTask(std::weak_ptr<Task>&& task) -> std::optional<Error>;
    auto shutdown() -> void override;
    auto size() const -> size_t override;

    auto activeTaskCount() const -> size_t;

private:
    auto workerFunction() -> void;

    std::vector<std::jthread>       workers;
    std::queue<std::weak_ptr<Task>> tasks;
    std::mutex                      mutex;
    std::condition_variable         taskCV;
    std::atomic<bool>               shuttingDown{false};
    std::atomic<size_t>             activeWorkers{0};
    std::atomic<size_t>             activeTasks{0};
};

} // namespace WT
