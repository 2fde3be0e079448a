#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "repo.hpp"

/**
 * @brief Bounded pool of worker threads running repository tasks.
 *
 * Exactly `capacity` threads pull tasks from a FIFO queue, so at most that
 * many tasks run at any instant and excess tasks wait their turn. Every task
 * handed to submit() produces exactly one OperationResult passed to the sink,
 * whether it ran to completion, failed, timed out or was cancelled.
 *
 * The sink is called from worker threads and from the thread calling
 * cancel_all() or submit(); it must be thread safe and must not call back
 * into the pool.
 */
class WorkerPool {
  public:
    /// Executes one task; must observe the cancel flag and never throw.
    using Runner = std::function<OperationResult(const Task&, const std::atomic<bool>&)>;
    /// Receives each completion exactly once.
    using Sink = std::function<void(OperationResult)>;

    /**
     * @brief Start @a capacity worker threads.
     *
     * @param capacity Number of workers; values below 1 are raised to 1.
     * @param runner   Function executing a task.
     * @param sink     Completion callback.
     */
    WorkerPool(size_t capacity, Runner runner, Sink sink);
    ~WorkerPool();
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue @a task for execution.
     *
     * After shutdown() the task is completed immediately as Cancelled.
     */
    void submit(Task task);

    /**
     * @brief Cancel all queued and running work and wait for quiescence.
     *
     * Queued tasks are delivered as Cancelled failures. Running tasks see the
     * cancel flag, and this call blocks until every one of them has returned
     * and its completion has been delivered. When it returns nothing
     * submitted earlier is still pending. The pool stays usable.
     *
     * @return Number of tasks that were queued or running.
     */
    size_t cancel_all();

    /** Cancel all work and join the workers. Safe to call twice. */
    void shutdown();

    size_t capacity() const { return capacity_; }
    size_t running() const;
    size_t queued() const;
    /** @return Highest number of tasks observed running at once. */
    size_t peak_running() const;
    /** @return Number of completions delivered so far. */
    size_t delivered() const;

  private:
    void worker_loop();
    void deliver(OperationResult res);

    const size_t capacity_;
    Runner runner_;
    Sink sink_;

    mutable std::mutex mtx_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> queue_;
    size_t running_ = 0;
    size_t peak_running_ = 0;
    bool stopping_ = false;
    bool stopped_ = false;
    std::atomic<bool> cancel_{false};
    std::atomic<size_t> delivered_{0};
    std::vector<std::thread> workers_;
};

#endif // WORKER_POOL_HPP
