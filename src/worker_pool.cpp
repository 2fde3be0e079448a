#include "worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "logger.hpp"

WorkerPool::WorkerPool(size_t capacity, Runner runner, Sink sink)
    : capacity_(std::max<size_t>(capacity, 1)), runner_(std::move(runner)),
      sink_(std::move(sink)) {
    workers_.reserve(capacity_);
    for (size_t i = 0; i < capacity_; ++i)
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    log_debug("Worker pool started", LogFields{{"capacity", std::to_string(capacity_)}});
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::deliver(OperationResult res) {
    delivered_.fetch_add(1);
    sink_(std::move(res));
}

void WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!stopping_) {
            queue_.push_back(std::move(task));
            work_cv_.notify_one();
            return;
        }
    }
    deliver(make_failure(task, FailureKind::Cancelled, "cancelled"));
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            work_cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
                return;
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
            peak_running_ = std::max(peak_running_, running_);
        }
        OperationResult res;
        try {
            res = runner_(task, cancel_);
        } catch (const std::exception& e) {
            log_error("Task threw", LogFields{{"repo", task.path.string()}, {"error", e.what()}});
            res = make_failure(task, FailureKind::GitCommandFailed, e.what());
        }
        deliver(std::move(res));
        {
            std::lock_guard<std::mutex> lk(mtx_);
            --running_;
        }
        idle_cv_.notify_all();
    }
}

size_t WorkerPool::cancel_all() {
    std::deque<Task> dropped;
    size_t in_flight = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        dropped.swap(queue_);
        in_flight = running_;
        cancel_.store(true);
    }
    if (!dropped.empty() || in_flight > 0) {
        log_info("Cancelling all tasks", LogFields{{"queued", std::to_string(dropped.size())},
                                                   {"running", std::to_string(in_flight)}});
    }
    for (const auto& task : dropped)
        deliver(make_failure(task, FailureKind::Cancelled, "cancelled"));
    {
        std::unique_lock<std::mutex> lk(mtx_);
        idle_cv_.wait(lk, [this] { return running_ == 0; });
        cancel_.store(false);
    }
    return dropped.size() + in_flight;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopped_)
            return;
        stopped_ = true;
    }
    cancel_all();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable())
            t.join();
    }
    // Tasks that slipped in between cancel_all() and stopping_ are still owed
    // a completion.
    std::deque<Task> rest;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        rest.swap(queue_);
    }
    for (const auto& task : rest)
        deliver(make_failure(task, FailureKind::Cancelled, "cancelled"));
    log_debug("Worker pool stopped");
}

size_t WorkerPool::running() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return running_;
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.size();
}

size_t WorkerPool::peak_running() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return peak_running_;
}

size_t WorkerPool::delivered() const { return delivered_.load(); }
