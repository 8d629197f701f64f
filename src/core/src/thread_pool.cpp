#include "kg_thread_pool.hpp"
#include "kg_logger.hpp"

#include <exception>

namespace kg {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this);
    }
    timer_ = std::thread(&ThreadPool::timer_loop, this);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });
            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        ++active_;
        try {
            task();
        } catch (const std::exception& e) {
            KG_LOG_ERROR("pool", std::string("Task failed: ") + e.what());
        }
        --active_;
    }
}

void ThreadPool::timer_loop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (!stop_) {
        if (deferred_.empty()) {
            timer_condition_.wait(lock);
            continue;
        }
        auto deadline = deferred_.top().deadline;
        if (Clock::now() < deadline) {
            timer_condition_.wait_until(lock, deadline);
            continue;
        }
        auto task = deferred_.top().task;
        deferred_.pop();
        tasks_.emplace([task] { (*task)(); });
        condition_.notify_one();
    }
}

void ThreadPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("post on stopped ThreadPool");
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
}

void ThreadPool::post_after(Clock::duration delay, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("post_after on stopped ThreadPool");
        }
        deferred_.push(Deferred{Clock::now() + delay, deferred_seq_++,
                                std::make_shared<std::function<void()>>(std::move(task))});
    }
    timer_condition_.notify_one();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) return;
        stop_ = true;
        while (!deferred_.empty()) {
            auto task = deferred_.top().task;
            deferred_.pop();
            tasks_.emplace([task] { (*task)(); });
        }
    }
    timer_condition_.notify_all();
    condition_.notify_all();
    if (timer_.joinable()) {
        timer_.join();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t ThreadPool::pending_tasks() const noexcept {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

size_t ThreadPool::deferred_tasks() const noexcept {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return deferred_.size();
}

size_t ThreadPool::active_threads() const noexcept {
    return active_.load();
}

size_t ThreadPool::total_threads() const noexcept {
    return workers_.size();
}

bool ThreadPool::is_running() const noexcept {
    return !stop_.load();
}

} // namespace kg
