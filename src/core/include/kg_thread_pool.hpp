#pragma once

#include <cstdint>
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <memory>
#include <future>
#include <atomic>
#include <chrono>
#include <type_traits>
#include <stdexcept>

namespace kg {

/**
 * @brief Worker pool for firewall work
 *
 * Immediate tasks go straight to the workers. Deferred tasks wait on a
 * dedicated timer thread until their deadline, then move to the worker
 * queue. Deferred tasks cannot be cancelled. shutdown() promotes every
 * pending deferred task so scheduled revokes still run before exit.
 */
class ThreadPool {
public:
    using Clock = std::chrono::steady_clock;

    explicit ThreadPool(size_t num_threads = 4);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit task, returns future with result
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /// Fire-and-forget submission. Throws std::runtime_error after shutdown.
    void post(std::function<void()> task);

    /// Runs task on a worker once delay has elapsed.
    void post_after(Clock::duration delay, std::function<void()> task);

    /// Runs pending deferred tasks immediately, drains the queue, joins.
    void shutdown();

    size_t pending_tasks() const noexcept;
    size_t deferred_tasks() const noexcept;
    size_t active_threads() const noexcept;
    size_t total_threads() const noexcept;
    bool is_running() const noexcept;

private:
    struct Deferred {
        Clock::time_point deadline;
        uint64_t seq;
        std::shared_ptr<std::function<void()>> task;

        bool operator>(const Deferred& other) const {
            if (deadline != other.deadline) return deadline > other.deadline;
            return seq > other.seq;
        }
    };

    void worker_loop();
    void timer_loop();

    std::vector<std::thread>              workers_;
    std::thread                           timer_;
    std::queue<std::function<void()>>     tasks_;
    std::priority_queue<Deferred, std::vector<Deferred>, std::greater<Deferred>> deferred_;
    uint64_t                              deferred_seq_ = 0;
    mutable std::mutex                    queue_mutex_;
    std::condition_variable               condition_;
    std::condition_variable               timer_condition_;
    std::atomic<bool>                     stop_{false};
    std::atomic<size_t>                   active_{0};
};

// Template implementation must be in header
template<class F, class... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("submit on stopped ThreadPool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    std::future<return_type> result = task->get_future();
    condition_.notify_one();
    return result;
}

} // namespace kg
