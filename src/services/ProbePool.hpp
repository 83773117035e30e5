/**
 * @file ProbePool.hpp
 * @brief Bounded worker pool with per-key exclusion and per-task deadlines
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

/**
 * @class ProbePool
 * @brief Fixed set of worker threads running keyed tasks
 *
 * - At most one task per key (device path) runs at a time; a queued task
 *   whose key is busy waits while other keys proceed.
 * - Each submission returns a Ticket. wait() measures the timeout from the
 *   moment a worker picked the task up, so queueing time is not charged.
 * - A task that overruns is abandoned, not interrupted: its worker stays
 *   busy until the task returns and the result is discarded.
 *
 * @tparam Result Value produced by each task
 */
template<typename Result>
class ProbePool {
public:
    using Task = std::function<Result()>;
    using Clock = std::chrono::steady_clock;

    /**
     * @struct Ticket
     * @brief Handle to one submitted task
     */
    struct Ticket {
        std::string key;
        std::future<Result> result;
        std::shared_ptr<std::atomic<int64_t>> started_at;  ///< Clock ticks, 0 while queued
    };

    /**
     * @brief Default worker count: max(4, hardware threads)
     */
    [[nodiscard]] static auto default_worker_count() -> size_t {
        return std::max<size_t>(4, std::thread::hardware_concurrency());
    }

    explicit ProbePool(size_t worker_count = default_worker_count()) {
        worker_count = std::max<size_t>(1, worker_count);
        workers_.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    /**
     * @brief Finish queued tasks, then join the workers
     */
    ~ProbePool() {
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ProbePool(const ProbePool&) = delete;
    ProbePool& operator=(const ProbePool&) = delete;

    [[nodiscard]] auto worker_count() const -> size_t { return workers_.size(); }

    /**
     * @brief Queue @p task under @p key
     */
    [[nodiscard]] auto submit(std::string key, Task task) -> Ticket {
        Job job{.key = key,
                .task = std::packaged_task<Result()>(std::move(task)),
                .started_at = std::make_shared<std::atomic<int64_t>>(0)};

        Ticket ticket{.key = std::move(key),
                      .result = job.task.get_future(),
                      .started_at = job.started_at};
        {
            std::lock_guard lock(mutex_);
            queue_.push_back(std::move(job));
        }
        cv_.notify_all();
        return ticket;
    }

    /**
     * @brief Wait for a ticket's result
     * @param ticket Ticket from submit(); its future is consumed on success
     * @param timeout Budget counted from the moment the task started
     * @return The result, or nullopt if the task ran past @p timeout
     * @throws Whatever the task threw
     */
    [[nodiscard]] static auto wait(Ticket& ticket, std::chrono::milliseconds timeout)
        -> std::optional<Result> {
        constexpr auto POLL_INTERVAL = std::chrono::milliseconds{10};

        while (true) {
            if (ticket.result.wait_for(POLL_INTERVAL) == std::future_status::ready) {
                return ticket.result.get();
            }
            auto started = ticket.started_at->load();
            if (started != 0) {
                auto running = Clock::now() - Clock::time_point(Clock::duration(started));
                if (running >= timeout) {
                    return std::nullopt;
                }
            }
        }
    }

private:
    struct Job {
        std::string key;
        std::packaged_task<Result()> task;
        std::shared_ptr<std::atomic<int64_t>> started_at;
    };

    auto find_runnable_locked() -> typename std::deque<Job>::iterator {
        return std::ranges::find_if(queue_, [this](const Job& job) {
            return !in_flight_.contains(job.key);
        });
    }

    void worker_loop() {
        while (true) {
            Job job;
            {
                std::unique_lock lock(mutex_);
                cv_.wait(lock, [this] {
                    return (stopping_ && queue_.empty()) || find_runnable_locked() != queue_.end();
                });
                auto it = find_runnable_locked();
                if (it == queue_.end()) {
                    return;
                }
                job = std::move(*it);
                queue_.erase(it);
                in_flight_.insert(job.key);
            }

            job.started_at->store(std::max<int64_t>(1, Clock::now().time_since_epoch().count()));
            job.task();

            {
                std::lock_guard lock(mutex_);
                in_flight_.erase(job.key);
            }
            cv_.notify_all();
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> queue_;
    std::unordered_set<std::string> in_flight_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};
