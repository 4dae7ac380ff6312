/**
 * @file ThreadPool.hpp
 * @brief Named fixed-size worker pool.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_CONCURRENCY_THREADPOOL_HPP
    #define GPO_CONCURRENCY_THREADPOOL_HPP

#include <gpo/core/Types.hpp>
#include <gpo/core/NonCopyable.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace gpo::concurrency {

/**
 * @class ThreadPool
 * @brief FIFO task queue drained by a fixed set of workers.
 *
 * Serves two callers: the HTTP server posts one task per connection, and
 * the software device splits each NDRange launch with @ref parallelFor.
 * The pool name tags log lines written when a posted task throws.
 *
 * @ref shutdown runs every task already queued before joining; the
 * destructor calls it.
 */
class ThreadPool final : public core::NonMovable<ThreadPool>
{
public:
    /** @param threadCount Zero picks @c std::thread::hardware_concurrency(). */
    ThreadPool(std::string name, core::u32 threadCount);
    ~ThreadPool();

    /** @brief Queues @p func; its result or exception arrives through the future. */
    template <typename F>
    [[nodiscard]] auto submit(F &&func) -> std::future<std::invoke_result_t<F>>;

    /** @brief Queues @p func without a result. */
    void post(std::function<void()> func);

    /**
     * @brief Runs @p body(begin, end) over [0, count) in one contiguous
     *        range per worker and blocks until all ranges are done.
     *
     * Must not be called from a worker of this pool.
     */
    void parallelFor(core::usize count, const std::function<void(core::usize, core::usize)> &body);

    void shutdown();

    [[nodiscard]] const std::string &name() const noexcept { return _name; }
    [[nodiscard]] core::u32 threadCount() const noexcept;
    [[nodiscard]] core::usize pendingTasks() const;
    [[nodiscard]] core::u32 busyWorkers() const noexcept;

private:
    void workerLoop();

    std::string                       _name;
    std::vector<std::thread>          _workers;
    std::deque<std::function<void()>> _tasks;
    mutable std::mutex                _mutex;
    std::condition_variable           _cv;
    bool                              _stopping{false};
    std::atomic<core::u32>            _busy{0};
};

template <typename F>
auto ThreadPool::submit(F &&func) -> std::future<std::invoke_result_t<F>>
{
    using Result = std::invoke_result_t<F>;

    // std::function needs a copyable target; packaged_task is move-only.
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(func));
    auto future = task->get_future();
    post([task] { (*task)(); });
    return future;
}

} // namespace gpo::concurrency

#endif // GPO_CONCURRENCY_THREADPOOL_HPP
