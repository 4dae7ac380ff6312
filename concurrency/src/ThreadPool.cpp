/**
 * @file ThreadPool.cpp
 * @brief ThreadPool implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/concurrency/ThreadPool.hpp>
#include <gpo/core/Log.hpp>

#include <algorithm>
#include <exception>
#include <utility>

namespace gpo::concurrency {

ThreadPool::ThreadPool(std::string name, core::u32 threadCount)
    : _name{std::move(name)}
{
    const core::u32 count = std::max<core::u32>(
        1, threadCount != 0 ? threadCount : static_cast<core::u32>(std::thread::hardware_concurrency()));

    _workers.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
        _workers.emplace_back(&ThreadPool::workerLoop, this);
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::post(std::function<void()> func)
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        _tasks.push_back(std::move(func));
    }
    _cv.notify_one();
}

void ThreadPool::parallelFor(core::usize count, const std::function<void(core::usize, core::usize)> &body)
{
    if (count == 0)
        return;

    const core::usize ranges = std::min<core::usize>(count, _workers.size());
    const core::usize step   = (count + ranges - 1) / ranges;

    std::vector<std::future<void>> pending;
    pending.reserve(ranges);
    for (core::usize begin = 0; begin < count; begin += step)
    {
        const core::usize end = std::min(count, begin + step);
        pending.push_back(submit([&body, begin, end] { body(begin, end); }));
    }

    // Wait for every range before rethrowing so no task outlives @p body.
    for (auto &range : pending)
        range.wait();
    for (auto &range : pending)
        range.get();
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_stopping)
            return;
        _stopping = true;
    }
    _cv.notify_all();

    for (auto &worker : _workers)
    {
        if (worker.joinable())
            worker.join();
    }
}

core::u32 ThreadPool::threadCount() const noexcept
{
    return static_cast<core::u32>(_workers.size());
}

core::usize ThreadPool::pendingTasks() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _tasks.size();
}

core::u32 ThreadPool::busyWorkers() const noexcept
{
    return _busy.load(std::memory_order_relaxed);
}

void ThreadPool::workerLoop()
{
    for (;;)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock{_mutex};
            _cv.wait(lock, [this] { return _stopping || !_tasks.empty(); });
            if (_tasks.empty())
                return;

            task = std::move(_tasks.front());
            _tasks.pop_front();
        }

        _busy.fetch_add(1, std::memory_order_relaxed);
        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            core::Log::error(_name, std::string{"task failed: "} + e.what());
        }
        _busy.fetch_sub(1, std::memory_order_relaxed);
    }
}

} // namespace gpo::concurrency
