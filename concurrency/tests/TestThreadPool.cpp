/**
 * @file TestThreadPool.cpp
 * @brief Unit tests for concurrency::ThreadPool.
 */

#include <catch2/catch_test_macros.hpp>

#include "gpo/concurrency/ThreadPool.hpp"
#include "gpo/core/Log.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

namespace gpo::concurrency {

namespace {

class CountingLogger final : public core::ILogger
{
public:
    void write(core::LogLevel level, std::string_view tag, std::string_view) override
    {
        if (level == core::LogLevel::kError && tag == "POOL")
            errors.fetch_add(1);
    }

    std::atomic<int> errors{0};
};

} // anonymous namespace

TEST_CASE("ThreadPool submit returns the task result", "[concurrency][threadpool]")
{
    ThreadPool pool{"POOL", 2};
    REQUIRE(pool.threadCount() == 2);
    REQUIRE(pool.name() == "POOL");

    auto future = pool.submit([] { return 6 * 7; });
    REQUIRE(future.get() == 42);
}

TEST_CASE("ThreadPool submit carries exceptions through the future", "[concurrency][threadpool]")
{
    ThreadPool pool{"POOL", 1};
    auto future = pool.submit([]() -> int { throw std::runtime_error{"boom"}; });
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
}

TEST_CASE("ThreadPool with zero threads still runs work", "[concurrency][threadpool]")
{
    ThreadPool pool{"POOL", 0};
    REQUIRE(pool.threadCount() >= 1);
    REQUIRE(pool.submit([] { return true; }).get());
}

TEST_CASE("ThreadPool parallelFor covers every index exactly once", "[concurrency][threadpool]")
{
    ThreadPool pool{"POOL", 4};
    std::vector<std::atomic<int>> hits(1000);

    pool.parallelFor(hits.size(), [&hits](core::usize begin, core::usize end) {
        for (core::usize i = begin; i < end; ++i)
            hits[i].fetch_add(1);
    });

    for (const auto &hit : hits)
        REQUIRE(hit.load() == 1);
}

TEST_CASE("ThreadPool parallelFor with an empty range does nothing", "[concurrency][threadpool]")
{
    ThreadPool pool{"POOL", 2};
    bool called = false;
    pool.parallelFor(0, [&called](core::usize, core::usize) { called = true; });
    REQUIRE_FALSE(called);
}

TEST_CASE("ThreadPool logs a throwing posted task and keeps serving", "[concurrency][threadpool]")
{
    CountingLogger logger;
    core::Log::setLogger(&logger);
    {
        ThreadPool pool{"POOL", 1};
        pool.post([] { throw std::runtime_error{"lost connection"}; });
        REQUIRE(pool.submit([] { return 1; }).get() == 1);
        REQUIRE(pool.busyWorkers() <= 1);
    }
    core::Log::setLogger(nullptr);
    REQUIRE(logger.errors.load() == 1);
}

TEST_CASE("ThreadPool shutdown drains queued work and is idempotent", "[concurrency][threadpool]")
{
    std::atomic<int> done{0};
    ThreadPool pool{"POOL", 2};
    for (int i = 0; i < 32; ++i)
        pool.post([&done] { done.fetch_add(1); });

    pool.shutdown();
    pool.shutdown();
    REQUIRE(done.load() == 32);
    REQUIRE(pool.pendingTasks() == 0);
    REQUIRE(pool.busyWorkers() == 0);
}

} // namespace gpo::concurrency
