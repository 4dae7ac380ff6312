/**
 * @file TestGridPathFinder.cpp
 * @brief Tests for pathfinding::GridPathFinder on the software device.
 */

#include <catch2/catch_test_macros.hpp>

#include "gpo/pathfinding/GridPathFinder.hpp"
#include "gpo/pathfinding/NativeKernels.hpp"
#include "gpo/pathfinding/RelaxationKernel.hpp"
#include "gpo/gpu/OpenCLBackend.hpp"
#include "gpo/gpu/SoftwareBackend.hpp"

#include <array>
#include <atomic>
#include <functional>
#include <limits>
#include <optional>
#include <queue>
#include <random>
#include <thread>

namespace gpo::pathfinding {

namespace {

constexpr core::u32 kWall = core::kImpassableCost;

struct Engine
{
    gpu::DeviceRegistry registry;
    gpu::ProgramCache   cache;
    GridPathFinder      finder;

    /// @p customize runs after the stock kernels are registered and may replace them.
    explicit Engine(gpu::SoftwareBackend::Options options = {}, FinderOptions finderOptions = {},
                    const std::function<void(gpu::SoftwareBackend &)> &customize = {})
        : finder{registry, cache, finderOptions}
    {
        options.threads = options.threads != 0 ? options.threads : 4;
        auto backend = std::make_unique<gpu::SoftwareBackend>(options);
        registerNativeKernels(*backend);
        if (customize)
            customize(*backend);
        registry.addBackend(std::move(backend));
    }

    /// Queued commands of an abandoned session may hold buffers for a moment.
    core::usize settledAllocations()
    {
        for (int i = 0; i < 100 && liveAllocations() != 0; ++i)
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        return liveAllocations();
    }

    core::usize liveAllocations()
    {
        auto device = registry.acquire();
        REQUIRE(device.has_value());
        return (*device)->liveAllocations();
    }
};

Grid makeGrid(core::u32 width, core::u32 height, std::vector<core::u32> values)
{
    auto grid = Grid::create(width, height, std::move(values));
    REQUIRE(grid.has_value());
    return std::move(*grid);
}

/// Checks adjacency, passability, endpoints and the reported cost.
void requireValidPath(const Grid &grid, const PathResult &result, Node start, Node goal)
{
    REQUIRE(result.status == PathStatus::kOk);
    REQUIRE_FALSE(result.nodes.empty());
    REQUIRE(result.nodes.front() == start);
    REQUIRE(result.nodes.back() == goal);

    core::u64 cost = 0;
    for (core::usize i = 1; i < result.nodes.size(); ++i)
    {
        const Node a = result.nodes[i - 1];
        const Node b = result.nodes[i];
        const core::u32 dx = a.x > b.x ? a.x - b.x : b.x - a.x;
        const core::u32 dy = a.y > b.y ? a.y - b.y : b.y - a.y;
        REQUIRE(dx + dy == 1);
        REQUIRE(grid.passable(grid.index(b)));
        cost += grid.at(b);
    }
    REQUIRE(cost == result.cost);
}

/// Host Dijkstra with the same cost model (entering a cell pays its cost).
std::optional<core::u64> referenceCost(const Grid &grid, Node start, Node goal)
{
    using Item = std::pair<core::u64, core::u32>;
    std::vector<core::u64> dist(grid.cells(), std::numeric_limits<core::u64>::max());
    std::priority_queue<Item, std::vector<Item>, std::greater<>> open;
    dist[grid.index(start)] = 0;
    open.emplace(0, grid.index(start));

    while (!open.empty())
    {
        const auto [d, index] = open.top();
        open.pop();
        if (d != dist[index])
            continue;
        const Node n = grid.node(index);
        const std::array<std::pair<core::i64, core::i64>, 4> steps{{{0, -1}, {0, 1}, {-1, 0}, {1, 0}}};
        for (const auto &[sx, sy] : steps)
        {
            const core::i64 x = static_cast<core::i64>(n.x) + sx;
            const core::i64 y = static_cast<core::i64>(n.y) + sy;
            if (x < 0 || y < 0 || x >= static_cast<core::i64>(grid.width()) || y >= static_cast<core::i64>(grid.height()))
                continue;
            const core::u32 next = grid.index(Node{static_cast<core::u32>(x), static_cast<core::u32>(y)});
            if (!grid.passable(next))
                continue;
            if (d + grid.values()[next] < dist[next])
            {
                dist[next] = d + grid.values()[next];
                open.emplace(dist[next], next);
            }
        }
    }

    const core::u64 result = dist[grid.index(goal)];
    if (result == std::numeric_limits<core::u64>::max())
        return std::nullopt;
    return result;
}

void requireExampleSolved(GridPathFinder &finder)
{
    const Grid grid = makeGrid(4, 4, {8, 2, 3, 4, 5, 6, 7, 1, 9, 10, 11, 12, 13, 14, 15, 16});

    auto result = finder.findPath(grid);
    REQUIRE(result.has_value());
    requireValidPath(grid, *result, Node{0, 0}, Node{3, 1});
    REQUIRE(result->cost == 10);
    REQUIRE(result->nodes == std::vector<Node>{{0, 0}, {1, 0}, {2, 0}, {3, 0}, {3, 1}});
}

void requireRandomGridsMatchDijkstra(GridPathFinder &finder)
{
    std::mt19937 rng{1234};
    std::uniform_int_distribution<core::u32> cost{0, 9};
    std::uniform_int_distribution<int> wall{0, 5};

    for (int round = 0; round < 10; ++round)
    {
        std::vector<core::u32> values(12 * 9);
        for (auto &value : values)
            value = wall(rng) == 0 ? kWall : cost(rng);
        values.front() = 1;
        values.back()  = 1;
        const Grid grid = makeGrid(12, 9, std::move(values));

        const Node start{0, 0};
        const Node goal{11, 8};
        auto result = finder.findPath(grid, start, goal);
        REQUIRE(result.has_value());

        const auto expected = referenceCost(grid, start, goal);
        if (!expected)
        {
            REQUIRE(result->status == PathStatus::kNoPath);
            continue;
        }
        requireValidPath(grid, *result, start, goal);
        REQUIRE(result->cost == *expected);
    }
}

} // anonymous namespace

TEST_CASE("GridPathFinder reaches the minimum cell of the 4x4 example", "[pathfinding][finder]")
{
    Engine engine;
    requireExampleSolved(engine.finder);

    auto result = engine.finder.findPath(makeGrid(1, 1, {0}));
    REQUIRE(result.has_value());
    REQUIRE(result->device == "gpo-software");
}

TEST_CASE("GridPathFinder on a single cell returns that cell", "[pathfinding][finder]")
{
    Engine engine;
    const Grid grid = makeGrid(1, 1, {42});

    auto result = engine.finder.findPath(grid, Node{0, 0}, Node{0, 0});
    REQUIRE(result.has_value());
    REQUIRE(result->status == PathStatus::kOk);
    REQUIRE(result->nodes == std::vector<Node>{{0, 0}});
    REQUIRE(result->cost == 0);
}

TEST_CASE("GridPathFinder reports no_path when walls enclose the goal", "[pathfinding][finder]")
{
    Engine engine;

    SECTION("goal surrounded")
    {
        const Grid grid = makeGrid(3, 3, {1, 1, 1,
                                          1, 1, kWall,
                                          1, kWall, 1});
        auto result = engine.finder.findPath(grid, Node{0, 0}, Node{2, 2});
        REQUIRE(result.has_value());
        REQUIRE(result->status == PathStatus::kNoPath);
        REQUIRE(result->nodes.empty());
    }

    SECTION("goal is a wall")
    {
        const Grid grid = makeGrid(2, 1, {1, kWall});
        auto result = engine.finder.findPath(grid, Node{0, 0}, Node{1, 0});
        REQUIRE(result.has_value());
        REQUIRE(result->status == PathStatus::kNoPath);
    }

    SECTION("start is a wall")
    {
        const Grid grid = makeGrid(2, 1, {kWall, 1});
        auto result = engine.finder.findPath(grid, Node{0, 0}, Node{1, 0});
        REQUIRE(result.has_value());
        REQUIRE(result->status == PathStatus::kNoPath);
    }
}

TEST_CASE("GridPathFinder path length matches Manhattan distance on uniform grids", "[pathfinding][finder]")
{
    Engine engine;
    const Grid grid = makeGrid(6, 5, std::vector<core::u32>(30, 1));

    const Node start{1, 4};
    const Node goal{5, 0};
    auto result = engine.finder.findPath(grid, start, goal);
    REQUIRE(result.has_value());
    requireValidPath(grid, *result, start, goal);
    REQUIRE(result->nodes.size() - 1 == 8);
    REQUIRE(result->cost == 8);
}

TEST_CASE("GridPathFinder is deterministic across runs", "[pathfinding][finder]")
{
    Engine engine;
    const Grid grid = makeGrid(8, 8, std::vector<core::u32>(64, 3));

    auto first  = engine.finder.findPath(grid, Node{0, 0}, Node{7, 7});
    auto second = engine.finder.findPath(grid, Node{0, 0}, Node{7, 7});
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->cost == second->cost);
    REQUIRE(first->nodes == second->nodes);
    REQUIRE(engine.cache.buildCount() == 1);
}

TEST_CASE("GridPathFinder handles zero-cost cells without looping", "[pathfinding][finder]")
{
    Engine engine;
    const Grid grid = makeGrid(4, 4, std::vector<core::u32>(16, 0));

    auto result = engine.finder.findPath(grid, Node{0, 0}, Node{3, 3});
    REQUIRE(result.has_value());
    requireValidPath(grid, *result, Node{0, 0}, Node{3, 3});
    REQUIRE(result->cost == 0);
    REQUIRE(result->nodes.size() == 7);
}

TEST_CASE("GridPathFinder matches a host Dijkstra on random grids", "[pathfinding][finder]")
{
    Engine engine;
    requireRandomGridsMatchDijkstra(engine.finder);
}

TEST_CASE("GridPathFinder runs the OpenCL kernels on a real device", "[pathfinding][finder][opencl]")
{
    gpu::SelectionPolicy policy;
    policy.allowSoftware = false;
    gpu::DeviceRegistry registry{policy};
    registry.addBackend(std::make_unique<gpu::OpenCLBackend>());

    auto devices = registry.listDevices();
    if (!devices || devices->empty())
        SKIP("no OpenCL platform available");

    gpu::ProgramCache cache;
    GridPathFinder finder{registry, cache};

    auto device = finder.warmUp();
    REQUIRE(device.has_value());
    REQUIRE(device->backend == gpu::BackendKind::kOpenCL);

    requireExampleSolved(finder);
    requireRandomGridsMatchDijkstra(finder);
}

TEST_CASE("GridPathFinder rejects bad input before touching the device", "[pathfinding][finder]")
{
    Engine engine;

    SECTION("out of bounds")
    {
        const Grid grid = makeGrid(2, 2, {1, 1, 1, 1});
        auto result = engine.finder.findPath(grid, Node{0, 0}, Node{2, 0});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("distance overflow")
    {
        const Grid grid = makeGrid(2, 2, {1, 1, 1, 3'000'000'000u});
        auto result = engine.finder.findPath(grid, Node{0, 0}, Node{1, 1});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("GridPathFinder isolates a kernel launch failure", "[pathfinding][finder][faults]")
{
    gpu::SoftwareBackend::Options options;
    options.faults.failLaunchAt = 1;
    Engine engine{options};
    const Grid grid = makeGrid(4, 4, std::vector<core::u32>(16, 1));

    auto failed = engine.finder.findPath(grid, Node{0, 0}, Node{3, 3});
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code() == core::ErrorCode::kKernelLaunchError);

    REQUIRE(engine.settledAllocations() == 0);

    auto retried = engine.finder.findPath(grid, Node{0, 0}, Node{3, 3});
    REQUIRE(retried.has_value());
    REQUIRE(retried->cost == 6);
}

TEST_CASE("GridPathFinder gives up with ConvergenceError when relaxation never settles",
          "[pathfinding][finder][faults]")
{
    std::atomic<core::u32> launches{0};
    Engine engine{{}, {}, [&launches](gpu::SoftwareBackend &backend) {
        backend.registerKernel(std::string{kRelaxEntry},
                               [&launches](std::span<const gpu::KernelArg> args, core::usize begin, core::usize) {
                                   if (begin != 0)
                                       return;
                                   launches.fetch_add(1);
                                   std::atomic_ref<core::u32>{*static_cast<core::u32 *>(args[3].handle)}.store(1);
                               });
    }};
    const Grid grid = makeGrid(3, 3, std::vector<core::u32>(9, 1));

    auto result = engine.finder.findPath(grid, Node{0, 0}, Node{2, 2});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kConvergenceError);
    REQUIRE(launches.load() == grid.cells());
    REQUIRE(engine.settledAllocations() == 0);
}

TEST_CASE("GridPathFinder fails with Timeout when the device is too slow", "[pathfinding][finder][faults]")
{
    gpu::SoftwareBackend::Options options;
    options.faults.launchLatency = std::chrono::milliseconds{100};
    Engine engine{options, FinderOptions{std::chrono::milliseconds{30}}};
    const Grid grid = makeGrid(3, 3, std::vector<core::u32>(9, 1));

    auto result = engine.finder.findPath(grid, Node{0, 0}, Node{2, 2});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kTimeout);
}

TEST_CASE("GridPathFinder warmUp compiles every kernel", "[pathfinding][finder]")
{
    Engine engine;
    auto device = engine.finder.warmUp();
    REQUIRE(device.has_value());
    REQUIRE(device->type == gpu::DeviceType::kSoftware);
    REQUIRE(engine.cache.size() == 1);
}

TEST_CASE("reconstruct validates the predecessor chain", "[pathfinding][finder]")
{
    const Grid grid = makeGrid(3, 1, {5, 2, 4});
    const std::vector<core::u32> dist{0, 2, 6};

    SECTION("valid chain")
    {
        const std::vector<core::i32> pred{-1, 0, 1};
        auto path = GridPathFinder::reconstruct(grid, dist, pred, Node{0, 0}, Node{2, 0});
        REQUIRE(path.has_value());
        REQUIRE(*path == std::vector<Node>{{0, 0}, {1, 0}, {2, 0}});
    }

    SECTION("broken link")
    {
        const std::vector<core::i32> pred{-1, -1, 1};
        auto path = GridPathFinder::reconstruct(grid, dist, pred, Node{0, 0}, Node{2, 0});
        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().code() == core::ErrorCode::kPathReconstructionError);
    }

    SECTION("cycle")
    {
        const std::vector<core::i32> pred{-1, 2, 1};
        auto path = GridPathFinder::reconstruct(grid, dist, pred, Node{0, 0}, Node{2, 0});
        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().code() == core::ErrorCode::kPathReconstructionError);
    }

    SECTION("cost mismatch")
    {
        const std::vector<core::u32> wrong{0, 2, 7};
        const std::vector<core::i32> pred{-1, 0, 1};
        auto path = GridPathFinder::reconstruct(grid, wrong, pred, Node{0, 0}, Node{2, 0});
        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().code() == core::ErrorCode::kPathReconstructionError);
    }
}

} // namespace gpo::pathfinding
