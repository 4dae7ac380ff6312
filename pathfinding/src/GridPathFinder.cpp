/**
 * @file GridPathFinder.cpp
 * @brief GridPathFinder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/pathfinding/GridPathFinder.hpp>
#include <gpo/pathfinding/RelaxationKernel.hpp>
#include <gpo/gpu/ComputeSession.hpp>
#include <gpo/core/Log.hpp>

#include <algorithm>
#include <array>
#include <vector>

namespace gpo::pathfinding {

namespace {

constexpr const char *kTag    = "PATH";
constexpr core::u32   kNoHops = 0xFFFFFFFFu;

/**
 * @brief Launches @p entry until the kernel leaves @p changed at zero.
 * @return Rounds run, or ConvergenceError after @p limit rounds.
 */
core::Expected<core::u32> iterateUntilStable(
    gpu::ComputeSession &session,
    const gpu::IProgram &program,
    std::string_view entry,
    gpu::DeviceBuffer &changed,
    std::initializer_list<gpu::KernelArg> args,
    core::u32 cells,
    core::u32 limit)
{
    std::array<core::u32, 1> flag{};
    for (core::u32 round = 1; round <= limit; ++round)
    {
        flag[0] = 0;
        GPO_TRY_VOID(session.enqueueWrite(changed, std::span<const core::u32>{flag}));
        GPO_TRY_VOID(session.enqueueKernel(program, entry, cells, args));
        GPO_TRY_VOID(session.enqueueRead(changed, std::span<core::u32>{flag}));
        if (flag[0] == 0)
            return round;
    }
    return core::makeError(core::ErrorCode::kConvergenceError,
                           std::string{entry} + " still changing after " + std::to_string(limit) + " rounds");
}

} // anonymous namespace

GridPathFinder::GridPathFinder(gpu::DeviceRegistry &registry, gpu::ProgramCache &cache, FinderOptions options)
    : _registry{registry}
    , _cache{cache}
    , _options{options}
{}

core::Expected<gpu::DeviceDescriptor> GridPathFinder::warmUp()
{
    auto device  = GPO_TRY(_registry.acquire());
    auto program = GPO_TRY(_cache.getProgram(*device, relaxationKernelSource(), kKernelBuildOptions));

    for (const auto entry : {kRelaxEntry, kHopsEntry, kSettleEntry})
    {
        if (!program->hasKernel(entry))
        {
            return core::makeError(core::ErrorCode::kBuildError,
                                   "program on " + device->descriptor().name + " lacks kernel " +
                                   std::string{entry});
        }
    }
    return device->descriptor();
}

core::Expected<PathResult> GridPathFinder::findPath(const Grid &grid)
{
    return findPath(grid, Node{0, 0}, grid.minimumNode());
}

core::Expected<PathResult> GridPathFinder::findPath(const Grid &grid, Node start, Node goal)
{
    if (!grid.contains(start) || !grid.contains(goal))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "start or goal outside the grid");
    }

    const core::u32 unreached = GPO_TRY(grid.unreachedSentinel());
    const core::u32 cells     = grid.cells();
    const core::u32 startIdx  = grid.index(start);
    const core::u32 goalIdx   = grid.index(goal);

    auto device = GPO_TRY(_registry.acquire());

    PathResult result;
    result.device = device->descriptor().name;

    if (!grid.passable(startIdx) || !grid.passable(goalIdx))
    {
        result.status = PathStatus::kNoPath;
        return result;
    }

    auto program = GPO_TRY(_cache.getProgram(*device, relaxationKernelSource(), kKernelBuildOptions));
    auto session = GPO_TRY(gpu::ComputeSession::open(device, gpu::SessionOptions{_options.requestTimeout}));

    std::vector<core::u32> dist(cells, unreached);
    std::vector<core::i32> pred(cells, core::kNoPredecessor);
    std::vector<core::u32> hops(cells, kNoHops);
    dist[startIdx] = 0;
    hops[startIdx] = 0;

    using gpu::BufferRole;
    gpu::DeviceBuffer *costBuf    = GPO_TRY(session.allocate(cells, sizeof(core::u32), BufferRole::kReadOnly));
    gpu::DeviceBuffer *distBuf    = GPO_TRY(session.allocate(cells, sizeof(core::u32), BufferRole::kReadWrite));
    gpu::DeviceBuffer *predBuf    = GPO_TRY(session.allocate(cells, sizeof(core::i32), BufferRole::kReadWrite));
    gpu::DeviceBuffer *hopsBuf    = GPO_TRY(session.allocate(cells, sizeof(core::u32), BufferRole::kReadWrite));
    gpu::DeviceBuffer *changedBuf = GPO_TRY(session.allocate(1, sizeof(core::u32), BufferRole::kReadWrite));

    GPO_TRY_VOID(session.enqueueWrite(*costBuf, grid.values()));
    GPO_TRY_VOID(session.enqueueWrite(*distBuf, std::span<const core::u32>{dist}));
    GPO_TRY_VOID(session.enqueueWrite(*predBuf, std::span<const core::i32>{pred}));
    GPO_TRY_VOID(session.enqueueWrite(*hopsBuf, std::span<const core::u32>{hops}));

    const auto width  = gpu::KernelArg::scalar(grid.width());
    const auto height = gpu::KernelArg::scalar(grid.height());
    const auto sentinel = gpu::KernelArg::scalar(unreached);

    result.iterations = GPO_TRY(iterateUntilStable(
        session, *program, kRelaxEntry, *changedBuf,
        {costBuf->arg(), distBuf->arg(), predBuf->arg(), changedBuf->arg(), width, height, sentinel},
        cells, cells));

    GPO_TRY_VOID(iterateUntilStable(
        session, *program, kHopsEntry, *changedBuf,
        {costBuf->arg(), distBuf->arg(), hopsBuf->arg(), changedBuf->arg(), width, height, sentinel},
        cells, cells));

    GPO_TRY_VOID(session.enqueueKernel(
        *program, kSettleEntry, cells,
        {costBuf->arg(), distBuf->arg(), hopsBuf->arg(), predBuf->arg(), width, height, sentinel,
         gpu::KernelArg::scalar(startIdx)}));

    GPO_TRY_VOID(session.enqueueRead(*distBuf, std::span<core::u32>{dist}));
    GPO_TRY_VOID(session.enqueueRead(*predBuf, std::span<core::i32>{pred}));

    if (core::Log::enabled(core::LogLevel::kDebug))
        core::Log::debug(kTag, "converged in " + std::to_string(result.iterations) + " rounds on " + result.device);

    if (dist[goalIdx] >= unreached)
    {
        result.status = PathStatus::kNoPath;
        return result;
    }

    result.nodes  = GPO_TRY(reconstruct(grid, dist, pred, start, goal));
    result.cost   = dist[goalIdx];
    result.status = PathStatus::kOk;
    return result;
}

core::Expected<std::vector<Node>> GridPathFinder::reconstruct(
    const Grid &grid,
    std::span<const core::u32> dist,
    std::span<const core::i32> pred,
    Node start,
    Node goal)
{
    const core::u32 cells    = grid.cells();
    const core::u32 startIdx = grid.index(start);
    core::u32       current  = grid.index(goal);

    if (dist.size() != cells || pred.size() != cells)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "result buffers do not match the grid");
    }

    std::vector<Node> path;
    core::u64         cost = 0;

    while (current != startIdx)
    {
        if (path.size() >= cells)
        {
            return core::makeError(core::ErrorCode::kPathReconstructionError,
                                   "predecessor chain longer than the grid");
        }
        path.push_back(grid.node(current));
        cost += grid.values()[current];

        const core::i32 previous = pred[current];
        if (previous < 0 || static_cast<core::u32>(previous) >= cells)
        {
            return core::makeError(core::ErrorCode::kPathReconstructionError,
                                   "broken predecessor link at cell " + std::to_string(current));
        }
        current = static_cast<core::u32>(previous);
    }
    path.push_back(start);
    std::reverse(path.begin(), path.end());

    const core::u32 expected = dist[grid.index(goal)];
    if (cost != expected)
    {
        return core::makeError(core::ErrorCode::kPathReconstructionError,
                               "path cost " + std::to_string(cost) + " differs from distance " +
                               std::to_string(expected));
    }
    return path;
}

} // namespace gpo::pathfinding
