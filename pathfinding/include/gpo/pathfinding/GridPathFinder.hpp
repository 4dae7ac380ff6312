/**
 * @file GridPathFinder.hpp
 * @brief Minimum-cost grid path by device-parallel wavefront relaxation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_PATHFINDING_GRIDPATHFINDER_HPP
    #define GPO_PATHFINDING_GRIDPATHFINDER_HPP

#include <gpo/pathfinding/Grid.hpp>
#include <gpo/pathfinding/PathResult.hpp>
#include <gpo/gpu/DeviceRegistry.hpp>
#include <gpo/gpu/ProgramCache.hpp>
#include <gpo/core/NonCopyable.hpp>

#include <chrono>
#include <span>

namespace gpo::pathfinding {

struct FinderOptions
{
    /// Device wall-clock budget of one search.
    std::chrono::milliseconds requestTimeout{core::kRequestTimeoutMs};
};

/**
 * @class GridPathFinder
 * @brief Runs the relaxation kernels on the registry's device.
 *
 * Each call opens its own ComputeSession: concurrent calls share only the
 * device handle and the compiled program.
 *
 * Pipeline per call:
 *   1. upload cost, distances (start 0, others unreached), predecessors (-1)
 *   2. relax_grid until no distance changes (at most width*height rounds)
 *   3. count_hops until stable, then settle_predecessors once, which makes
 *      the predecessor of every reached cell the first neighbour (up, down,
 *      left, right) on a shortest path with one hop fewer
 *   4. read back and walk predecessors from goal to start
 */
class GridPathFinder final : public core::NonCopyable<GridPathFinder>
{
public:
    GridPathFinder(gpu::DeviceRegistry &registry, gpu::ProgramCache &cache, FinderOptions options = {});

    /**
     * @brief Searches from @p start to @p goal.
     * @return ok / no_path, or InvalidArgument, a device error,
     *         ConvergenceError, PathReconstructionError or Timeout.
     */
    [[nodiscard]] core::Expected<PathResult> findPath(const Grid &grid, Node start, Node goal);

    /** @brief Searches from (0,0) to @ref Grid::minimumNode. */
    [[nodiscard]] core::Expected<PathResult> findPath(const Grid &grid);

    /** @brief Acquires the device and compiles the program ahead of traffic. */
    [[nodiscard]] core::Expected<gpu::DeviceDescriptor> warmUp();

    /**
     * @brief Walks @p pred from @p goal back to @p start and checks the cost.
     *
     * Bounded by the cell count; fails with PathReconstructionError on a
     * broken or cyclic chain, or when the summed cost differs from
     * @c dist[goal].
     */
    [[nodiscard]] static core::Expected<std::vector<Node>> reconstruct(
        const Grid &grid,
        std::span<const core::u32> dist,
        std::span<const core::i32> pred,
        Node start,
        Node goal);

private:
    gpu::DeviceRegistry &_registry;
    gpu::ProgramCache   &_cache;
    FinderOptions        _options;
};

} // namespace gpo::pathfinding

#endif // GPO_PATHFINDING_GRIDPATHFINDER_HPP
