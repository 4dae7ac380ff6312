/**
 * @file RelaxationKernel.hpp
 * @brief OpenCL C source and entry points of the wavefront relaxation.
 *
 * Three kernels, one work-item per cell, all visiting neighbours in the
 * fixed order up, down, left, right:
 *   - @c relax_grid          (cost, dist, pred, changed, width, height, unreached)
 *   - @c count_hops          (cost, dist, hops, changed, width, height, unreached)
 *   - @c settle_predecessors (cost, dist, hops, pred, width, height, unreached, start)
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_PATHFINDING_RELAXATIONKERNEL_HPP
    #define GPO_PATHFINDING_RELAXATIONKERNEL_HPP

#include <string_view>

namespace gpo::pathfinding {

inline constexpr std::string_view kRelaxEntry   = "relax_grid";
inline constexpr std::string_view kHopsEntry    = "count_hops";
inline constexpr std::string_view kSettleEntry  = "settle_predecessors";

/** @brief Build options passed to the device compiler. */
inline constexpr std::string_view kKernelBuildOptions = "-cl-std=CL1.2";

/** @brief The program source shared by every device. */
[[nodiscard]] std::string_view relaxationKernelSource() noexcept;

} // namespace gpo::pathfinding

#endif // GPO_PATHFINDING_RELAXATIONKERNEL_HPP
