/**
 * @file NativeKernels.hpp
 * @brief Host implementations of the relaxation kernels for the software device.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_PATHFINDING_NATIVEKERNELS_HPP
    #define GPO_PATHFINDING_NATIVEKERNELS_HPP

#include <gpo/gpu/SoftwareBackend.hpp>

namespace gpo::pathfinding {

/**
 * @brief Registers @c relax_grid, @c count_hops and @c settle_predecessors
 *        on @p backend with the same argument layout and semantics as the
 *        OpenCL C source.
 */
void registerNativeKernels(gpu::SoftwareBackend &backend);

} // namespace gpo::pathfinding

#endif // GPO_PATHFINDING_NATIVEKERNELS_HPP
