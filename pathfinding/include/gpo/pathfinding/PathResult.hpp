/**
 * @file PathResult.hpp
 * @brief Outcome of one shortest-path computation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_PATHFINDING_PATHRESULT_HPP
    #define GPO_PATHFINDING_PATHRESULT_HPP

#include <gpo/pathfinding/Grid.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace gpo::pathfinding {

enum class PathStatus : core::u8 {
    kOk,
    kNoPath
};

/** @brief Wire name of @p status ("ok" / "no_path"). */
[[nodiscard]] constexpr std::string_view toString(PathStatus status) noexcept
{
    return status == PathStatus::kOk ? "ok" : "no_path";
}

struct PathResult
{
    PathStatus        status{PathStatus::kNoPath};
    /// Start to goal inclusive; empty for kNoPath.
    std::vector<Node> nodes;
    /// Sum of the entered cells' costs (start excluded).
    core::u32         cost{0};
    /// Relaxation iterations until convergence.
    core::u32         iterations{0};
    /// Name of the device that ran the search.
    std::string       device;
};

} // namespace gpo::pathfinding

#endif // GPO_PATHFINDING_PATHRESULT_HPP
