/**
 * @file Grid.hpp
 * @brief Row-major cost map and node addressing.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_PATHFINDING_GRID_HPP
    #define GPO_PATHFINDING_GRID_HPP

#include <gpo/core/Constants.hpp>
#include <gpo/core/Expected.hpp>
#include <gpo/core/Types.hpp>

#include <span>
#include <vector>

namespace gpo::pathfinding {

/** @brief Cell coordinate; linear index is @c y*width+x. */
struct Node
{
    core::u32 x{0};
    core::u32 y{0};

    bool operator==(const Node &) const = default;
};

/**
 * @class Grid
 * @brief Immutable width x height cost map.
 *
 * A cell holding @ref core::kImpassableCost is a wall; every other value is
 * the cost paid when entering the cell.
 */
class Grid final
{
public:
    /**
     * @brief Validates the shape and takes ownership of @p values.
     * @return The grid, or InvalidArgument when a dimension is zero or the
     *         value count differs from @c width*height.
     */
    [[nodiscard]] static core::Expected<Grid> create(core::u32 width, core::u32 height,
                                                     std::vector<core::u32> values);

    [[nodiscard]] core::u32 width() const noexcept { return _width; }
    [[nodiscard]] core::u32 height() const noexcept { return _height; }
    [[nodiscard]] core::u32 cells() const noexcept { return _width * _height; }
    [[nodiscard]] std::span<const core::u32> values() const noexcept { return _values; }

    [[nodiscard]] bool contains(Node node) const noexcept { return node.x < _width && node.y < _height; }
    [[nodiscard]] core::u32 index(Node node) const noexcept { return node.y * _width + node.x; }
    [[nodiscard]] Node node(core::u32 index) const noexcept { return {index % _width, index / _width}; }

    [[nodiscard]] core::u32 at(Node node) const noexcept { return _values[index(node)]; }
    [[nodiscard]] bool passable(core::u32 index) const noexcept { return _values[index] != core::kImpassableCost; }

    /** @brief Largest cost that is not a wall (0 when every cell is a wall). */
    [[nodiscard]] core::u32 maxFiniteCost() const noexcept { return _maxFinite; }

    /** @brief Node holding the smallest value, lowest index on ties. */
    [[nodiscard]] Node minimumNode() const noexcept;

    /**
     * @brief Distance sentinel meaning "not reached": @c cells*maxFiniteCost+1.
     *
     * Fails with InvalidArgument when a relaxation candidate could overflow
     * 32 bits, i.e. when @c (cells+1)*maxFiniteCost+1 does not fit.
     */
    [[nodiscard]] core::Expected<core::u32> unreachedSentinel() const;

private:
    Grid(core::u32 width, core::u32 height, std::vector<core::u32> values) noexcept;

    core::u32              _width{0};
    core::u32              _height{0};
    core::u32              _maxFinite{0};
    std::vector<core::u32> _values;
};

} // namespace gpo::pathfinding

#endif // GPO_PATHFINDING_GRID_HPP
