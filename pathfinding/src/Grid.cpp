/**
 * @file Grid.cpp
 * @brief Grid implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <gpo/pathfinding/Grid.hpp>

#include <limits>

namespace gpo::pathfinding {

Grid::Grid(core::u32 width, core::u32 height, std::vector<core::u32> values) noexcept
    : _width{width}
    , _height{height}
    , _values{std::move(values)}
{
    for (const core::u32 value : _values)
    {
        if (value != core::kImpassableCost && value > _maxFinite)
            _maxFinite = value;
    }
}

core::Expected<Grid> Grid::create(core::u32 width, core::u32 height, std::vector<core::u32> values)
{
    if (width == 0 || height == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "width and height must be positive");
    }

    const core::u64 cells = static_cast<core::u64>(width) * height;
    if (cells > std::numeric_limits<core::u32>::max())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "grid has too many cells");
    }
    if (values.size() != cells)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "data has " + std::to_string(values.size()) + " values, width*height is " +
                               std::to_string(cells));
    }
    return Grid{width, height, std::move(values)};
}

Node Grid::minimumNode() const noexcept
{
    core::u32 best = 0;
    for (core::u32 i = 1; i < _values.size(); ++i)
    {
        if (_values[i] < _values[best])
            best = i;
    }
    return node(best);
}

core::Expected<core::u32> Grid::unreachedSentinel() const
{
    const core::u64 cells   = static_cast<core::u64>(_width) * _height;
    const core::u64 bound   = (cells + 1) * _maxFinite + 1;
    if (bound > std::numeric_limits<core::u32>::max())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "path costs could overflow 32-bit distances (max cost " +
                               std::to_string(_maxFinite) + " over " + std::to_string(cells) + " cells)");
    }
    return static_cast<core::u32>(cells * _maxFinite + 1);
}

} // namespace gpo::pathfinding
