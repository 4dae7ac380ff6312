/**
 * @file Types.hpp
 * @brief Fixed-width aliases shared by every module.
 *
 * Costs, distances and cell indices are 32-bit unsigned on both the host
 * and the device side; wider intermediates use u64.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef GPO_CORE_TYPES_HPP
    #define GPO_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace gpo::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using usize = std::size_t;
using byte  = std::byte;

static_assert(sizeof(u32) == 4, "device kernels address cl_uint buffers");

} // namespace gpo::core

#endif // GPO_CORE_TYPES_HPP
