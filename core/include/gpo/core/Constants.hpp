/**
 * @file Constants.hpp
 * @brief Service-wide compile-time defaults.
 *
 * Every default that Config can override is centralised here so that a
 * single header controls the service's fundamental operating parameters.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef GPO_CORE_CONSTANTS_HPP
    #define GPO_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <limits>

namespace gpo::core {

inline constexpr u16   kDefaultPort             = 8080;
inline constexpr u32   kDefaultWorkers          = 8;
inline constexpr u32   kListenBacklog           = 128;
inline constexpr usize kMaxHeaderBytes          = 16 * 1024;
inline constexpr usize kMaxBodyBytes            = 16 * 1024 * 1024;
inline constexpr u32   kSocketTimeoutMs         = 5'000;

inline constexpr u32   kMaxGridSide             = 128;
inline constexpr u32   kMaxCells                = kMaxGridSide * kMaxGridSide;

inline constexpr u32   kRequestTimeoutMs        = 10'000;
inline constexpr u32   kBuildTimeoutMs          = 30'000;
inline constexpr u32   kWaitPollMicros          = 50;

/** @brief Cell value marking an impassable cell (a wall). */
inline constexpr u32   kImpassableCost          = std::numeric_limits<u32>::max();

/** @brief Predecessor value meaning "no predecessor". */
inline constexpr i32   kNoPredecessor           = -1;

} // namespace gpo::core

#endif // GPO_CORE_CONSTANTS_HPP
