/**
 * @file Expected.hpp
 * @brief Expected<T> and the GPO_TRY propagation macros.
 *
 * Every fallible operation from device enumeration up to request decoding
 * returns Expected<T>; no exception crosses a module boundary.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef GPO_CORE_EXPECTED_HPP
    #define GPO_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace gpo::core {

template <typename T>
using Expected = std::expected<T, Error>;

} // namespace gpo::core

/**
 * @brief Yields the value of @p expr or returns its Error from the caller.
 *
 * The caller must itself return an Expected. GNU statement expression.
 */
#define GPO_TRY(expr)                                               \
    ({                                                              \
        auto &&_gpoTried = (expr);                                  \
        if (!_gpoTried.has_value()) [[unlikely]]                    \
            return std::unexpected(std::move(_gpoTried.error()));   \
        std::move(_gpoTried.value());                               \
    })

/** @brief GPO_TRY for Expected<void>. */
#define GPO_TRY_VOID(expr)                                          \
    do {                                                            \
        auto &&_gpoTried = (expr);                                  \
        if (!_gpoTried.has_value()) [[unlikely]]                    \
            return std::unexpected(std::move(_gpoTried.error()));   \
    } while (false)

#endif // GPO_CORE_EXPECTED_HPP
