/**
 * @file NonCopyable.hpp
 * @brief CRTP bases for resource owners that must not be duplicated.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef GPO_CORE_NON_COPYABLE_HPP
    #define GPO_CORE_NON_COPYABLE_HPP

namespace gpo::core {

/**
 * @brief Deletes copies, keeps moves.
 *
 * For handles (sockets, device buffers, sessions) that travel through
 * Expected<T> by value.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&)            = default;
    NonCopyable &operator=(NonCopyable &&) = default;
};

/**
 * @brief Deletes copies and moves.
 *
 * For objects whose address is captured by worker threads or handed out
 * as a reference for the process lifetime (pools, registries, caches).
 */
template <typename Derived>
class NonMovable {
protected:
    NonMovable()  = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable &)            = delete;
    NonMovable &operator=(const NonMovable &) = delete;
    NonMovable(NonMovable &&)                 = delete;
    NonMovable &operator=(NonMovable &&)      = delete;
};

} // namespace gpo::core

#endif // GPO_CORE_NON_COPYABLE_HPP
