/**
 * @file Platform.hpp
 * @brief Target checks and branch hints.
 *
 * The HTTP listener and the signal handling in the server binary use
 * POSIX sockets and pthreads directly.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef GPO_CORE_PLATFORM_HPP
    #define GPO_CORE_PLATFORM_HPP

    #if defined(__linux__)
        #define GPO_OS_LINUX 1
    #elif defined(__APPLE__)
        #define GPO_OS_MACOS 1
    #else
        #error "gpo requires a POSIX target (Linux or macOS)"
    #endif

    #if defined(__GNUC__) || defined(__clang__)
        #define GPO_LIKELY(x)   __builtin_expect(!!(x), 1)
        #define GPO_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define GPO_LIKELY(x)   (x)
        #define GPO_UNLIKELY(x) (x)
    #endif

#endif // GPO_CORE_PLATFORM_HPP
