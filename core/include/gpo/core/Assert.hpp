/**
 * @file Assert.hpp
 * @brief Internal invariant checks, compiled out with NDEBUG.
 *
 * Only for conditions the caller already guarantees (argument counts of
 * native kernels, live queue handles). Anything a request can trigger
 * goes through Expected<T>.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef GPO_CORE_ASSERT_HPP
    #define GPO_CORE_ASSERT_HPP

    #include "Platform.hpp"
    #include "Log.hpp"

    #include <cstdlib>
    #include <source_location>
    #include <string>

namespace gpo::core::detail {

[[noreturn]] inline void assertFail(const char *expr,
                                    std::source_location loc = std::source_location::current())
{
    Log::fatal("ASSERT", std::string{loc.file_name()} + ":" + std::to_string(loc.line()) + " in " +
                             loc.function_name() + ": '" + expr + "' failed");
    std::abort();
}

} // namespace gpo::core::detail

    #ifndef NDEBUG
        #define GPO_ASSERT(cond)                                \
            do {                                                \
                if (GPO_UNLIKELY(!(cond)))                      \
                    ::gpo::core::detail::assertFail(#cond);     \
            } while (false)
    #else
        #define GPO_ASSERT(cond) ((void)0)
    #endif

#endif // GPO_CORE_ASSERT_HPP
