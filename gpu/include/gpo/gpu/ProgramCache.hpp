/**
 * @file ProgramCache.hpp
 * @brief Per-device cache of compiled kernel programs.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef GPO_GPU_PROGRAMCACHE_HPP
    #define GPO_GPU_PROGRAMCACHE_HPP

#include <gpo/gpu/IComputeBackend.hpp>
#include <gpo/core/Constants.hpp>
#include <gpo/core/NonCopyable.hpp>

#include <chrono>
#include <memory>
#include <string_view>

namespace gpo::gpu {

/**
 * @class ProgramCache
 * @brief Compiles each (device, source, options) once and shares the result.
 *
 * Concurrent first requests for one key wait on the same build.  A failed
 * build is reported to every waiter and then forgotten, so the next request
 * compiles again.
 */
class ProgramCache final : public core::NonMovable<ProgramCache>
{
public:
    explicit ProgramCache(std::chrono::milliseconds buildTimeout =
                              std::chrono::milliseconds{core::kBuildTimeoutMs});
    ~ProgramCache();

    /**
     * @brief Returns the compiled program, building it on first use.
     * @return The program, or BuildError with the compiler log.
     */
    [[nodiscard]] core::Expected<std::shared_ptr<IProgram>> getProgram(
        IDevice &device, std::string_view source, std::string_view options = {});

    /** @brief Drops every program built for @p deviceIdentity. */
    void invalidate(std::string_view deviceIdentity);

    void clear();

    [[nodiscard]] bool contains(const DeviceDescriptor &device,
                                std::string_view source,
                                std::string_view options = {}) const;

    /** @brief Number of cached (successful or in-flight) entries. */
    [[nodiscard]] core::usize size() const;

    /** @brief Number of builds started since construction. */
    [[nodiscard]] core::usize buildCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace gpo::gpu

#endif // GPO_GPU_PROGRAMCACHE_HPP
